#pragma once

#include <fsp/Payload/Payload.hpp>
#include <fsp/Protocol.hpp>
#include <QString>
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fastsync {

/// HTTP front door for the companion app. Each POST is decoded on an Asio
/// worker, answered immediately, and the payload is handed to the handler
/// as a separate posted task so notification work never delays the reply.
class IngestionGateway {
public:
    struct Options {
        QString bindAddress = QStringLiteral("0.0.0.0");
        uint16_t port = fsp::DEFAULT_PORT;     // 0 picks an ephemeral port
        std::size_t maxBodyBytes = fsp::MAX_BODY_BYTES;
        int threadCount = 4;
        int readTimeoutMs = 30000;
    };

    using PayloadHandler = std::function<void(const fsp::Payload& payload)>;

    struct Reply {
        unsigned status = 200;
        std::string body;
    };

    IngestionGateway(const Options& options, PayloadHandler handler);
    ~IngestionGateway();

    IngestionGateway(const IngestionGateway&) = delete;
    IngestionGateway& operator=(const IngestionGateway&) = delete;

    bool start(QString* error = nullptr);
    void stop();
    bool isRunning() const { return running_; }

    uint16_t localPort() const { return localPort_; }

    uint64_t decodeAttempts() const { return decodeAttempts_; }
    uint64_t acceptedCount() const { return accepted_; }
    uint64_t rejectedCount() const { return rejected_; }

    /// Route and decode a fully read request. Schedules the handler on success.
    Reply handle(const std::string& method, const std::string& target,
                 const std::string& contentType, const std::string& body);

    /// Count a request refused before its body was read (413).
    void noteOversized();

    std::chrono::milliseconds readTimeout() const { return std::chrono::milliseconds(options_.readTimeoutMs); }
    std::size_t maxBodyBytes() const { return options_.maxBodyBytes; }

private:
    class Session;

    Options options_;
    PayloadHandler handler_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t localPort_ = 0;

    std::atomic<uint64_t> decodeAttempts_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};

    void doAccept();
};

} // namespace fastsync
