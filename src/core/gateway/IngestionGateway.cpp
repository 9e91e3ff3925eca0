#include "core/gateway/IngestionGateway.hpp"
#include <fsp/Payload/PayloadDecoder.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <optional>

namespace fastsync {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {

std::optional<fsp::ContentClass> routeFor(const std::string& target)
{
    // Ignore any query string
    const std::string path = target.substr(0, target.find('?'));
    if (path == fsp::ROUTE_UPLOAD) return fsp::ContentClass::Photo;
    if (path == fsp::ROUTE_SMS) return fsp::ContentClass::Sms;
    if (path == fsp::ROUTE_CLIPBOARD) return fsp::ContentClass::ClipboardText;
    return std::nullopt;
}

std::string toStd(beast::string_view sv)
{
    return std::string(sv.data(), sv.size());
}

} // namespace

// --- Session ---

class IngestionGateway::Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket socket, IngestionGateway& gateway)
        : stream_(std::move(socket))
        , gateway_(gateway)
    {
    }

    void start() { readRequest(); }

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    IngestionGateway& gateway_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    std::array<char, 16 * 1024> drainBuffer_;

    static constexpr int DRAIN_TIMEOUT_MS = 2000;

    void readRequest()
    {
        parser_.emplace();
        parser_->body_limit(gateway_.maxBodyBytes());
        stream_.expires_after(gateway_.readTimeout());

        http::async_read(stream_, buffer_, *parser_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec)
    {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec == http::error::body_limit_exceeded) {
            // Declared or streamed size is over the cap; nothing was decoded
            gateway_.noteOversized();
            BOOST_LOG_TRIVIAL(warning) << "[Gateway] Rejecting oversized body";
            respond(413, "request body too large", false, true);
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != asio::error::operation_aborted)
                BOOST_LOG_TRIVIAL(debug) << "[Gateway] Read failed: " << ec.message();
            close();
            return;
        }

        const auto& req = parser_->get();
        const std::string contentType = toStd(req[http::field::content_type]);
        Reply reply;
        try {
            reply = gateway_.handle(toStd(req.method_string()), toStd(req.target()),
                                    contentType, req.body());
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "[Gateway] Handler threw: " << e.what();
            reply = {500, "internal error"};
        }
        respond(reply.status, reply.body, req.keep_alive());
    }

    // drainFirst: the client may still be sending the rejected body. Closing
    // with unread data resets the connection and can discard the response.
    void respond(unsigned status, const std::string& body, bool keepAlive,
                 bool drainFirst = false)
    {
        response_ = {};
        response_.version(11);
        response_.result(static_cast<http::status>(status));
        response_.set(http::field::server, "fastsync");
        if (!body.empty())
            response_.set(http::field::content_type, "text/plain; charset=utf-8");
        response_.body() = body;
        response_.keep_alive(keepAlive);
        response_.prepare_payload();

        http::async_write(stream_, response_,
            [self = shared_from_this(), keepAlive, drainFirst](beast::error_code ec, std::size_t) {
                if (ec) {
                    BOOST_LOG_TRIVIAL(debug) << "[Gateway] Write failed: " << ec.message();
                    self->close();
                    return;
                }
                if (keepAlive)
                    self->readRequest();
                else if (drainFirst)
                    self->drainAndClose();
                else
                    self->close();
            });
    }

    void drainAndClose()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream_.expires_after(std::chrono::milliseconds(DRAIN_TIMEOUT_MS));
        drain();
    }

    // Discard input until the peer closes or the deadline passes
    void drain()
    {
        stream_.async_read_some(asio::buffer(drainBuffer_),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    self->close();
                    return;
                }
                self->drain();
            });
    }

    void close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }
};

// --- IngestionGateway ---

IngestionGateway::IngestionGateway(const Options& options, PayloadHandler handler)
    : options_(options)
    , handler_(std::move(handler))
{
}

IngestionGateway::~IngestionGateway()
{
    stop();
}

bool IngestionGateway::start(QString* error)
{
    if (running_) return true;

    try {
        const auto address = asio::ip::make_address(options_.bindAddress.toStdString());
        acceptor_ = std::make_unique<tcp::acceptor>(ioContext_);
        tcp::endpoint endpoint(address, options_.port);
        acceptor_->open(endpoint.protocol());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(asio::socket_base::max_listen_connections);
        localPort_ = acceptor_->local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        BOOST_LOG_TRIVIAL(error) << "[Gateway] Cannot listen on "
                                 << options_.bindAddress.toStdString() << ":" << options_.port
                                 << ": " << e.what();
        if (error) *error = QString::fromStdString(e.what());
        acceptor_.reset();
        return false;
    }

    ioContext_.restart();
    work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        ioContext_.get_executor());
    running_ = true;
    doAccept();

    const int threadCount = std::max(1, options_.threadCount);
    for (int i = 0; i < threadCount; ++i) {
        threads_.emplace_back([this, i]() {
            BOOST_LOG_TRIVIAL(debug) << "[Gateway] ASIO thread " << i << " started";
            ioContext_.run();
            BOOST_LOG_TRIVIAL(debug) << "[Gateway] ASIO thread " << i << " stopped";
        });
    }

    BOOST_LOG_TRIVIAL(info) << "[Gateway] Listening on " << options_.bindAddress.toStdString()
                            << ":" << localPort_ << " (" << threadCount << " threads)";
    return true;
}

void IngestionGateway::stop()
{
    if (!running_) return;
    running_ = false;

    if (acceptor_) {
        boost::system::error_code ec;
        acceptor_->close(ec);
    }
    work_.reset();
    ioContext_.stop();

    for (auto& t : threads_) {
        if (t.joinable())
            t.join();
    }
    threads_.clear();
    acceptor_.reset();

    BOOST_LOG_TRIVIAL(info) << "[Gateway] Stopped";
}

void IngestionGateway::doAccept()
{
    acceptor_->async_accept(asio::make_strand(ioContext_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted)
                    BOOST_LOG_TRIVIAL(warning) << "[Gateway] Accept failed: " << ec.message();
            } else {
                std::make_shared<Session>(std::move(socket), *this)->start();
            }
            if (running_ && acceptor_ && acceptor_->is_open())
                doAccept();
        });
}

void IngestionGateway::noteOversized()
{
    ++rejected_;
}

IngestionGateway::Reply IngestionGateway::handle(const std::string& method,
                                                 const std::string& target,
                                                 const std::string& contentType,
                                                 const std::string& body)
{
    const auto contentClass = routeFor(target);
    if (!contentClass) {
        ++rejected_;
        return {404, "not found"};
    }
    if (method != "POST") {
        ++rejected_;
        return {405, "method not allowed"};
    }
    if (body.size() > options_.maxBodyBytes) {
        ++rejected_;
        return {413, "request body too large"};
    }

    ++decodeAttempts_;
    QString error;
    auto payload = fsp::PayloadDecoder::decode(*contentClass,
                                               QByteArray::fromStdString(contentType),
                                               QByteArray::fromStdString(body),
                                               &error);
    if (!payload) {
        ++rejected_;
        BOOST_LOG_TRIVIAL(warning) << "[Gateway] " << target << " rejected: " << error.toStdString();
        return {400, error.toStdString()};
    }

    ++accepted_;
    BOOST_LOG_TRIVIAL(info) << "[Gateway] " << target << " accepted ("
                            << fsp::contentClassName(*contentClass) << ", "
                            << body.size() << " bytes)";

    if (handler_) {
        // Runs after the reply is queued; failures here never reach the client
        asio::post(ioContext_, [handler = handler_, p = std::move(*payload)]() {
            try {
                handler(p);
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "[Gateway] Notification task failed: " << e.what();
            }
        });
    }
    return {200, {}};
}

} // namespace fastsync
