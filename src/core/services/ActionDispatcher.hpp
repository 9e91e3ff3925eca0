#pragma once

#include "core/image/ImageDecoderChain.hpp"
#include "core/services/ActionRegistry.hpp"
#include "core/services/IActionSink.hpp"
#include "core/services/IClipboard.hpp"
#include <QMutex>
#include <QObject>
#include <QThread>
#include <QWaitCondition>
#include <queue>

namespace fastsync {

/// Performs the local effect of an activated notification action on its
/// own worker thread. submit() only queues.
class ActionDispatcher : public QObject, public IActionSink {
    Q_OBJECT
public:
    ActionDispatcher(IClipboard* clipboard,
                     ISaveLocationProvider* saveLocation,
                     ImageDecoderChain decoders,
                     const QString& defaultSaveFileName,
                     QObject* parent = nullptr);
    ~ActionDispatcher() override;

    void start();
    void stop();

    void submit(const ActionRequest& request) override;

    /// Run one request on the calling thread.
    ActionResult dispatch(const ActionRequest& request);

    const ActionRegistry& registry() const { return registry_; }

signals:
    void actionFinished(const fastsync::ActionRequest& request,
                        const fastsync::ActionResult& result);

private:
    class DispatchWorker : public QThread {
    public:
        explicit DispatchWorker(ActionDispatcher* dispatcher) : dispatcher_(dispatcher) {}
        void run() override;
        void enqueue(const ActionRequest& request);
        void requestStop();
    private:
        ActionDispatcher* dispatcher_;
        QMutex mutex_;
        QWaitCondition condition_;
        std::queue<ActionRequest> queue_;
        bool stopRequested_ = false;
    };

    IClipboard* clipboard_;
    ISaveLocationProvider* saveLocation_;
    ImageDecoderChain decoders_;
    QString defaultSaveFileName_;
    ActionRegistry registry_;
    DispatchWorker* worker_ = nullptr;

    void registerDefaultActions();
    ActionResult savePhoto(const fsp::Payload& payload);
    ActionResult copyPhoto(const fsp::Payload& payload);
    ActionResult copyText(const QString& text);
};

} // namespace fastsync
