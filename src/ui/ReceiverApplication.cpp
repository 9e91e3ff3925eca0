#include "ui/ReceiverApplication.hpp"
#include <QDebug>
#include <QMessageBox>
#include <QThread>
#include <cstdlib>
#include <exception>

namespace fastsync {

ReceiverApplication::ReceiverApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
}

bool ReceiverApplication::notify(QObject* receiver, QEvent* event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::exception& e) {
        reportFatal(QString::fromUtf8(e.what()));
    }
}

void ReceiverApplication::reportFatal(const QString& message)
{
    qCritical() << "[Fatal]" << message;

    auto* app = QCoreApplication::instance();
    if (app && QThread::currentThread() == app->thread()) {
        QMessageBox::critical(nullptr, QStringLiteral("FastSync Error"),
                              QStringLiteral("FastSync stopped unexpectedly:\n%1").arg(message));
    } else if (app) {
        QMetaObject::invokeMethod(app, [message]() {
            QMessageBox::critical(nullptr, QStringLiteral("FastSync Error"),
                                  QStringLiteral("FastSync stopped unexpectedly:\n%1").arg(message));
        }, Qt::BlockingQueuedConnection);
    }
    std::_Exit(EXIT_FAILURE);
}

void ReceiverApplication::installFatalErrorHandler()
{
    std::set_terminate([]() {
        QString message = QStringLiteral("unknown error");
        if (auto current = std::current_exception()) {
            try {
                std::rethrow_exception(current);
            } catch (const std::exception& e) {
                message = QString::fromUtf8(e.what());
            } catch (...) {
                message = QStringLiteral("non-standard exception");
            }
        }
        reportFatal(message);
    });
}

} // namespace fastsync
