#pragma once

#include <QApplication>

namespace fastsync {

/// QApplication that turns an exception escaping an event handler into a
/// reported, fatal exit instead of undefined behaviour.
class ReceiverApplication : public QApplication {
    Q_OBJECT
public:
    ReceiverApplication(int& argc, char** argv);

    bool notify(QObject* receiver, QEvent* event) override;

    /// Blocking error dialog, then terminate. Safe to call from any thread.
    [[noreturn]] static void reportFatal(const QString& message);

    /// std::set_terminate hook for faults outside the Qt event loop.
    static void installFatalErrorHandler();
};

} // namespace fastsync
