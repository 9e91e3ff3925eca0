#pragma once

#include <fsp/Payload/Payload.hpp>
#include <QMetaType>
#include <QString>
#include <memory>

namespace fastsync {

struct ActionRequest {
    QString actionId;
    QString tag;
    std::shared_ptr<const fsp::Payload> payload;
};

struct ActionResult {
    enum class Kind {
        Saved,      // detail = written path
        Copied,     // detail = "image" or "text"
        Ignored,
        Failed      // detail = reason
    };

    Kind kind = Kind::Ignored;
    QString detail;

    static ActionResult saved(const QString& path) { return {Kind::Saved, path}; }
    static ActionResult copied(const QString& what) { return {Kind::Copied, what}; }
    static ActionResult ignored() { return {Kind::Ignored, {}}; }
    static ActionResult failed(const QString& reason) { return {Kind::Failed, reason}; }

    bool isFailure() const { return kind == Kind::Failed; }
    QString toString() const;
};

/// Receives activated actions from the UI thread. submit() must not block.
class IActionSink {
public:
    virtual ~IActionSink() = default;
    virtual void submit(const ActionRequest& request) = 0;
};

inline QString ActionResult::toString() const
{
    switch (kind) {
    case Kind::Saved: return QStringLiteral("Saved(%1)").arg(detail);
    case Kind::Copied: return QStringLiteral("Copied(%1)").arg(detail);
    case Kind::Ignored: return QStringLiteral("Ignored");
    case Kind::Failed: return QStringLiteral("Failed(%1)").arg(detail);
    }
    return {};
}

} // namespace fastsync

Q_DECLARE_METATYPE(fastsync::ActionRequest)
Q_DECLARE_METATYPE(fastsync::ActionResult)
