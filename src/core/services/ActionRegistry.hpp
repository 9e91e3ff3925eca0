#pragma once

#include "core/services/IActionSink.hpp"
#include <QHash>
#include <QString>
#include <QStringList>
#include <functional>

namespace fastsync {

/// Maps notification action ids to the handler that performs them.
/// Handlers run on the dispatcher worker and must not touch widgets directly.
class ActionRegistry {
public:
    using Handler = std::function<ActionResult(const fsp::Payload& payload)>;

    void registerAction(const QString& actionId, Handler handler);
    void unregisterAction(const QString& actionId);

    /// Unknown ids resolve to Ignored.
    ActionResult dispatch(const QString& actionId, const fsp::Payload& payload) const;
    bool contains(const QString& actionId) const { return handlers_.contains(actionId); }
    QStringList registeredActions() const;

private:
    QHash<QString, Handler> handlers_;
};

} // namespace fastsync
