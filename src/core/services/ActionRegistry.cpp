#include "ActionRegistry.hpp"
#include <boost/log/trivial.hpp>

namespace fastsync {

void ActionRegistry::registerAction(const QString& actionId, Handler handler)
{
    handlers_[actionId] = std::move(handler);
}

void ActionRegistry::unregisterAction(const QString& actionId)
{
    handlers_.remove(actionId);
}

ActionResult ActionRegistry::dispatch(const QString& actionId, const fsp::Payload& payload) const
{
    auto it = handlers_.constFind(actionId);
    if (it == handlers_.constEnd()) {
        BOOST_LOG_TRIVIAL(debug) << "[ActionRegistry] unknown action '"
                                 << actionId.toStdString() << "'";
        return ActionResult::ignored();
    }
    return it.value()(payload);
}

QStringList ActionRegistry::registeredActions() const
{
    return handlers_.keys();
}

} // namespace fastsync
