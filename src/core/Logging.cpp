#include "core/Logging.hpp"
#include <QLoggingCategory>
#include <QtGlobal>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace fastsync {

QString initLogging(const QString& level)
{
    namespace logging = boost::log;

    const QString normalized = level.trimmed().toLower();
    logging::trivial::severity_level severity = logging::trivial::info;
    QString rules;
    QString applied = QStringLiteral("info");

    if (normalized == "trace" || normalized == "debug") {
        severity = normalized == "trace" ? logging::trivial::trace : logging::trivial::debug;
        rules = QStringLiteral("*.debug=true\nqt.*.debug=false");
        applied = normalized;
    } else if (normalized == "warning") {
        severity = logging::trivial::warning;
        rules = QStringLiteral("*.debug=false\n*.info=false");
        applied = normalized;
    } else if (normalized == "error") {
        severity = logging::trivial::error;
        rules = QStringLiteral("*.debug=false\n*.info=false\n*.warning=false");
        applied = normalized;
    } else {
        rules = QStringLiteral("*.debug=false");
    }

    logging::core::get()->set_filter(logging::trivial::severity >= severity);
    QLoggingCategory::setFilterRules(rules);
    qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{message}"));

    return applied;
}

} // namespace fastsync
