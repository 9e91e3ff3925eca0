#pragma once

#include <QString>

namespace fastsync {

/// Apply logging.level to both Boost.Log and the Qt message handler.
/// Unknown levels fall back to info. Returns the level actually applied.
QString initLogging(const QString& level);

} // namespace fastsync
