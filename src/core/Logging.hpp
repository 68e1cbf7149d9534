#pragma once

#include <QString>

namespace rsb {

enum class LogLevel {
    Debug,
    Info,
    Warning
};

/// "debug" / "info" / "warning" (case-insensitive). Returns false and leaves
/// level untouched on anything else.
bool parseLogLevel(const QString& text, LogLevel* level);

/// Routes all Qt logging through Boost.Log on stderr and applies the level
/// both to the Boost.Log core and to the rsb.* categories.
void initLogging(LogLevel level);

} // namespace rsb
