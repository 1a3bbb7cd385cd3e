#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(wsbeaconAppLog)

namespace wsbeacon::app {

// Installs a Qt message handler that stamps UTC time, level and category on
// every line and writes it to stderr, plus `log_file` when one is given.
// Returns false if the log file could not be opened; stderr logging still works.
bool install_logging(const QString& log_file = QString{});

// Turns on the wsbeacon.*.debug categories.
void enable_debug_logging();

} // namespace wsbeacon::app
