#pragma once

#include <QString>

// Process-wide Qt message sink: timestamped lines to a log file, echoed to
// stderr. Debug output is dropped unless verbose.
namespace Logging {

// Default: <temp>/aurum-debug.log
QString defaultLogPath();

// Returns false if the file cannot be opened; stderr output still works.
bool install(const QString& path = defaultLogPath(), bool verbose = false);

void setVerbose(bool verbose);

} // namespace Logging
