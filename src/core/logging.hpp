#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(konnectDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(konnectTransportLog)
Q_DECLARE_LOGGING_CATEGORY(konnectPairingLog)
Q_DECLARE_LOGGING_CATEGORY(konnectTrustLog)
Q_DECLARE_LOGGING_CATEGORY(konnectPayloadLog)
Q_DECLARE_LOGGING_CATEGORY(konnectDaemonLog)

namespace konnect {

// Installs a Qt message handler that appends to a log file as well as
// stderr. An empty path selects default_log_file_path().
// Rotates to <path>.1 past 4 MiB.
void install_file_logging(const QString& path = {});

// Restores Qt's default handler and closes the file.
void uninstall_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on debug output for every konnect.* category. Called when
// KONNECT_DEBUG is set.
void enable_debug_logging();

} // namespace konnect
