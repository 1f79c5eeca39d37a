#pragma once
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <chrono>
#include <string>

namespace usb_power {

enum class LaunchStatus {
    Completed,      // helper ran and exited; look for its report
    Declined,       // operator refused the consent prompt
    SpawnFailed,
    TimedOut        // helper killed after the deadline
};

struct LaunchResult {
    LaunchStatus status{LaunchStatus::SpawnFailed};
    int exitCode{-1};
    std::string detail;
};

// Starts the elevated helper on a request file and blocks until it exits or
// the timeout elapses. The exit code is informational only.
class ElevationLauncher {
public:
    virtual ~ElevationLauncher() = default;

    virtual LaunchResult run(const QString& requestPath,
                             const QString& responsePath,
                             std::chrono::milliseconds timeout) = 0;
};

// Re-launches helperProgram with "--elevated-write <request> <response>"
// through the platform's consent prompt: the "runas" verb on Windows, the
// configured elevationProgram (pkexec by default) elsewhere. An empty
// elevationProgram starts the helper directly.
//
// The helper is told the deadline ("--deadline <ms since epoch>") because
// once it runs elevated the caller may no longer be allowed to kill it.
class ProcessElevationLauncher : public ElevationLauncher {
public:
    ProcessElevationLauncher(QString helperProgram,
                             QStringList helperArguments = {},
                             QString elevationProgram = QStringLiteral("pkexec"));

    LaunchResult run(const QString& requestPath,
                     const QString& responsePath,
                     std::chrono::milliseconds timeout) override;

    QStringList helperArguments(const QString& requestPath, const QString& responsePath,
                                const QDateTime& deadline = QDateTime()) const;

private:
    QString m_helperProgram;
    QStringList m_extraArguments;
    QString m_elevationProgram;
};

// True when the process token is elevated (Windows) or euid is 0 (POSIX).
bool isProcessElevated();

}
