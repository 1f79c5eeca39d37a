#include "ElevationLauncher.hpp"
#include "../core/Logger.hpp"
#include <usb-power/Constants.hpp>
#include <algorithm>
#include <climits>

#ifdef Q_OS_WIN
#include <windows.h>
#include <shellapi.h>
#else
#include <QProcess>
#include <unistd.h>
#endif

namespace usb_power {

namespace {

#ifdef Q_OS_WIN
QString quoteArgument(const QString& argument) {
    if (!argument.isEmpty() && !argument.contains(QLatin1Char(' ')) &&
        !argument.contains(QLatin1Char('"'))) {
        return argument;
    }
    QString quoted = argument;
    quoted.replace(QLatin1String("\""), QLatin1String("\\\""));
    return QLatin1Char('"') + quoted + QLatin1Char('"');
}
#else
// pkexec reports a dismissed dialog as 126 and a refused authorization as 127
constexpr int PKEXEC_DISMISSED = 126;
constexpr int PKEXEC_NOT_AUTHORIZED = 127;

// Time a killed or deadline-bound helper gets to go away
constexpr int STOP_GRACE_MS = 5000;
#endif

QDateTime deadlineAfter(std::chrono::milliseconds timeout) {
    return QDateTime::currentDateTimeUtc().addMSecs(timeout.count());
}

}

ProcessElevationLauncher::ProcessElevationLauncher(QString helperProgram,
                                                   QStringList helperArguments,
                                                   QString elevationProgram)
    : m_helperProgram(std::move(helperProgram))
    , m_extraArguments(std::move(helperArguments))
    , m_elevationProgram(std::move(elevationProgram)) {
}

QStringList ProcessElevationLauncher::helperArguments(const QString& requestPath,
                                                      const QString& responsePath,
                                                      const QDateTime& deadline) const {
    QStringList args;
    args << QStringLiteral("--%1").arg(QLatin1String(ELEVATED_WRITE_OPTION))
         << requestPath << responsePath;
    if (deadline.isValid()) {
        args << QStringLiteral("--%1").arg(QLatin1String(DEADLINE_OPTION))
             << QString::number(deadline.toMSecsSinceEpoch());
    }
    args << m_extraArguments;
    return args;
}

#ifdef Q_OS_WIN

LaunchResult ProcessElevationLauncher::run(const QString& requestPath,
                                           const QString& responsePath,
                                           std::chrono::milliseconds timeout) {
    LaunchResult result;

    QStringList quoted;
    for (const auto& arg : helperArguments(requestPath, responsePath, deadlineAfter(timeout))) {
        quoted << quoteArgument(arg);
    }
    std::wstring file = m_helperProgram.toStdWString();
    std::wstring params = quoted.join(QLatin1Char(' ')).toStdWString();

    SHELLEXECUTEINFOW info{};
    info.cbSize = sizeof(info);
    info.fMask = SEE_MASK_NOCLOSEPROCESS | SEE_MASK_NOASYNC | SEE_MASK_FLAG_NO_UI;
    info.lpVerb = L"runas";
    info.lpFile = file.c_str();
    info.lpParameters = params.c_str();
    info.nShow = SW_HIDE;

    LOG_INFO("Requesting elevation for " + m_helperProgram.toStdString());
    if (!ShellExecuteExW(&info)) {
        DWORD err = GetLastError();
        result.status = err == ERROR_CANCELLED ? LaunchStatus::Declined : LaunchStatus::SpawnFailed;
        result.detail = "ShellExecuteExW failed, error " + std::to_string(err);
        return result;
    }
    if (!info.hProcess) {
        result.status = LaunchStatus::SpawnFailed;
        result.detail = "No process handle for elevated helper";
        return result;
    }

    auto waitMs = static_cast<DWORD>(std::min<long long>(timeout.count(), INFINITE - 1));
    DWORD waited = WaitForSingleObject(info.hProcess, waitMs);
    if (waited == WAIT_OBJECT_0) {
        DWORD exitCode = 0;
        result.status = LaunchStatus::Completed;
        result.exitCode = GetExitCodeProcess(info.hProcess, &exitCode) ? static_cast<int>(exitCode) : -1;
    } else {
        TerminateProcess(info.hProcess, 1);
        result.status = LaunchStatus::TimedOut;
        result.detail = "Elevated helper did not exit within " +
                        std::to_string(timeout.count()) + " ms";
    }
    CloseHandle(info.hProcess);
    return result;
}

bool isProcessElevated() {
    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token)) {
        return false;
    }

    TOKEN_ELEVATION elevation{};
    DWORD size = sizeof(elevation);
    bool elevated = GetTokenInformation(token, TokenElevation, &elevation, size, &size) &&
                    elevation.TokenIsElevated != 0;
    CloseHandle(token);
    return elevated;
}

#else

LaunchResult ProcessElevationLauncher::run(const QString& requestPath,
                                           const QString& responsePath,
                                           std::chrono::milliseconds timeout) {
    LaunchResult result;

    QString program = m_helperProgram;
    QStringList args = helperArguments(requestPath, responsePath, deadlineAfter(timeout));
    if (!m_elevationProgram.isEmpty()) {
        args.prepend(m_helperProgram);
        program = m_elevationProgram;
    }

    LOG_INFO("Requesting elevation via " + program.toStdString());

    QProcess process;
    process.setProcessChannelMode(QProcess::ForwardedChannels);
    process.start(program, args);
    if (!process.waitForStarted()) {
        result.status = LaunchStatus::SpawnFailed;
        result.detail = "Failed to start " + program.toStdString() + ": " +
                        process.errorString().toStdString();
        return result;
    }

    int waitMs = static_cast<int>(std::min<long long>(timeout.count(), INT_MAX));
    if (!process.waitForFinished(waitMs)) {
        // Fails once pkexec has handed over to a root helper; that helper
        // stops on its own at the deadline it was given.
        process.kill();
        if (!process.waitForFinished(STOP_GRACE_MS)) {
            LOG_WARNING("Elevated helper did not stop after the deadline");
        }
        result.status = LaunchStatus::TimedOut;
        result.detail = "Elevated helper did not exit within " +
                        std::to_string(timeout.count()) + " ms";
        return result;
    }

    result.exitCode = process.exitCode();
    if (process.exitStatus() != QProcess::NormalExit) {
        result.status = LaunchStatus::Completed;
        result.detail = "Elevated helper crashed";
        return result;
    }

    if (!m_elevationProgram.isEmpty() &&
        (result.exitCode == PKEXEC_DISMISSED || result.exitCode == PKEXEC_NOT_AUTHORIZED)) {
        result.status = LaunchStatus::Declined;
        result.detail = "Authorization was not granted";
        return result;
    }

    result.status = LaunchStatus::Completed;
    return result;
}

bool isProcessElevated() {
    return geteuid() == 0;
}

#endif

} // namespace usb_power
