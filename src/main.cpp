#include "cli/ConsoleView.hpp"
#include "core/DeviceRegistryReader.hpp"
#include "core/JsonRegistryStore.hpp"
#include "core/Logger.hpp"
#include "core/ReconciliationLoop.hpp"
#include "core/UsbPresenceScanner.hpp"
#include "broker/ElevatedExecutor.hpp"
#include "broker/ElevationLauncher.hpp"
#include "broker/PrivilegeBroker.hpp"
#include "utils/ConfigManager.hpp"
#ifdef Q_OS_WIN
#include "platform/WinRegistryStore.hpp"
#endif
#include <usb-power/Constants.hpp>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDateTime>
#include <QFileInfo>
#include <QTextStream>
#include <iostream>
#include <optional>

using namespace usb_power;

namespace {

constexpr int EXIT_USAGE = 2;

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Per-device USB power saving control");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addPositionalArgument("command",
        "list, toggle <device>, disable <device>, enable <device>, disable-all or watch.",
        "<command> [device]");

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    );
    parser.addOption(configOption);

    QCommandLineOption logFileOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    );
    parser.addOption(logFileOption);

    QCommandLineOption logLevelOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"
    );
    parser.addOption(logLevelOption);

    QCommandLineOption registryFileOption(
        "registry-file",
        "Use a JSON registry image instead of the system registry.",
        "file"
    );
    parser.addOption(registryFileOption);

    QCommandLineOption assumeYesOption(
        QStringList() << "y" << "assume-yes",
        "Do not ask before requesting administrator rights."
    );
    parser.addOption(assumeYesOption);

    // Used when the front-end re-launches itself elevated:
    // --elevated-write <request> <response>
    QCommandLineOption elevatedWriteOption(
        ELEVATED_WRITE_OPTION,
        "Apply a write request file and report to a response file.",
        "request"
    );
    elevatedWriteOption.setFlags(QCommandLineOption::HiddenFromHelp);
    parser.addOption(elevatedWriteOption);

    QCommandLineOption deadlineOption(
        DEADLINE_OPTION,
        "Give up on an elevated write after this time (ms since epoch).",
        "ms"
    );
    deadlineOption.setFlags(QCommandLineOption::HiddenFromHelp);
    parser.addOption(deadlineOption);
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    if (parser.isSet("verbosity")) {
        LogLevel level = Logger::levelFromVerbosity(parser.value("verbosity").toInt());
        logger.setLogLevel(level);
        logger.enableSourceInfo(level == LogLevel::Debug);
    }

    if (parser.isSet(ELEVATED_WRITE_OPTION)) {
        logger.setProcessTag("elevated");
    }

    LOG_DEBUG("Application starting...");
}

// Returns the absolute path of the file that was loaded, empty when running
// on defaults; nullopt when the file could not be loaded.
std::optional<QString> loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    const QString configPath = ConfigManager::locateFile(
        parser.isSet("config") ? parser.value("config") : QString());

    if (!configPath.isEmpty()) {
        if (!config.loadFromFile(configPath.toStdString())) {
            LOG_WARNING("Failed to load configuration from " + configPath.toStdString());
            return std::nullopt;
        }
        LOG_INFO("Loaded configuration from " + configPath.toStdString());
    } else {
        LOG_DEBUG("No configuration file found, using defaults");
    }

    // Command line wins over the file
    if (parser.isSet("registry-file")) {
        config.setString(ConfigKeys::REGISTRY_FILE, parser.value("registry-file").toStdString());
    }
    if (!parser.isSet("verbosity")) {
        LogLevel level = Logger::levelFromVerbosity(config.getInt(ConfigKeys::LOG_LEVEL, 1));
        Logger::instance().setLogLevel(level);
        Logger::instance().enableSourceInfo(level == LogLevel::Debug);
    }

    return configPath;
}

std::unique_ptr<RegistryStore> createRegistryStore(const ConfigManager& config,
                                                   JsonRegistryStore::Access access) {
    const std::string registryFile = config.getString(ConfigKeys::REGISTRY_FILE);
    if (!registryFile.empty()) {
        LOG_INFO("Using registry image " + registryFile);
        return std::make_unique<JsonRegistryStore>(QString::fromStdString(registryFile), access);
    }

#ifdef Q_OS_WIN
    return std::make_unique<WinRegistryStore>();
#else
    throw std::runtime_error("No system registry on this platform; set registryFile or pass --registry-file");
#endif
}

// Arguments the elevated copy needs to see the same configuration, store and
// log file. The helper runs with another user's working directory and home,
// so the configuration is always passed explicitly.
QStringList forwardedArguments(const QCommandLineParser& parser, const ConfigManager& config,
                               const QString& configPath) {
    QStringList args;
    if (!configPath.isEmpty()) {
        args << "--config" << configPath;
    }
    const std::string registryFile = config.getString(ConfigKeys::REGISTRY_FILE);
    if (!registryFile.empty()) {
        args << "--registry-file" << QFileInfo(QString::fromStdString(registryFile)).absoluteFilePath();
    }
    if (parser.isSet("log-file")) {
        args << "--log-file" << QFileInfo(parser.value("log-file")).absoluteFilePath();
    }
    return args;
}

bool askConsent(size_t operationCount) {
    std::cout << "Changing the power setting of " << operationCount
              << " device(s) requires administrator rights. Continue? [y/N] " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

// Accepts the Device Parameters path or the device instance path above it.
std::optional<std::string> resolveDevicePath(const ReconciliationLoop& loop, const QString& argument) {
    const std::string wanted = argument.toStdString();
    for (const auto& device : loop.snapshot()) {
        if (registry_path::equalsIgnoreCase(device.registryPath, wanted) ||
            registry_path::equalsIgnoreCase(registry_path::parent(device.registryPath), wanted)) {
            return device.registryPath;
        }
    }
    return std::nullopt;
}

int runElevatedWrite(const QCommandLineParser& parser, const ConfigManager& config) {
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        LOG_ERROR("Elevated write needs a request and a response file");
        return ExitCodes::BAD_REQUEST;
    }

    auto store = createRegistryStore(config, JsonRegistryStore::Access::Administrator);
    ElevatedExecutor executor(*store, config.getString(ConfigKeys::ENUMERATION_ROOT, USB_ENUM_ROOT));

    if (parser.isSet(DEADLINE_OPTION)) {
        bool ok = false;
        qint64 deadline = parser.value(DEADLINE_OPTION).toLongLong(&ok);
        if (!ok) {
            LOG_ERROR("Malformed deadline: " + parser.value(DEADLINE_OPTION).toStdString());
            return ExitCodes::BAD_REQUEST;
        }
        executor.setDeadline(QDateTime::fromMSecsSinceEpoch(deadline));
    }
    return executor.run(parser.value(ELEVATED_WRITE_OPTION), positional.first());
}

}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("usb-power");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    setupCommandLineParser(parser);
    parser.process(app);

    initializeLogger(parser);

    try {
        ConfigManager configManager;
        const std::optional<QString> configPath = loadConfiguration(configManager, parser);
        if (!configPath) {
            return parser.isSet(ELEVATED_WRITE_OPTION) ? ExitCodes::BAD_REQUEST : 1;
        }

        if (parser.isSet(ELEVATED_WRITE_OPTION)) {
            return runElevatedWrite(parser, configManager);
        }

        const QStringList positional = parser.positionalArguments();
        const QString command = positional.isEmpty() ? QString("list") : positional.first();
        const bool needsDevice = command == "toggle" || command == "disable" || command == "enable";
        const QStringList knownCommands = {"list", "toggle", "disable", "enable", "disable-all", "watch"};

        if (!knownCommands.contains(command) || (needsDevice && positional.size() != 2) ||
            (!needsDevice && positional.size() > 1)) {
            std::cerr << parser.helpText().toStdString();
            return EXIT_USAGE;
        }

        auto store = createRegistryStore(configManager, JsonRegistryStore::Access::User);

        std::unique_ptr<UsbPresenceScanner> scanner;
        if (configManager.getBool(ConfigKeys::DETECT_PRESENCE, true)) {
            scanner = std::make_unique<UsbPresenceScanner>();
            if (!scanner->isAvailable()) {
                scanner.reset();
            }
        }

        DeviceRegistryReader reader(*store,
            configManager.getString(ConfigKeys::ENUMERATION_ROOT, USB_ENUM_ROOT));
        reader.setPresenceScanner(scanner.get());

        auto launcher = std::make_unique<ProcessElevationLauncher>(
            QCoreApplication::applicationFilePath(),
            forwardedArguments(parser, configManager, *configPath),
            QString::fromStdString(configManager.getString(ConfigKeys::ELEVATION_PROGRAM, "pkexec")));

        PrivilegeBroker broker(*store, std::move(launcher));
        broker.setTimeout(std::chrono::seconds(
            configManager.getInt(ConfigKeys::ELEVATION_TIMEOUT_SEC, ELEVATION_TIMEOUT)));
        if (!parser.isSet("assume-yes")) {
            broker.setConsentHandler(askConsent);
        }

        QTextStream out(stdout);
        ReconciliationLoop loop(reader, broker);
        ConsoleView view(out);
        view.setLoop(&loop);

        bool enumerationOk = true;
        QObject::connect(&loop, &ReconciliationLoop::enumerationFailed,
                         [&enumerationOk](const std::string&) { enumerationOk = false; });

        if (command == "watch") {
            view.setFollowChanges(true);
            loop.start(std::chrono::milliseconds(
                configManager.getInt(ConfigKeys::REFRESH_INTERVAL_MS, REFRESH_INTERVAL)));
            view.printTable(loop.snapshot());
            LOG_INFO("Watching for changes");
            return app.exec();
        }

        loop.reconcile();
        if (!enumerationOk) {
            return 1;
        }

        if (command == "list") {
            view.printTable(loop.snapshot());
            return 0;
        }

        std::optional<std::string> target;
        if (needsDevice) {
            target = resolveDevicePath(loop, positional.at(1));
            if (!target) {
                std::cerr << "No such device: " << positional.at(1).toStdString() << std::endl;
                return 1;
            }
        }

        int failedWrites = 0;
        QObject::connect(&loop, &ReconciliationLoop::batchCompleted,
                         [&failedWrites](quint64, int, int failed) {
            failedWrites = failed;
            QCoreApplication::exit(0);
        });

        bool submitted = false;
        if (command == "toggle") {
            submitted = loop.toggle(*target);
        } else if (command == "disable" || command == "enable") {
            submitted = loop.setSleepDisabled(*target, command == "disable");
        } else {
            size_t count = loop.disableAllSleep();
            if (count == 0) {
                out << "No device has a power setting to change." << '\n';
                return 0;
            }
            out << "Disabling power saving on " << count << " device(s)" << '\n';
            out.flush();
            submitted = true;
        }

        if (!submitted) {
            return 1;
        }

        app.exec();

        if (target) {
            if (auto device = loop.device(*target)) {
                view.printDevice(*device);
            }
        } else {
            view.printTable(loop.snapshot());
        }

        return failedWrites > 0 ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return parser.isSet(ELEVATED_WRITE_OPTION) ? ExitCodes::BAD_REQUEST : 1;
    }
}
