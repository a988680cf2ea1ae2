#include <QApplication>
#include "gui/UiautoApp.hpp"
#include <iostream>
#include <memory>
#include <string>

#include "types.hpp"
#include "core/ConfigManager.hpp"
#include "core/HotkeyRegistry.hpp"
#include "core/io/X11HotkeyMonitor.hpp"
#include "core/process/ProcessManager.hpp"
#include "core/util/SignalWatcher.hpp"
#include "process/ActionResolver.hpp"
#include "process/Launcher.hpp"
#include "utils/Logger.hpp"
#include "window/DisplayProbe.hpp"
#include "window/WindowManager.hpp"
#include "window/WindowOperations.hpp"
// Xlib after Qt.
#include "core/DisplayManager.hpp"

using namespace uiauto;

namespace {
void printUsage(std::ostream& out) {
    out << "Usage: uiauto [options]\n";
    out << "Options:\n";
    out << "  --config <path>  Read configuration from <path>\n";
    out << "                   (default: ~/.config/uiauto/uiauto.conf)\n";
    out << "  --debug, -d      Enable debug logging\n";
    out << "  --no-tray        Run without the system tray icon\n";
    out << "  --help, -h       Show this help\n";
}
}

int main(int argc, char* argv[]) {
    std::string configPath;
    bool noTray = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-d") {
            Logger::getInstance().setLogLevel(Logger::LOG_DEBUG);
        } else if (arg == "--no-tray") {
            noTray = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a path\n";
                printUsage(std::cerr);
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(std::cerr);
            return 1;
        }
    }

    Configuration configuration;
    try {
        auto& config = Configs::Get();
        if (configPath.empty()) {
            configPath = ConfigPaths::GetDefaultConfigPath();
        }
        if (config.EnsureConfigFile(configPath)) {
            info("Created default config file at {}", configPath);
        }
        config.Load(configPath);
        configuration = config.BuildConfiguration();
        Logger::getInstance().initialize(config.GetLogToFile(), config.GetLogMaxDays());
        info("Config path: {}", config.getPath());
    } catch (const ConfigError& e) {
        fatal("Error loading or creating config: {}", e.what());
        return 1;
    }

    if (DetectDisplayServer() == DisplayServer::Wayland) {
        warning("Wayland session detected; global hotkeys only reach X11 (XWayland) clients");
    }

    if (!DisplayManager::Initialize()) {
        return 1;
    }

    std::unique_ptr<X11HotkeyMonitor> monitorPtr;
    try {
        monitorPtr = std::make_unique<X11HotkeyMonitor>(DisplayManager::GetDisplay());
    } catch (const std::exception& e) {
        fatal("Failed to start the hotkey monitor: {}", e.what());
        return 1;
    }
    X11HotkeyMonitor& monitor = *monitorPtr;

    // Before start(): a signal during key grabbing must still stop Run().
    util::SignalWatcher signalWatcher;
    if (noTray) {
        signalWatcher.setExitCallback([&monitor]() { monitor.Stop(); });
    }
    try {
        util::blockTerminationSignals();
        signalWatcher.start();
    } catch (const std::exception& e) {
        fatal("Failed to set up signal handling: {}", e.what());
        return 1;
    }

    WindowManager windowManager;
    ProcFsProcessTable processTable;
    Launcher launcher;
    XrandrDisplayProbe displayProbe;

    ActionResolver resolver(processTable, windowManager, launcher);
    WindowOperations windowOps(displayProbe, windowManager);
    HotkeyRegistry registry(monitor, resolver, windowOps);

    monitor.SetDispatcher([&registry](const std::string& combo) {
        registry.dispatch(combo);
    });

    size_t installed = registry.install(std::move(configuration));
    if (installed == 0) {
        warning("No hotkeys could be installed");
    }

    int status = 0;
    if (noTray) {
        monitor.Run();
    } else {
        QApplication app(argc, argv);
        QApplication::setApplicationName("uiauto");
        QApplication::setQuitOnLastWindowClosed(false);

        UiautoApp ui(monitor, signalWatcher);
        status = app.exec();
    }

    signalWatcher.stop();
    monitor.UngrabAll();
    info("uiauto stopped");
    return status;
}
