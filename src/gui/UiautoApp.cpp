#include "UiautoApp.hpp"
#include "utils/Logger.hpp"

#include <QApplication>
#include <QColor>
#include <QIcon>
#include <QPixmap>

namespace uiauto {

UiautoApp::UiautoApp(X11HotkeyMonitor& monitor, util::SignalWatcher& signalWatcher, QObject* parent)
    : QObject(parent)
    , monitor(monitor)
    , signalWatcher(signalWatcher) {
    setupTrayIcon();
    setupEventPump();
}

UiautoApp::~UiautoApp() {
    if (x11Notifier) {
        x11Notifier->setEnabled(false);
    }
    if (trayIcon) {
        trayIcon->hide();
    }
}

void UiautoApp::setupTrayIcon() {
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        warning("System tray is not available; running without a tray icon");
        return;
    }

    trayIcon = std::make_unique<QSystemTrayIcon>();

    QIcon icon = QIcon::fromTheme("input-keyboard");
    if (icon.isNull()) {
        QPixmap pixmap(16, 16);
        pixmap.fill(QColor(0, 120, 215));
        icon = QIcon(pixmap);
    }
    trayIcon->setIcon(icon);
    trayIcon->setToolTip("UI Automation Tool");

    trayMenu = std::make_unique<QMenu>("uiauto");
    trayMenu->setTitle("uiauto");
    trayMenu->addAction("Quit", this, &UiautoApp::exitApp);
    trayIcon->setContextMenu(trayMenu.get());

    trayIcon->show();
    info("System tray icon created");
}

void UiautoApp::setupEventPump() {
    x11Notifier = std::make_unique<QSocketNotifier>(monitor.ConnectionFd(), QSocketNotifier::Read);
    connect(x11Notifier.get(), &QSocketNotifier::activated, this, &UiautoApp::onX11Readable);

    periodicTimer = std::make_unique<QTimer>();
    connect(periodicTimer.get(), &QTimer::timeout, this, &UiautoApp::onPeriodicCheck);
    periodicTimer->start(SIGNAL_CHECK_INTERVAL_MS);

    // Grabbing may already have queued events that the socket will not report again.
    QTimer::singleShot(0, this, &UiautoApp::onX11Readable);
}

void UiautoApp::onX11Readable() {
    monitor.ProcessPendingEvents();
}

void UiautoApp::onPeriodicCheck() {
    if (signalWatcher.shouldExitNow()) {
        info("Termination signal received. Initiating shutdown...");
        exitApp();
    }
}

void UiautoApp::exitApp() {
    if (shutdownRequested) {
        return;
    }
    shutdownRequested = true;
    info("Exiting uiauto");

    if (periodicTimer) {
        periodicTimer->stop();
    }
    QApplication::quit();
}

} // namespace uiauto
