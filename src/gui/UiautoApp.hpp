#pragma once

#include <QObject>
#include <QSystemTrayIcon>
#include <QSocketNotifier>
#include <QTimer>
#include <QMenu>
#include <memory>

#include "core/io/X11HotkeyMonitor.hpp"
#include "core/util/SignalWatcher.hpp"

namespace uiauto {

// Tray icon plus the Qt side of the X11 event pump.
class UiautoApp : public QObject {
    Q_OBJECT

public:
    UiautoApp(X11HotkeyMonitor& monitor, util::SignalWatcher& signalWatcher,
              QObject* parent = nullptr);
    ~UiautoApp() override;

    UiautoApp(const UiautoApp&) = delete;
    UiautoApp& operator=(const UiautoApp&) = delete;

private slots:
    void onX11Readable();
    void onPeriodicCheck();
    void exitApp();

private:
    void setupTrayIcon();
    void setupEventPump();

    X11HotkeyMonitor& monitor;
    util::SignalWatcher& signalWatcher;

    std::unique_ptr<QMenu> trayMenu;
    std::unique_ptr<QSystemTrayIcon> trayIcon;
    std::unique_ptr<QSocketNotifier> x11Notifier;
    std::unique_ptr<QTimer> periodicTimer;
    bool shutdownRequested = false;

    static constexpr int SIGNAL_CHECK_INTERVAL_MS = 200;
};

} // namespace uiauto
