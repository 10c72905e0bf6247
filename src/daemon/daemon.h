// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace PlasmaBaskets {

class Settings;
class ScreenManager;
class PointerTracker;
class OperationGuards;
class OverlayService;
class BasketRegistry;
class BasketSwitcherController;
class AutoHideScheduler;
class BasketCoordinator;
class BasketAdaptor;
class SettingsAdaptor;

/**
 * @brief Main daemon for PlasmaBaskets
 *
 * Owns every long-lived component and wires them together:
 * - Settings and the display/pointer/guard services
 * - The Qt Quick presentation layer (layer-shell windows)
 * - Basket registry, chooser, auto-hide scheduler and coordinator
 * - D-Bus adaptors for the compositor script and other clients
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class Daemon : public QObject
{
    Q_OBJECT

public:
    explicit Daemon(QObject* parent = nullptr);
    ~Daemon() override;

    // Initialization
    bool init();
    void start();
    void stop();

    // Component access
    Settings* settings() const
    {
        return m_settings.get();
    }
    BasketRegistry* registry() const
    {
        return m_registry.get();
    }
    BasketCoordinator* coordinator() const
    {
        return m_coordinator.get();
    }

Q_SIGNALS:
    void started();
    void stopped();

private:
    bool registerDBus();

    // Declaration order is construction order; the adaptors are QObject children
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<ScreenManager> m_screenManager;
    std::unique_ptr<PointerTracker> m_pointerTracker;
    std::unique_ptr<OperationGuards> m_operationGuards;
    std::unique_ptr<OverlayService> m_overlayService;
    std::unique_ptr<BasketRegistry> m_registry;
    std::unique_ptr<BasketSwitcherController> m_switcher;
    std::unique_ptr<AutoHideScheduler> m_autoHideScheduler;
    std::unique_ptr<BasketCoordinator> m_coordinator;

    BasketAdaptor* m_basketAdaptor = nullptr;
    SettingsAdaptor* m_settingsAdaptor = nullptr;

    bool m_running = false;
};

} // namespace PlasmaBaskets
