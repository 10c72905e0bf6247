// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "daemon.h"

#include <QDBusConnection>
#include <QDBusError>

#include "autohidescheduler.h"
#include "basketcoordinator.h"
#include "basketregistry.h"
#include "basketswitchercontroller.h"
#include "operationguards.h"
#include "overlayservice.h"
#include "pointertracker.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/screenmanager.h"
#include "../config/settings.h"
#include "../dbus/basketadaptor.h"
#include "../dbus/settingsadaptor.h"

namespace PlasmaBaskets {

Daemon::Daemon(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_screenManager(std::make_unique<ScreenManager>())
    , m_pointerTracker(std::make_unique<PointerTracker>())
    , m_operationGuards(std::make_unique<OperationGuards>())
    , m_overlayService(std::make_unique<OverlayService>())
{
}

Daemon::~Daemon()
{
    stop();

    // The settings adaptor flushes a pending save on destruction, so it must
    // go before the members it points at
    delete m_settingsAdaptor;
    m_settingsAdaptor = nullptr;
    delete m_basketAdaptor;
    m_basketAdaptor = nullptr;
}

bool Daemon::init()
{
    BasketEnvironment environment;
    environment.settings = m_settings.get();
    environment.presentation = m_overlayService.get();
    environment.guards = m_operationGuards.get();
    environment.pointer = m_pointerTracker.get();
    environment.displays = m_screenManager.get();

    m_registry = std::make_unique<BasketRegistry>(environment);
    m_switcher = std::make_unique<BasketSwitcherController>(m_registry.get(), environment);
    m_autoHideScheduler = std::make_unique<AutoHideScheduler>(m_registry.get(), m_switcher.get(), environment);
    m_coordinator = std::make_unique<BasketCoordinator>(m_registry.get(), m_switcher.get(), environment);

    // D-Bus adaptors attach to the daemon object, which is what gets registered
    m_basketAdaptor = new BasketAdaptor(m_coordinator.get(), m_registry.get(), m_pointerTracker.get(),
                                        m_operationGuards.get(), this);
    m_settingsAdaptor = new SettingsAdaptor(m_settings.get(), this);

    // Queued: a removed screen is still listed while screenRemoved is being emitted
    connect(m_screenManager.get(), &ScreenManager::topologyChanged, m_registry.get(),
            &BasketRegistry::onDisplayTopologyChanged, Qt::QueuedConnection);
    connect(m_autoHideScheduler.get(), &AutoHideScheduler::basketAutoHidden, this, [](const QString& basketId) {
        qCDebug(lcDaemon) << "Basket auto-hidden" << basketId;
    });

    return registerDBus();
}

bool Daemon::registerDBus()
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCCritical(lcDaemon) << "Cannot connect to session D-Bus - daemon cannot function without D-Bus";
        return false;
    }

    if (!bus.registerService(QString(DBus::ServiceName))) {
        const QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus service:" << DBus::ServiceName << "Error:" << error.message()
                             << "Type:" << error.type();
        return false;
    }

    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        const QDBusError error = bus.lastError();
        qCCritical(lcDaemon) << "Failed to register D-Bus object:" << DBus::ObjectPath << "Error:" << error.message();
        // Cleanup: unregister service if object registration fails
        bus.unregisterService(QString(DBus::ServiceName));
        return false;
    }

    qCInfo(lcDaemon) << "D-Bus service registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void Daemon::start()
{
    if (m_running) {
        return;
    }

    m_screenManager->start();
    m_running = true;
    Q_EMIT started();
}

void Daemon::stop()
{
    if (!m_running) {
        return;
    }

    m_running = false;

    if (m_coordinator) {
        m_coordinator->closeAllBaskets();
    }
    m_screenManager->stop();

    auto bus = QDBusConnection::sessionBus();
    bus.unregisterObject(QString(DBus::ObjectPath));
    bus.unregisterService(QString(DBus::ServiceName));

    qCInfo(lcDaemon) << "Stopped";
    Q_EMIT stopped();
}

} // namespace PlasmaBaskets
