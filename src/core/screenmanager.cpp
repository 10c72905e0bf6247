// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "screenmanager.h"
#include "logging.h"
#include <QGuiApplication>

namespace PlasmaBaskets {

ScreenManager::ScreenManager(QObject* parent)
    : QObject(parent)
{
}

ScreenManager::~ScreenManager()
{
    stop();
}

void ScreenManager::start()
{
    if (m_running) {
        return;
    }

    m_running = true;

    connect(qApp, &QGuiApplication::screenAdded, this, &ScreenManager::onScreenAdded);
    connect(qApp, &QGuiApplication::screenRemoved, this, &ScreenManager::onScreenRemoved);

    for (auto* screen : QGuiApplication::screens()) {
        if (!m_trackedScreens.contains(screen)) {
            connectScreenSignals(screen);
            m_trackedScreens.append(screen);
        }
    }
    qCDebug(lcCore) << "Tracking" << m_trackedScreens.size() << "screens";
}

void ScreenManager::stop()
{
    if (!m_running) {
        return;
    }

    m_running = false;

    for (auto* screen : std::as_const(m_trackedScreens)) {
        disconnect(screen, nullptr, this, nullptr);
    }
    m_trackedScreens.clear();

    disconnect(qApp, &QGuiApplication::screenAdded, this, nullptr);
    disconnect(qApp, &QGuiApplication::screenRemoved, this, nullptr);
}

QVector<DisplayDescriptor> ScreenManager::listDisplays() const
{
    QVector<DisplayDescriptor> displays;
    if (!qApp) {
        qCWarning(lcCore) << "listDisplays() called before QGuiApplication initialized";
        return displays;
    }

    const auto screens = QGuiApplication::screens();
    displays.reserve(screens.size());
    for (QScreen* screen : screens) {
        displays.append(DisplayDescriptor{screen->name(), screen->geometry()});
    }
    return displays;
}

QString ScreenManager::primaryDisplayId() const
{
    QScreen* primary = qApp ? QGuiApplication::primaryScreen() : nullptr;
    return primary ? primary->name() : QString();
}

void ScreenManager::connectScreenSignals(QScreen* screen)
{
    connect(screen, &QScreen::geometryChanged, this, &ScreenManager::topologyChanged);
}

void ScreenManager::onScreenAdded(QScreen* screen)
{
    if (!screen || m_trackedScreens.contains(screen)) {
        return;
    }

    connectScreenSignals(screen);
    m_trackedScreens.append(screen);
    qCInfo(lcCore) << "Screen added:" << screen->name();
    Q_EMIT topologyChanged();
}

void ScreenManager::onScreenRemoved(QScreen* screen)
{
    if (!screen) {
        return;
    }

    disconnect(screen, nullptr, this, nullptr);
    m_trackedScreens.removeAll(screen);
    qCInfo(lcCore) << "Screen removed:" << screen->name();
    Q_EMIT topologyChanged();
}

} // namespace PlasmaBaskets
