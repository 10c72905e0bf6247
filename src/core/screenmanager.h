// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "interfaces.h"
#include "plasmabaskets_export.h"
#include <QObject>
#include <QScreen>
#include <QVector>

namespace PlasmaBaskets {

/**
 * @brief Display topology backed by QGuiApplication's screens
 *
 * Display ids are connector names (QScreen::name()), which stay stable
 * across reconnects of the same output. Baskets keep the id of the display
 * they materialized on. While started, every added, removed or moved
 * screen emits topologyChanged(), which the daemon forwards to
 * BasketRegistry so each basket re-resolves its display right away.
 */
class PLASMABASKETS_EXPORT ScreenManager : public QObject, public IDisplayTopology
{
    Q_OBJECT

public:
    explicit ScreenManager(QObject* parent = nullptr);
    ~ScreenManager() override;

    /**
     * @brief Start monitoring screens
     */
    void start();

    /**
     * @brief Stop monitoring screens
     */
    void stop();

    // IDisplayTopology
    QVector<DisplayDescriptor> listDisplays() const override;
    QString primaryDisplayId() const override;

Q_SIGNALS:
    /**
     * @brief Emitted whenever a display is added, removed or moved
     */
    void topologyChanged();

private Q_SLOTS:
    void onScreenAdded(QScreen* screen);
    void onScreenRemoved(QScreen* screen);

private:
    void connectScreenSignals(QScreen* screen);

    bool m_running = false;
    QVector<QScreen*> m_trackedScreens;
};

} // namespace PlasmaBaskets
