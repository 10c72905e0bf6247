// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QObject>
#include <QDBusAbstractAdaptor>
#include <QDBusVariant>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QTimer>
#include <functional>
#include <QHash>

namespace PlasmaBaskets {

class ISettings;

/**
 * @brief D-Bus adaptor for settings operations
 *
 * Provides D-Bus interface: org.plasmabaskets.Settings
 *  Settings read/write operations
 *
 * Uses registry pattern for setSetting.
 */
class PLASMABASKETS_EXPORT SettingsAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.plasmabaskets.Settings")

public:
    explicit SettingsAdaptor(ISettings* settings, QObject* parent = nullptr);
    ~SettingsAdaptor() override;

public Q_SLOTS:
    // Settings operations
    void reloadSettings();
    void saveSettings();
    void resetToDefaults();

    // Generic get/set (registry-based)
    QString getAllSettings();
    QDBusVariant getSetting(const QString& key);
    bool setSetting(const QString& key, const QDBusVariant& value);
    QStringList getSettingKeys();

Q_SIGNALS:
    void settingsChanged();

private:
    void initializeRegistry();

    /**
     * @brief Schedule a debounced save
     *
     * Batches multiple setting changes into a single write of plasmabasketsrc.
     */
    void scheduleSave();

    ISettings* m_settings; // Interface type (DIP)

    // Registry pattern
    using Getter = std::function<QVariant()>;
    using Setter = std::function<bool(const QVariant&)>;

    QHash<QString, Getter> m_getters;
    QHash<QString, Setter> m_setters;

    QTimer* m_saveTimer = nullptr;
    static constexpr int SaveDebounceMs = 500;
};

} // namespace PlasmaBaskets
