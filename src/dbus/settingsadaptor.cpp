// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settingsadaptor.h"
#include "../core/interfaces.h"
#include "../core/logging.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QDBusVariant>

namespace PlasmaBaskets {

SettingsAdaptor::SettingsAdaptor(ISettings* settings, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_settings(settings)
    , m_saveTimer(new QTimer(this))
{
    Q_ASSERT(settings);
    initializeRegistry();

    m_saveTimer->setSingleShot(true);
    m_saveTimer->setInterval(SaveDebounceMs);
    connect(m_saveTimer, &QTimer::timeout, this, [this]() {
        m_settings->save();
        qCInfo(lcDbus) << "Debounced settings save completed";
    });

    // Connect to interface signals (DIP)
    connect(m_settings, &ISettings::settingsChanged, this, &SettingsAdaptor::settingsChanged);
}

SettingsAdaptor::~SettingsAdaptor()
{
    // Flush any pending debounced save so a change made right before shutdown is kept
    if (m_saveTimer->isActive()) {
        m_saveTimer->stop();
        m_settings->save();
        qCInfo(lcDbus) << "Flushed pending settings save on destruction";
    }
}

void SettingsAdaptor::scheduleSave()
{
    // Restart the timer on each setting change (debouncing)
    m_saveTimer->start();
}

void SettingsAdaptor::initializeRegistry()
{
// Register getters and setters for all settings
// This registry pattern allows adding new settings without modifying setSetting()

#define REGISTER_BOOL_SETTING(name, getter, setter)                                                                    \
    m_getters[QStringLiteral(name)] = [this]() {                                                                       \
        return m_settings->getter();                                                                                   \
    };                                                                                                                 \
    m_setters[QStringLiteral(name)] = [this](const QVariant& v) {                                                      \
        m_settings->setter(v.toBool());                                                                                \
        return true;                                                                                                   \
    };

#define REGISTER_INT_SETTING(name, getter, setter)                                                                     \
    m_getters[QStringLiteral(name)] = [this]() {                                                                       \
        return m_settings->getter();                                                                                   \
    };                                                                                                                 \
    m_setters[QStringLiteral(name)] = [this](const QVariant& v) {                                                      \
        bool ok = false;                                                                                               \
        const int value = v.toInt(&ok);                                                                                \
        if (!ok) {                                                                                                     \
            return false;                                                                                              \
        }                                                                                                              \
        m_settings->setter(value);                                                                                     \
        return true;                                                                                                   \
    };

#define REGISTER_DOUBLE_SETTING(name, getter, setter)                                                                  \
    m_getters[QStringLiteral(name)] = [this]() {                                                                       \
        return m_settings->getter();                                                                                   \
    };                                                                                                                 \
    m_setters[QStringLiteral(name)] = [this](const QVariant& v) {                                                      \
        bool ok = false;                                                                                               \
        const double value = v.toDouble(&ok);                                                                          \
        if (!ok) {                                                                                                     \
            return false;                                                                                              \
        }                                                                                                              \
        m_settings->setter(value);                                                                                     \
        return true;                                                                                                   \
    };

    // Basket mode
    REGISTER_BOOL_SETTING("multiBasketEnabled", isMultiBasketEnabled, setMultiBasketEnabled)
    REGISTER_BOOL_SETTING("powerFoldersEnabled", isPowerFoldersEnabled, setPowerFoldersEnabled)

    // Auto-hide
    REGISTER_BOOL_SETTING("autoHideEnabled", isAutoHideEnabled, setAutoHideEnabled)
    REGISTER_DOUBLE_SETTING("autoHideDelaySeconds", autoHideDelaySeconds, setAutoHideDelaySeconds)
    REGISTER_INT_SETTING("autoHidePollIntervalMs", autoHidePollIntervalMs, setAutoHidePollIntervalMs)

#undef REGISTER_BOOL_SETTING
#undef REGISTER_INT_SETTING
#undef REGISTER_DOUBLE_SETTING
}

void SettingsAdaptor::reloadSettings()
{
    m_settings->load();
    qCInfo(lcDbus) << "Settings reloaded";
}

void SettingsAdaptor::saveSettings()
{
    m_saveTimer->stop();
    m_settings->save();
}

void SettingsAdaptor::resetToDefaults()
{
    m_saveTimer->stop();
    m_settings->reset();
}

QString SettingsAdaptor::getAllSettings()
{
    QJsonObject settings;
    for (auto it = m_getters.constBegin(); it != m_getters.constEnd(); ++it) {
        settings[it.key()] = QJsonValue::fromVariant(it.value()());
    }
    return QString::fromUtf8(QJsonDocument(settings).toJson());
}

QDBusVariant SettingsAdaptor::getSetting(const QString& key)
{
    if (key.isEmpty()) {
        qCWarning(lcDbus) << "Cannot get setting - empty key";
        // QDBusVariant() with no argument is invalid and can't be marshalled
        return QDBusVariant(QVariant(QString()));
    }

    auto it = m_getters.find(key);
    if (it != m_getters.end()) {
        return QDBusVariant(it.value()());
    }

    qCWarning(lcDbus) << "Setting key not found:" << key;
    return QDBusVariant(QVariant(QString()));
}

bool SettingsAdaptor::setSetting(const QString& key, const QDBusVariant& value)
{
    if (key.isEmpty()) {
        qCWarning(lcDbus) << "Cannot set setting - empty key";
        return false;
    }

    auto it = m_setters.find(key);
    if (it == m_setters.end()) {
        qCWarning(lcDbus) << "Setting key not found:" << key;
        return false;
    }

    const bool result = it.value()(value.variant());
    if (result) {
        scheduleSave();
        qCInfo(lcDbus) << "Setting" << key << "updated, save scheduled";
    } else {
        qCWarning(lcDbus) << "Failed to set setting:" << key << "value:" << value.variant();
    }
    return result;
}

QStringList SettingsAdaptor::getSettingKeys()
{
    return m_getters.keys();
}

} // namespace PlasmaBaskets
