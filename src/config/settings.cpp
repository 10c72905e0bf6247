// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>

namespace PlasmaBaskets {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

Settings::Settings(QObject* parent)
    : ISettings(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, QLatin1String key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(key, defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

qreal Settings::readValidatedDelay(const KConfigGroup& group, QLatin1String key, qreal defaultValue,
                                   const char* settingName)
{
    qreal value = group.readEntry(key, defaultValue);
    // Non-positive delays mean "unset" rather than "hide immediately"
    if (value <= 0.0) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default" << defaultValue;
        return defaultValue;
    }
    return qBound(Defaults::MinAutoHideDelaySeconds, value, Defaults::MaxAutoHideDelaySeconds);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER(bool, MultiBasketEnabled, m_multiBasketEnabled, multiBasketEnabledChanged)
SETTINGS_SETTER(bool, PowerFoldersEnabled, m_powerFoldersEnabled, powerFoldersEnabledChanged)
SETTINGS_SETTER(bool, AutoHideEnabled, m_autoHideEnabled, autoHideEnabledChanged)
SETTINGS_SETTER_CLAMPED(AutoHidePollIntervalMs, m_autoHidePollIntervalMs, autoHidePollIntervalMsChanged,
                        Defaults::MinAutoHidePollIntervalMs, Defaults::MaxAutoHidePollIntervalMs)

// Manual setter: SETTINGS_SETTER_CLAMPED only handles int
void Settings::setAutoHideDelaySeconds(qreal seconds)
{
    if (seconds <= 0.0) {
        seconds = ConfigDefaults::autoHideDelay();
    }
    seconds = qBound(Defaults::MinAutoHideDelaySeconds, seconds, Defaults::MaxAutoHideDelaySeconds);
    if (!qFuzzyCompare(m_autoHideDelaySeconds, seconds)) {
        m_autoHideDelaySeconds = seconds;
        Q_EMIT autoHideDelaySecondsChanged();
        Q_EMIT settingsChanged();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile));

    // Force re-read from disk - KSharedConfig caches in memory, so when another
    // process writes the file and the daemon is told to reload, the cache must go
    config->reparseConfiguration();

    KConfigGroup basket = config->group(QString(ConfigKeys::BasketGroup));

    // Apply through the setters so a reload emits change signals for whatever moved
    setMultiBasketEnabled(basket.readEntry(ConfigKeys::EnableMultiBasket, ConfigDefaults::enableMultiBasket()));
    setPowerFoldersEnabled(basket.readEntry(ConfigKeys::EnablePowerFolders, ConfigDefaults::enablePowerFolders()));
    setAutoHideEnabled(basket.readEntry(ConfigKeys::EnableAutoHide, ConfigDefaults::enableAutoHide()));
    setAutoHideDelaySeconds(
        readValidatedDelay(basket, ConfigKeys::AutoHideDelay, ConfigDefaults::autoHideDelay(), "AutoHideDelay"));
    setAutoHidePollIntervalMs(readValidatedInt(basket, ConfigKeys::AutoHidePollIntervalMs,
                                               ConfigDefaults::autoHidePollIntervalMs(),
                                               Defaults::MinAutoHidePollIntervalMs,
                                               Defaults::MaxAutoHidePollIntervalMs, "AutoHidePollIntervalMs"));

    qCDebug(lcConfig) << "Settings loaded: multiBasket=" << m_multiBasketEnabled << "autoHide=" << m_autoHideEnabled
                      << "delay=" << m_autoHideDelaySeconds << "powerFolders=" << m_powerFoldersEnabled;
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile));
    KConfigGroup basket = config->group(QString(ConfigKeys::BasketGroup));

    basket.writeEntry(ConfigKeys::EnableMultiBasket, m_multiBasketEnabled);
    basket.writeEntry(ConfigKeys::EnablePowerFolders, m_powerFoldersEnabled);
    basket.writeEntry(ConfigKeys::EnableAutoHide, m_autoHideEnabled);
    basket.writeEntry(ConfigKeys::AutoHideDelay, m_autoHideDelaySeconds);
    basket.writeEntry(ConfigKeys::AutoHidePollIntervalMs, m_autoHidePollIntervalMs);

    config->sync();
}

void Settings::reset()
{
    auto config = KSharedConfig::openConfig(QString(ConfigKeys::ConfigFile));

    // load() falls back to ConfigDefaults for every missing key
    config->deleteGroup(QString(ConfigKeys::BasketGroup));
    config->sync();

    load();

    qCInfo(lcConfig) << "Settings reset to defaults";
}

} // namespace PlasmaBaskets
