// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>

namespace PlasmaBaskets {

/**
 * @brief Global settings for PlasmaBaskets
 *
 * Implements the ISettings interface with KConfig integration. Values are
 * read from the [Basket] group of plasmabasketsrc; anything missing or out
 * of range falls back to the defaults generated from plasmabaskets.kcfg.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class PLASMABASKETS_EXPORT Settings : public ISettings
{
    Q_OBJECT

    Q_PROPERTY(bool multiBasketEnabled READ isMultiBasketEnabled WRITE setMultiBasketEnabled NOTIFY
                   multiBasketEnabledChanged)
    Q_PROPERTY(bool powerFoldersEnabled READ isPowerFoldersEnabled WRITE setPowerFoldersEnabled NOTIFY
                   powerFoldersEnabledChanged)
    Q_PROPERTY(bool autoHideEnabled READ isAutoHideEnabled WRITE setAutoHideEnabled NOTIFY autoHideEnabledChanged)
    Q_PROPERTY(qreal autoHideDelaySeconds READ autoHideDelaySeconds WRITE setAutoHideDelaySeconds NOTIFY
                   autoHideDelaySecondsChanged)
    Q_PROPERTY(int autoHidePollIntervalMs READ autoHidePollIntervalMs WRITE setAutoHidePollIntervalMs NOTIFY
                   autoHidePollIntervalMsChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // IBasketModeSettings
    bool isMultiBasketEnabled() const override
    {
        return m_multiBasketEnabled;
    }
    void setMultiBasketEnabled(bool enabled) override;
    bool isPowerFoldersEnabled() const override
    {
        return m_powerFoldersEnabled;
    }
    void setPowerFoldersEnabled(bool enabled) override;

    // IAutoHideSettings
    bool isAutoHideEnabled() const override
    {
        return m_autoHideEnabled;
    }
    void setAutoHideEnabled(bool enabled) override;
    qreal autoHideDelaySeconds() const override
    {
        return m_autoHideDelaySeconds;
    }
    void setAutoHideDelaySeconds(qreal seconds) override;
    int autoHidePollIntervalMs() const override
    {
        return m_autoHidePollIntervalMs;
    }
    void setAutoHidePollIntervalMs(int intervalMs) override;

    // Persistence
    void load() override;
    void save() override;
    void reset() override;

private:
    static int readValidatedInt(const KConfigGroup& group, QLatin1String key, int defaultValue, int min, int max,
                                const char* settingName);
    static qreal readValidatedDelay(const KConfigGroup& group, QLatin1String key, qreal defaultValue,
                                    const char* settingName);

    bool m_multiBasketEnabled = true;
    bool m_powerFoldersEnabled = true;
    bool m_autoHideEnabled = false;
    qreal m_autoHideDelaySeconds = Defaults::AutoHideDelaySeconds;
    int m_autoHidePollIntervalMs = Defaults::AutoHidePollIntervalMs;
};

} // namespace PlasmaBaskets
