// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabasketsconfig.h" // Generated from plasmabaskets.kcfg via KConfigXT

namespace PlasmaBaskets {

/**
 * @brief Provides static access to default configuration values
 *
 * This class wraps the KConfigXT-generated PlasmaBasketsConfig class to
 * provide static access to default values. The .kcfg file is the single
 * source of truth for all defaults and their valid ranges.
 *
 * Usage:
 *   qreal delay = ConfigDefaults::autoHideDelay();  // Returns 2.0 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // Basket Settings
    // ═══════════════════════════════════════════════════════════════════════════

    static bool enableMultiBasket() { return instance().defaultEnableMultiBasketValue(); }
    static bool enableAutoHide() { return instance().defaultEnableAutoHideValue(); }
    static qreal autoHideDelay() { return instance().defaultAutoHideDelayValue(); }
    static bool enablePowerFolders() { return instance().defaultEnablePowerFoldersValue(); }
    static int autoHidePollIntervalMs() { return instance().defaultAutoHidePollIntervalMsValue(); }

private:
    // Lazily-initialized singleton instance
    static PlasmaBasketsConfig& instance()
    {
        static PlasmaBasketsConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace PlasmaBaskets
