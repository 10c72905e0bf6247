// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QtGlobal>

namespace PlasmaBaskets {

// ═══════════════════════════════════════════════════════════════════════════════
// Settings Interfaces
//
// Components depend on the narrow interface they read from. Values are polled:
// the coordinator asks for the current value whenever it needs it and never
// caches it.
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief How many baskets may exist and what they hold
 */
class PLASMABASKETS_EXPORT IBasketModeSettings
{
public:
    virtual ~IBasketModeSettings() = default;

    /**
     * @brief true for Multi mode, false for Single mode
     */
    virtual bool isMultiBasketEnabled() const = 0;
    virtual void setMultiBasketEnabled(bool enabled) = 0;

    /**
     * @brief Whether directories are promoted to power folders
     */
    virtual bool isPowerFoldersEnabled() const = 0;
    virtual void setPowerFoldersEnabled(bool enabled) = 0;
};

/**
 * @brief Auto-hide behavior
 */
class PLASMABASKETS_EXPORT IAutoHideSettings
{
public:
    virtual ~IAutoHideSettings() = default;

    virtual bool isAutoHideEnabled() const = 0;
    virtual void setAutoHideEnabled(bool enabled) = 0;

    /**
     * @brief Seconds between the pointer leaving a basket and it auto-hiding
     */
    virtual qreal autoHideDelaySeconds() const = 0;
    virtual void setAutoHideDelaySeconds(qreal seconds) = 0;

    /**
     * @brief Scheduler tick interval
     */
    virtual int autoHidePollIntervalMs() const = 0;
    virtual void setAutoHidePollIntervalMs(int intervalMs) = 0;
};

} // namespace PlasmaBaskets
