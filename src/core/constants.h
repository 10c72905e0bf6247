// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>
#include <QtGlobal>

namespace PlasmaBaskets {

/**
 * @brief Structural constants for basket surfaces and transitions
 *
 * User-configurable values (auto-hide delay, poll interval, modes) live in
 * plasmabaskets.kcfg and are read through ConfigDefaults/Settings. These are
 * the fixed values the coordinator uses for geometry and animation.
 */
namespace Defaults {
// Basket surface size (centered on the requested point)
constexpr int BasketWidth = 500;
constexpr int BasketHeight = 600;

// Side-by-side reveal of hidden baskets around the pointer
constexpr int RevealSlotWidth = 220; // Collapsed basket width
constexpr int RevealSlotSpacing = 20;

// Auto-hide
constexpr int AutoHidePollIntervalMs = 200;
constexpr qreal AutoHideDelaySeconds = 2.0;
constexpr qreal MinAutoHideDelaySeconds = 0.5;
constexpr qreal MaxAutoHideDelaySeconds = 30.0;
constexpr int MinAutoHidePollIntervalMs = 50;
constexpr int MaxAutoHidePollIntervalMs = 1000;

// Drag-ended cleanup waits for the drop to settle before hiding empty baskets
constexpr int DragEndedSettleDelayMs = 300;

// Chooser opens after revealed baskets have materialized
constexpr int SwitcherAfterRevealDelayMs = 100;
}

/**
 * @brief Scale/duration pairs passed to the presentation layer
 */
namespace Motion {
constexpr qreal ShowInitialScale = 0.88;
constexpr int ShowDurationMs = 220;

constexpr qreal HideTargetScale = 0.95;
constexpr int HideDurationMs = 200;

constexpr qreal HidePreservingTargetScale = 0.96;
constexpr int HidePreservingDurationMs = 180;

constexpr qreal AutoHideTargetScale = 0.97;
constexpr int AutoHideDurationMs = 220;

constexpr int SwitcherFadeDurationMs = 200;
}

/**
 * @brief KConfig group and keys (plasmabasketsrc)
 */
namespace ConfigKeys {
inline constexpr QLatin1String ConfigFile{"plasmabasketsrc"};
inline constexpr QLatin1String BasketGroup{"Basket"};
inline constexpr QLatin1String EnableMultiBasket{"EnableMultiBasket"};
inline constexpr QLatin1String EnableAutoHide{"EnableAutoHide"};
inline constexpr QLatin1String AutoHideDelay{"AutoHideDelay"};
inline constexpr QLatin1String EnablePowerFolders{"EnablePowerFolders"};
inline constexpr QLatin1String AutoHidePollIntervalMs{"AutoHidePollIntervalMs"};
}

/**
 * @brief D-Bus service constants
 */
namespace DBus {
inline constexpr QLatin1String ServiceName{"org.plasmabaskets"};
inline constexpr QLatin1String ObjectPath{"/PlasmaBaskets"};

namespace Interface {
inline constexpr QLatin1String Basket{"org.plasmabaskets.Basket"};
}
}

} // namespace PlasmaBaskets
