// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QColor>
#include <QMetaType>
#include <QRect>
#include <QString>

namespace PlasmaBaskets {

// ═══════════════════════════════════════════════════════════════════════════════
// Shared Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Visibility state of a basket surface
 *
 * AutoHidden keeps the surface, collection and full-size frame so the basket
 * can be restored instantly; Hidden has no materialized surface.
 */
enum class BasketVisibility {
    Hidden = 0,
    Visible = 1,
    AutoHidden = 2
};

/**
 * @brief Whether more than one basket may exist at a time
 */
enum class BasketMode {
    Single = 0,
    Multi = 1
};

/**
 * @brief Accent colors distinguishing multiple baskets
 */
enum class BasketAccentColor {
    Teal = 0,
    Coral = 1,
    Indigo = 2,
    Amber = 3,
    Rose = 4,
    Mint = 5
};

namespace AccentPalette {

constexpr int Size = 6;

/**
 * @brief Accent for a basket created when @p existingCount baskets exist
 */
inline BasketAccentColor nextColor(int existingCount)
{
    const int index = ((existingCount % Size) + Size) % Size;
    return static_cast<BasketAccentColor>(index);
}

inline QColor color(BasketAccentColor accent)
{
    switch (accent) {
    case BasketAccentColor::Teal:
        return QColor::fromHsvF(0.50f, 0.55f, 0.75f);
    case BasketAccentColor::Coral:
        return QColor::fromHsvF(0.03f, 0.55f, 0.90f);
    case BasketAccentColor::Indigo:
        return QColor::fromHsvF(0.72f, 0.50f, 0.80f);
    case BasketAccentColor::Amber:
        return QColor::fromHsvF(0.12f, 0.60f, 0.95f);
    case BasketAccentColor::Rose:
        return QColor::fromHsvF(0.92f, 0.45f, 0.85f);
    case BasketAccentColor::Mint:
        return QColor::fromHsvF(0.42f, 0.45f, 0.80f);
    }
    return QColor::fromHsvF(0.50f, 0.55f, 0.75f);
}

inline QString name(BasketAccentColor accent)
{
    switch (accent) {
    case BasketAccentColor::Teal:
        return QStringLiteral("teal");
    case BasketAccentColor::Coral:
        return QStringLiteral("coral");
    case BasketAccentColor::Indigo:
        return QStringLiteral("indigo");
    case BasketAccentColor::Amber:
        return QStringLiteral("amber");
    case BasketAccentColor::Rose:
        return QStringLiteral("rose");
    case BasketAccentColor::Mint:
        return QStringLiteral("mint");
    }
    return QStringLiteral("teal");
}

} // namespace AccentPalette

/**
 * @brief A physical display as reported by the display topology
 */
struct PLASMABASKETS_EXPORT DisplayDescriptor
{
    QString id;     ///< Stable display identifier (connector name)
    QRect frame;    ///< Full display geometry in global coordinates

    bool isValid() const
    {
        return !id.isEmpty() && frame.isValid();
    }

    bool operator==(const DisplayDescriptor&) const = default;
};

inline QString visibilityToString(BasketVisibility visibility)
{
    switch (visibility) {
    case BasketVisibility::Hidden:
        return QStringLiteral("hidden");
    case BasketVisibility::Visible:
        return QStringLiteral("visible");
    case BasketVisibility::AutoHidden:
        return QStringLiteral("autohidden");
    }
    return QStringLiteral("hidden");
}

} // namespace PlasmaBaskets

Q_DECLARE_METATYPE(PlasmaBaskets::BasketVisibility)
