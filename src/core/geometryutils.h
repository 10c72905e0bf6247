// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include "types.h"
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>
#include <QVector>
#include <optional>

namespace PlasmaBaskets {

/**
 * @brief Centralized geometry calculation utilities
 *
 * Pure functions shared by the baskets, the coordinator and the chooser.
 * Nothing here touches QScreen; displays come in as DisplayDescriptor so
 * the same code runs against the real topology and against test fakes.
 */
namespace GeometryUtils {

/**
 * @brief Frame of @p size whose center is @p center
 */
PLASMABASKETS_EXPORT QRect centeredFrame(const QPoint& center, const QSize& size);

/**
 * @brief Default basket frame centered on @p center
 */
PLASMABASKETS_EXPORT QRect basketFrameAt(const QPoint& center);

/**
 * @brief Centers of @p count side-by-side reveal slots around @p pointer
 *
 * Slots are RevealSlotWidth wide with RevealSlotSpacing between them. The
 * whole row is centered horizontally on the pointer; every slot shares the
 * pointer's y coordinate.
 */
PLASMABASKETS_EXPORT QVector<QPoint> revealSlotCenters(const QPoint& pointer, int count);

/**
 * @brief Area of the intersection of two rectangles (0 if disjoint)
 */
PLASMABASKETS_EXPORT qint64 overlapArea(const QRect& a, const QRect& b);

/**
 * @brief Inputs for resolving which display a basket belongs to
 */
struct PLASMABASKETS_EXPORT DisplayQuery
{
    QRect frame;                 ///< Basket frame (may be null for a basket never shown)
    QString trackedDisplayId;    ///< Display the basket was last materialized on
    QPoint pointer;              ///< Current pointer position
    QString primaryDisplayId;    ///< Session primary display
};

/**
 * @brief Resolve the display a basket belongs to
 *
 * Falls back through, in order: the display with the largest overlap with
 * the frame, the tracked display id, the display under the pointer, the
 * primary display, and finally the first listed display. Returns
 * std::nullopt only when @p displays is empty.
 */
PLASMABASKETS_EXPORT std::optional<DisplayDescriptor> resolveDisplay(const QVector<DisplayDescriptor>& displays,
                                                                     const DisplayQuery& query);

/**
 * @brief Whether a basket should grow upward on its display
 *
 * True when the frame's center lies in the lower half of @p display.
 */
PLASMABASKETS_EXPORT bool shouldExpandUpward(const QRect& frame, const QRect& display);

} // namespace GeometryUtils

} // namespace PlasmaBaskets
