// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "geometryutils.h"
#include "constants.h"
#include "logging.h"

namespace PlasmaBaskets {

namespace GeometryUtils {

QRect centeredFrame(const QPoint& center, const QSize& size)
{
    return QRect(center.x() - size.width() / 2, center.y() - size.height() / 2, size.width(), size.height());
}

QRect basketFrameAt(const QPoint& center)
{
    return centeredFrame(center, QSize(Defaults::BasketWidth, Defaults::BasketHeight));
}

QVector<QPoint> revealSlotCenters(const QPoint& pointer, int count)
{
    QVector<QPoint> centers;
    if (count <= 0) {
        return centers;
    }

    const int slotWidth = Defaults::RevealSlotWidth;
    const int spacing = Defaults::RevealSlotSpacing;
    const int totalWidth = count * slotWidth + (count - 1) * spacing;
    const int startX = pointer.x() - totalWidth / 2;

    centers.reserve(count);
    for (int i = 0; i < count; ++i) {
        const int x = startX + i * (slotWidth + spacing) + slotWidth / 2;
        centers.append(QPoint(x, pointer.y()));
    }
    return centers;
}

qint64 overlapArea(const QRect& a, const QRect& b)
{
    const QRect intersection = a.intersected(b);
    if (intersection.isEmpty()) {
        return 0;
    }
    return static_cast<qint64>(intersection.width()) * intersection.height();
}

std::optional<DisplayDescriptor> resolveDisplay(const QVector<DisplayDescriptor>& displays, const DisplayQuery& query)
{
    if (displays.isEmpty()) {
        return std::nullopt;
    }

    if (query.frame.isValid()) {
        // 1. Largest overlap
        const DisplayDescriptor* best = nullptr;
        qint64 bestArea = 0;
        for (const DisplayDescriptor& display : displays) {
            const qint64 area = overlapArea(query.frame, display.frame);
            if (area > bestArea) {
                bestArea = area;
                best = &display;
            }
        }
        if (best) {
            return *best;
        }
    }

    // 2. Tracked display id, if that display is still connected
    if (!query.trackedDisplayId.isEmpty()) {
        for (const DisplayDescriptor& display : displays) {
            if (display.id == query.trackedDisplayId) {
                return display;
            }
        }
        qCDebug(lcCore) << "Tracked display" << query.trackedDisplayId << "is gone, falling back";
    }

    // 3. Display under the pointer
    for (const DisplayDescriptor& display : displays) {
        if (display.frame.contains(query.pointer)) {
            return display;
        }
    }

    // 4. Primary display
    if (!query.primaryDisplayId.isEmpty()) {
        for (const DisplayDescriptor& display : displays) {
            if (display.id == query.primaryDisplayId) {
                return display;
            }
        }
    }

    return displays.first();
}

bool shouldExpandUpward(const QRect& frame, const QRect& display)
{
    if (!display.isValid()) {
        return false;
    }
    return frame.center().y() > display.center().y();
}

} // namespace GeometryUtils

} // namespace PlasmaBaskets
