// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QObject>
#include <QPoint>

namespace PlasmaBaskets {

/**
 * @brief Pointer position as last reported by the compositor
 *
 * On Wayland a background daemon cannot query the global cursor, so the
 * drag source pushes positions over D-Bus (cursorMoved). Until the first
 * report arrives, QCursor::pos() is used.
 */
class PLASMABASKETS_EXPORT PointerTracker : public QObject, public IPointerSource
{
    Q_OBJECT

public:
    explicit PointerTracker(QObject* parent = nullptr);
    ~PointerTracker() override;

    QPoint pointerPosition() const override;

    void updatePosition(const QPoint& globalPos);
    bool hasReportedPosition() const
    {
        return m_hasReportedPosition;
    }

Q_SIGNALS:
    void positionChanged(const QPoint& globalPos);

private:
    QPoint m_position;
    bool m_hasReportedPosition = false;
};

} // namespace PlasmaBaskets
