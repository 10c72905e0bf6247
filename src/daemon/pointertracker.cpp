// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointertracker.h"
#include <QCursor>

namespace PlasmaBaskets {

PointerTracker::PointerTracker(QObject* parent)
    : QObject(parent)
{
}

PointerTracker::~PointerTracker() = default;

QPoint PointerTracker::pointerPosition() const
{
    return m_hasReportedPosition ? m_position : QCursor::pos();
}

void PointerTracker::updatePosition(const QPoint& globalPos)
{
    m_hasReportedPosition = true;
    if (m_position == globalPos) {
        return;
    }

    m_position = globalPos;
    Q_EMIT positionChanged(globalPos);
}

} // namespace PlasmaBaskets
