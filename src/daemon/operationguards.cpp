// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "operationguards.h"
#include "../core/logging.h"

namespace PlasmaBaskets {

OperationGuards::OperationGuards(QObject* parent)
    : QObject(parent)
{
}

OperationGuards::~OperationGuards() = default;

void OperationGuards::beginFileOperation()
{
    ++m_fileOperations;
    if (m_fileOperations == 1) {
        Q_EMIT guardsChanged();
    }
}

void OperationGuards::endFileOperation()
{
    if (m_fileOperations == 0) {
        qCWarning(lcDaemon) << "endFileOperation() without a matching beginFileOperation()";
        return;
    }

    --m_fileOperations;
    if (m_fileOperations == 0) {
        Q_EMIT guardsChanged();
    }
}

void OperationGuards::setSharingInProgress(bool sharing)
{
    if (m_sharing == sharing) {
        return;
    }

    m_sharing = sharing;
    Q_EMIT guardsChanged();
}

} // namespace PlasmaBaskets
