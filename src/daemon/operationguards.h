// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QObject>

namespace PlasmaBaskets {

/**
 * @brief File operation and sharing flags reported by the file manager side
 *
 * File operations nest (a copy can start while another runs), so they are
 * counted. Sharing is a plain flag.
 */
class PLASMABASKETS_EXPORT OperationGuards : public QObject, public IOperationGuards
{
    Q_OBJECT

public:
    explicit OperationGuards(QObject* parent = nullptr);
    ~OperationGuards() override;

    bool isFileOperationInProgress() const override
    {
        return m_fileOperations > 0;
    }
    bool isSharingInProgress() const override
    {
        return m_sharing;
    }

    void beginFileOperation();
    void endFileOperation();
    void setSharingInProgress(bool sharing);

Q_SIGNALS:
    void guardsChanged();

private:
    int m_fileOperations = 0;
    bool m_sharing = false;
};

} // namespace PlasmaBaskets
