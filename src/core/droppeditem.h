// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QDateTime>
#include <QList>
#include <QString>
#include <QUrl>
#include <QUuid>

namespace PlasmaBaskets {

/**
 * @brief A file or folder dropped into a basket
 *
 * Identity (id) is unique per dropped entry; equality for deduplication is
 * by locator (url). Items are value types and are copied freely between
 * collections (e.g. during a merge).
 */
class PLASMABASKETS_EXPORT DroppedItem
{
public:
    DroppedItem() = default;

    /**
     * @brief Create an item for a locator, probing the file system for directories
     * @param url Local file URL (or any URL for remote entries)
     * @param isTemporary true if the backing file was created by us (conversion, archive)
     */
    explicit DroppedItem(const QUrl& url, bool isTemporary = false);

    /**
     * @brief Create an item with an explicit directory flag (no file system access)
     */
    DroppedItem(const QUrl& url, bool isDirectory, bool isTemporary);

    QUuid id() const
    {
        return m_id;
    }
    QUrl url() const
    {
        return m_url;
    }
    QString name() const
    {
        return m_name;
    }
    QDateTime dateAdded() const
    {
        return m_dateAdded;
    }

    bool isDirectory() const
    {
        return m_isDirectory;
    }
    bool isTemporary() const
    {
        return m_isTemporary;
    }

    bool isPinned() const
    {
        return m_isPinned;
    }
    void setPinned(bool pinned)
    {
        m_isPinned = pinned;
    }

    bool isValid() const
    {
        return !m_id.isNull() && m_url.isValid();
    }

    /**
     * @brief Check whether the backing file still exists
     *
     * Non-local URLs are always considered present.
     */
    bool existsOnDisk() const;

    /**
     * @brief Remove the backing file if we created it
     *
     * Only files under the daemon's temporary directory are removed, so a
     * mis-flagged user file is never deleted.
     */
    void cleanupIfTemporary() const;

    /**
     * @brief Directory that holds temporary files created for basket items
     */
    static QString temporaryStorageDirectory();

    bool operator==(const DroppedItem& other) const
    {
        return m_id == other.m_id;
    }

private:
    QUuid m_id;
    QUrl m_url;
    QString m_name;
    QDateTime m_dateAdded;
    bool m_isDirectory = false;
    bool m_isTemporary = false;
    bool m_isPinned = false;
};

using DroppedItemList = QList<DroppedItem>;

} // namespace PlasmaBaskets
