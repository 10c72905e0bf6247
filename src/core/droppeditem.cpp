// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "droppeditem.h"
#include "logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

namespace PlasmaBaskets {

DroppedItem::DroppedItem(const QUrl& url, bool isTemporary)
    : DroppedItem(url, url.isLocalFile() && QFileInfo(url.toLocalFile()).isDir(), isTemporary)
{
}

DroppedItem::DroppedItem(const QUrl& url, bool isDirectory, bool isTemporary)
    : m_id(QUuid::createUuid())
    , m_url(url)
    , m_name(url.fileName())
    , m_dateAdded(QDateTime::currentDateTime())
    , m_isDirectory(isDirectory)
    , m_isTemporary(isTemporary)
{
    if (m_name.isEmpty()) {
        // Directory URLs with a trailing slash have no fileName()
        m_name = QFileInfo(url.adjusted(QUrl::StripTrailingSlash).path()).fileName();
    }
}

bool DroppedItem::existsOnDisk() const
{
    if (!m_url.isLocalFile()) {
        return true;
    }
    return QFileInfo::exists(m_url.toLocalFile());
}

QString DroppedItem::temporaryStorageDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + QStringLiteral("/plasmabaskets");
}

void DroppedItem::cleanupIfTemporary() const
{
    if (!m_isTemporary || !m_url.isLocalFile()) {
        return;
    }

    const QString path = QFileInfo(m_url.toLocalFile()).absoluteFilePath();
    const QString storage = QDir(temporaryStorageDirectory()).absolutePath() + QLatin1Char('/');
    if (!path.startsWith(storage)) {
        qCWarning(lcCore) << "Refusing to remove temporary item outside storage directory:" << path;
        return;
    }

    const QFileInfo info(path);
    bool removed = false;
    if (info.isDir()) {
        removed = QDir(path).removeRecursively();
    } else if (info.exists()) {
        removed = QFile::remove(path);
    } else {
        return;
    }

    if (!removed) {
        qCWarning(lcCore) << "Failed to remove temporary item:" << path;
    } else {
        qCDebug(lcCore) << "Removed temporary item:" << path;
    }
}

} // namespace PlasmaBaskets
