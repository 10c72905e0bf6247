// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketstate.h"
#include "logging.h"
#include <QVariantMap>
#include <algorithm>

namespace PlasmaBaskets {

namespace {

int indexOfId(const DroppedItemList& list, const QUuid& id)
{
    for (int i = 0; i < list.size(); ++i) {
        if (list.at(i).id() == id) {
            return i;
        }
    }
    return -1;
}

int indexOfUrl(const DroppedItemList& list, const QUrl& url)
{
    for (int i = 0; i < list.size(); ++i) {
        if (list.at(i).url() == url) {
            return i;
        }
    }
    return -1;
}

} // anonymous namespace

BasketState::BasketState(QObject* parent)
    : QObject(parent)
{
    connect(this, &BasketState::itemsChanged, this, &BasketState::entriesChanged);
    connect(this, &BasketState::selectionChanged, this, &BasketState::entriesChanged);
    connect(this, &BasketState::pinChanged, this, &BasketState::entriesChanged);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Contents
// ═══════════════════════════════════════════════════════════════════════════════

DroppedItemList BasketState::items() const
{
    return m_itemsList + m_powerFolders;
}

DroppedItemList BasketState::visualOrder() const
{
    return m_powerFolders + m_itemsList;
}

int BasketState::count() const
{
    return m_itemsList.size() + m_powerFolders.size();
}

bool BasketState::isEmpty() const
{
    return m_itemsList.isEmpty() && m_powerFolders.isEmpty();
}

bool BasketState::containsUrl(const QUrl& url) const
{
    return indexOfUrl(m_itemsList, url) >= 0 || indexOfUrl(m_powerFolders, url) >= 0;
}

bool BasketState::containsId(const QUuid& id) const
{
    return indexOfId(m_itemsList, id) >= 0 || indexOfId(m_powerFolders, id) >= 0;
}

std::optional<DroppedItem> BasketState::itemById(const QUuid& id) const
{
    int index = indexOfId(m_itemsList, id);
    if (index >= 0) {
        return m_itemsList.at(index);
    }
    index = indexOfId(m_powerFolders, id);
    if (index >= 0) {
        return m_powerFolders.at(index);
    }
    return std::nullopt;
}

std::optional<DroppedItem> BasketState::itemByUrl(const QUrl& url) const
{
    int index = indexOfUrl(m_itemsList, url);
    if (index >= 0) {
        return m_itemsList.at(index);
    }
    index = indexOfUrl(m_powerFolders, url);
    if (index >= 0) {
        return m_powerFolders.at(index);
    }
    return std::nullopt;
}

bool BasketState::routesToPowerFolders(const DroppedItem& item) const
{
    return item.isDirectory() && m_powerFoldersEnabled;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation
// ═══════════════════════════════════════════════════════════════════════════════

bool BasketState::addItem(const DroppedItem& item)
{
    if (!item.isValid() || containsUrl(item.url())) {
        return false;
    }

    if (routesToPowerFolders(item)) {
        m_powerFolders.append(item);
    } else {
        m_itemsList.append(item);
    }

    Q_EMIT itemsChanged();
    return true;
}

int BasketState::addItems(const QList<QUrl>& urls)
{
    int added = 0;
    for (const QUrl& url : urls) {
        if (!url.isValid() || containsUrl(url)) {
            continue;
        }
        const DroppedItem item(url);
        if (routesToPowerFolders(item)) {
            m_powerFolders.append(item);
        } else {
            m_itemsList.append(item);
        }
        ++added;
    }

    if (added > 0) {
        Q_EMIT itemsChanged();
    }
    return added;
}

bool BasketState::removeById(const QUuid& id, bool cleanup)
{
    int index = indexOfId(m_itemsList, id);
    DroppedItemList* list = &m_itemsList;
    if (index < 0) {
        index = indexOfId(m_powerFolders, id);
        list = &m_powerFolders;
    }
    if (index < 0) {
        return false;
    }

    if (cleanup) {
        list->at(index).cleanupIfTemporary();
    }
    list->removeAt(index);

    const bool wasSelected = m_selectedIds.remove(id);
    if (m_selectionAnchor == id) {
        m_selectionAnchor = QUuid();
    }

    Q_EMIT itemsChanged();
    if (wasSelected) {
        Q_EMIT selectionChanged();
    }
    return true;
}

bool BasketState::removeItem(const QUuid& id)
{
    return removeById(id, true);
}

bool BasketState::removeItemForTransfer(const QUuid& id)
{
    return removeById(id, false);
}

void BasketState::clearAll()
{
    if (isEmpty()) {
        return;
    }

    for (const DroppedItem& item : std::as_const(m_itemsList)) {
        item.cleanupIfTemporary();
    }
    m_itemsList.clear();

    DroppedItemList pinned;
    for (const DroppedItem& folder : std::as_const(m_powerFolders)) {
        if (folder.isPinned()) {
            pinned.append(folder);
        } else {
            folder.cleanupIfTemporary();
        }
    }
    m_powerFolders = pinned;

    const bool hadSelection = !m_selectedIds.isEmpty();
    m_selectedIds.clear();
    m_selectionAnchor = QUuid();

    Q_EMIT itemsChanged();
    if (hadSelection) {
        Q_EMIT selectionChanged();
    }
}

bool BasketState::replaceItem(const QUuid& oldId, const DroppedItem& newItem)
{
    if (!newItem.isValid()) {
        return false;
    }

    int index = indexOfId(m_itemsList, oldId);
    DroppedItemList* list = &m_itemsList;
    if (index < 0) {
        index = indexOfId(m_powerFolders, oldId);
        list = &m_powerFolders;
    }
    if (index < 0) {
        return false;
    }

    (*list)[index] = newItem;

    const bool wasSelected = m_selectedIds.remove(oldId);
    if (wasSelected) {
        m_selectedIds.insert(newItem.id());
    }
    if (m_selectionAnchor == oldId) {
        m_selectionAnchor = newItem.id();
    }

    Q_EMIT itemsChanged();
    if (wasSelected) {
        Q_EMIT selectionChanged();
    }
    return true;
}

bool BasketState::replaceItems(const QList<QUuid>& oldIds, const DroppedItem& newItem)
{
    if (!newItem.isValid()) {
        return false;
    }

    const QSet<QUuid> toRemove(oldIds.cbegin(), oldIds.cend());
    auto matches = [&toRemove](const DroppedItem& item) {
        return toRemove.contains(item.id());
    };
    m_itemsList.removeIf(matches);
    m_powerFolders.removeIf(matches);

    if (!containsUrl(newItem.url())) {
        if (routesToPowerFolders(newItem)) {
            m_powerFolders.append(newItem);
        } else {
            m_itemsList.append(newItem);
        }
    }

    m_selectedIds.subtract(toRemove);
    if (containsId(newItem.id())) {
        m_selectedIds.insert(newItem.id());
    }
    if (toRemove.contains(m_selectionAnchor)) {
        m_selectionAnchor = QUuid();
    }

    Q_EMIT itemsChanged();
    Q_EMIT selectionChanged();
    return true;
}

int BasketState::validateItems()
{
    QList<QUuid> ghosts;
    for (const DroppedItem& item : items()) {
        if (!item.existsOnDisk()) {
            ghosts.append(item.id());
        }
    }

    for (const QUuid& id : std::as_const(ghosts)) {
        removeItem(id);
    }

    if (!ghosts.isEmpty()) {
        qCInfo(lcCore) << "Removed" << ghosts.size() << "items whose files no longer exist";
    }
    return ghosts.size();
}

bool BasketState::togglePin(const QUuid& id)
{
    int index = indexOfId(m_itemsList, id);
    DroppedItemList* list = &m_itemsList;
    if (index < 0) {
        index = indexOfId(m_powerFolders, id);
        list = &m_powerFolders;
    }
    if (index < 0) {
        return false;
    }

    DroppedItem& item = (*list)[index];
    item.setPinned(!item.isPinned());
    Q_EMIT pinChanged(id, item.isPinned());
    Q_EMIT itemsChanged();
    return true;
}

bool BasketState::promotePin(const QUrl& url)
{
    int index = indexOfUrl(m_powerFolders, url);
    DroppedItemList* list = &m_powerFolders;
    if (index < 0) {
        index = indexOfUrl(m_itemsList, url);
        list = &m_itemsList;
    }
    if (index < 0) {
        return false;
    }

    DroppedItem& item = (*list)[index];
    if (item.isPinned()) {
        return false;
    }
    item.setPinned(true);
    Q_EMIT pinChanged(item.id(), true);
    return true;
}

int BasketState::mergeFrom(const BasketState& source)
{
    if (&source == this) {
        return 0;
    }

    QSet<QUrl> existing;
    for (const DroppedItem& item : items()) {
        existing.insert(item.url());
    }

    int appended = 0;
    bool promoted = false;

    auto mergeSection = [&](const DroppedItemList& sourceSection, DroppedItemList& destinationSection) {
        for (const DroppedItem& item : sourceSection) {
            if (existing.contains(item.url())) {
                if (item.isPinned()) {
                    promoted = promotePin(item.url()) || promoted;
                }
                continue;
            }
            destinationSection.append(item);
            existing.insert(item.url());
            ++appended;
        }
    };

    mergeSection(source.m_powerFolders, m_powerFolders);
    mergeSection(source.m_itemsList, m_itemsList);

    if (appended > 0 || promoted) {
        Q_EMIT itemsChanged();
    }
    return appended;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Selection
// ═══════════════════════════════════════════════════════════════════════════════

DroppedItemList BasketState::selectedItems() const
{
    DroppedItemList selected;
    for (const DroppedItem& item : visualOrder()) {
        if (m_selectedIds.contains(item.id())) {
            selected.append(item);
        }
    }
    return selected;
}

void BasketState::toggleSelection(const QUuid& id)
{
    if (!containsId(id)) {
        return;
    }

    m_selectionAnchor = id;
    if (!m_selectedIds.remove(id)) {
        m_selectedIds.insert(id);
    }
    Q_EMIT selectionChanged();
}

void BasketState::select(const QUuid& id)
{
    if (!containsId(id)) {
        return;
    }

    m_selectionAnchor = id;
    m_selectedIds = {id};
    Q_EMIT selectionChanged();
}

void BasketState::selectRange(const QUuid& id, bool additive)
{
    const DroppedItemList ordered = visualOrder();
    const int targetIndex = indexOfId(ordered, id);
    if (targetIndex < 0) {
        return;
    }

    // Finder-style fallback: a missing or stale anchor resolves to the first
    // selected item in visual order
    QUuid anchor;
    if (!m_selectionAnchor.isNull() && indexOfId(ordered, m_selectionAnchor) >= 0) {
        anchor = m_selectionAnchor;
    } else {
        for (const DroppedItem& item : ordered) {
            if (m_selectedIds.contains(item.id())) {
                anchor = item.id();
                break;
            }
        }
    }

    if (anchor.isNull()) {
        select(id);
        return;
    }

    m_selectionAnchor = anchor;
    const int anchorIndex = indexOfId(ordered, anchor);
    const int start = std::min(anchorIndex, targetIndex);
    const int end = std::max(anchorIndex, targetIndex);

    if (!additive) {
        m_selectedIds.clear();
    }
    for (int i = start; i <= end; ++i) {
        m_selectedIds.insert(ordered.at(i).id());
    }
    Q_EMIT selectionChanged();
}

void BasketState::selectAll()
{
    const DroppedItemList ordered = visualOrder();
    m_selectedIds.clear();
    for (const DroppedItem& item : ordered) {
        m_selectedIds.insert(item.id());
    }

    if (m_selectionAnchor.isNull() || indexOfId(ordered, m_selectionAnchor) < 0) {
        m_selectionAnchor = ordered.isEmpty() ? QUuid() : ordered.first().id();
    }
    Q_EMIT selectionChanged();
}

void BasketState::deselectAll()
{
    if (m_selectedIds.isEmpty() && m_selectionAnchor.isNull()) {
        return;
    }

    m_selectedIds.clear();
    m_selectionAnchor = QUuid();
    Q_EMIT selectionChanged();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Rename
// ═══════════════════════════════════════════════════════════════════════════════

void BasketState::setRenaming(bool renaming)
{
    if (m_isRenaming == renaming) {
        return;
    }

    m_isRenaming = renaming;
    Q_EMIT renamingChanged(renaming);
}

// ═══════════════════════════════════════════════════════════════════════════════
// QML access
// ═══════════════════════════════════════════════════════════════════════════════

QVariantList BasketState::entries() const
{
    QVariantList result;
    const DroppedItemList ordered = visualOrder();
    result.reserve(ordered.size());
    for (const DroppedItem& item : ordered) {
        QVariantMap entry;
        entry[QStringLiteral("id")] = item.id().toString();
        entry[QStringLiteral("url")] = item.url();
        entry[QStringLiteral("name")] = item.name();
        entry[QStringLiteral("isDirectory")] = item.isDirectory();
        entry[QStringLiteral("isPinned")] = item.isPinned();
        entry[QStringLiteral("isPowerFolder")] = indexOfId(m_powerFolders, item.id()) >= 0;
        entry[QStringLiteral("selected")] = m_selectedIds.contains(item.id());
        result.append(entry);
    }
    return result;
}

void BasketState::toggleSelectionOf(const QString& id)
{
    toggleSelection(QUuid::fromString(id));
}

void BasketState::selectOnly(const QString& id)
{
    select(QUuid::fromString(id));
}

void BasketState::selectRangeTo(const QString& id, bool additive)
{
    selectRange(QUuid::fromString(id), additive);
}

void BasketState::removeEntry(const QString& id)
{
    if (!removeItem(QUuid::fromString(id))) {
        qCDebug(lcBasket) << "Remove requested for unknown item" << id;
    }
}

void BasketState::togglePinOf(const QString& id)
{
    togglePin(QUuid::fromString(id));
}

} // namespace PlasmaBaskets
