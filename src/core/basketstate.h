// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "droppeditem.h"
#include "plasmabaskets_export.h"
#include <QObject>
#include <QSet>
#include <QUrl>
#include <QUuid>
#include <QVariantList>
#include <optional>

namespace PlasmaBaskets {

/**
 * @brief Ordered, identity-keyed collection of items held by one basket
 *
 * BasketState maintains:
 * - Plain items (insertion order is display order)
 * - Power folders (directories promoted to their own section)
 * - Selection (ids, with an anchor for range selection)
 * - Rename state (blocks in-surface shortcuts)
 *
 * Every basket owns exactly one BasketState. Items are deduplicated by
 * locator across both sections; selected ids always refer to held items.
 */
class PLASMABASKETS_EXPORT BasketState : public QObject
{
    Q_OBJECT

    Q_PROPERTY(int count READ count NOTIFY itemsChanged)
    Q_PROPERTY(bool empty READ isEmpty NOTIFY itemsChanged)
    Q_PROPERTY(int selectedCount READ selectedCount NOTIFY selectionChanged)
    Q_PROPERTY(bool renaming READ isRenaming WRITE setRenaming NOTIFY renamingChanged)
    Q_PROPERTY(QVariantList entries READ entries NOTIFY entriesChanged)

public:
    explicit BasketState(QObject* parent = nullptr);
    ~BasketState() override = default;

    // Prevent copying (QObject rule)
    BasketState(const BasketState&) = delete;
    BasketState& operator=(const BasketState&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Contents
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief All items: plain items followed by power folders
     */
    DroppedItemList items() const;

    /**
     * @brief All items in visual order: power folders followed by plain items
     */
    DroppedItemList visualOrder() const;

    DroppedItemList itemsList() const
    {
        return m_itemsList;
    }
    DroppedItemList powerFolders() const
    {
        return m_powerFolders;
    }

    int count() const;
    bool isEmpty() const;

    bool containsUrl(const QUrl& url) const;
    bool containsId(const QUuid& id) const;
    std::optional<DroppedItem> itemById(const QUuid& id) const;
    std::optional<DroppedItem> itemByUrl(const QUrl& url) const;

    /**
     * @brief Whether directories are routed into the power folder section
     */
    bool isPowerFoldersEnabled() const
    {
        return m_powerFoldersEnabled;
    }
    void setPowerFoldersEnabled(bool enabled)
    {
        m_powerFoldersEnabled = enabled;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Mutation
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Add a single pre-built item (keeps metadata such as isTemporary)
     * @return true if added, false if invalid or its locator is already held
     */
    bool addItem(const DroppedItem& item);

    /**
     * @brief Add items for a list of locators, skipping held locators
     * @return Number of items actually added
     */
    int addItems(const QList<QUrl>& urls);

    /**
     * @brief Remove an item and clean up its temporary backing file
     */
    bool removeItem(const QUuid& id);

    /**
     * @brief Remove an item without cleanup (item moves elsewhere)
     */
    bool removeItemForTransfer(const QUuid& id);

    /**
     * @brief Remove all items except pinned power folders
     */
    Q_INVOKABLE void clearAll();

    /**
     * @brief Replace one item in place (e.g. after a conversion)
     *
     * Selection moves from the old id to the new one.
     */
    bool replaceItem(const QUuid& oldId, const DroppedItem& newItem);

    /**
     * @brief Replace several items with one appended item (e.g. an archive)
     *
     * The new item becomes selected.
     */
    bool replaceItems(const QList<QUuid>& oldIds, const DroppedItem& newItem);

    /**
     * @brief Drop items whose local file no longer exists
     * @return Number of removed items
     */
    int validateItems();

    /**
     * @brief Flip the pin flag of an item
     * @return true if the item was found
     */
    bool togglePin(const QUuid& id);

    /**
     * @brief Merge another collection into this one
     *
     * Items whose locator is not yet held are appended (power folders to the
     * power folder section, plain items to the items section) preserving the
     * source order. Items already held keep their place; their pin flag is
     * promoted if the source copy is pinned, never demoted.
     *
     * @return Number of appended items
     */
    int mergeFrom(const BasketState& source);

    // ═══════════════════════════════════════════════════════════════════════
    // Selection
    // ═══════════════════════════════════════════════════════════════════════

    QSet<QUuid> selectedIds() const
    {
        return m_selectedIds;
    }
    int selectedCount() const
    {
        return m_selectedIds.size();
    }
    bool isSelected(const QUuid& id) const
    {
        return m_selectedIds.contains(id);
    }
    QUuid selectionAnchor() const
    {
        return m_selectionAnchor;
    }

    /**
     * @brief Selected items in visual order
     */
    DroppedItemList selectedItems() const;

    void toggleSelection(const QUuid& id);
    void select(const QUuid& id);

    /**
     * @brief Select the visual range between the anchor and @p id
     *
     * A missing or stale anchor falls back to the first selected item in
     * visual order; with no selection at all this is a plain select().
     *
     * @param additive true to extend the current selection instead of replacing it
     */
    void selectRange(const QUuid& id, bool additive = false);

    void selectAll();
    void deselectAll();

    // ═══════════════════════════════════════════════════════════════════════
    // Rename
    // ═══════════════════════════════════════════════════════════════════════

    bool isRenaming() const
    {
        return m_isRenaming;
    }
    void setRenaming(bool renaming);

    // ═══════════════════════════════════════════════════════════════════════
    // QML access
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Visual order as maps (id, url, name, isDirectory, isPinned, isPowerFolder, selected)
     */
    QVariantList entries() const;

    // Ids cross into QML as strings
    Q_INVOKABLE void toggleSelectionOf(const QString& id);
    Q_INVOKABLE void selectOnly(const QString& id);
    Q_INVOKABLE void selectRangeTo(const QString& id, bool additive);
    Q_INVOKABLE void removeEntry(const QString& id);
    Q_INVOKABLE void togglePinOf(const QString& id);

Q_SIGNALS:
    /**
     * @brief Emitted when items are added, removed, replaced or reordered
     */
    void itemsChanged();

    void selectionChanged();

    /**
     * @brief Emitted when an item's pin flag changes
     */
    void pinChanged(const QUuid& id, bool pinned);

    void renamingChanged(bool renaming);

    /**
     * @brief Emitted whenever anything shown by entries() may have changed
     */
    void entriesChanged();

private:
    bool routesToPowerFolders(const DroppedItem& item) const;
    bool removeById(const QUuid& id, bool cleanup);
    bool promotePin(const QUrl& url);

    DroppedItemList m_itemsList;
    DroppedItemList m_powerFolders;
    QSet<QUuid> m_selectedIds;
    QUuid m_selectionAnchor;
    bool m_powerFoldersEnabled = true;
    bool m_isRenaming = false;
};

} // namespace PlasmaBaskets
