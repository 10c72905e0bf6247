// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/basketstate.h"
#include "../core/interfaces.h"
#include "../core/types.h"
#include <QObject>
#include <QPoint>
#include <QRect>
#include <QString>
#include <memory>
#include <optional>

namespace PlasmaBaskets {

/**
 * @brief One addressable basket: a surface, its collection and its timers
 *
 * A basket is born Hidden with an empty collection. show() materializes a
 * surface through the presentation layer; hide() animates it out and drops
 * it. The auto-hide path (commitAutoHide/revealFromAutoHide) keeps the
 * surface and the full-size frame so the basket comes back instantly.
 *
 * Show/hide calls that arrive while a transition is running are dropped,
 * never queued. The flag is cleared by the presentation layer's completion
 * callback, which always fires exactly once.
 *
 * Hover notifications only move the hide deadline. The transition to
 * AutoHidden is committed by AutoHideScheduler alone.
 */
class PLASMABASKETS_EXPORT BasketController : public QObject, public IBasketSurfaceEvents
{
    Q_OBJECT

    Q_PROPERTY(QString basketId READ basketId CONSTANT)
    Q_PROPERTY(bool visible READ isVisible NOTIFY visibilityChanged)
    Q_PROPERTY(bool accentShown READ isAccentShown NOTIFY accentShownChanged)

public:
    BasketController(const QString& basketId, BasketAccentColor accent, bool isPrimary,
                     const BasketEnvironment& environment, QObject* parent = nullptr);
    ~BasketController() override;

    /**
     * @brief Monotonic milliseconds used for hide deadlines
     */
    static qint64 currentTimeMs();

    QString basketId() const
    {
        return m_basketId;
    }
    BasketAccentColor accent() const
    {
        return m_accent;
    }
    bool isPrimary() const
    {
        return m_isPrimary;
    }

    BasketState* state() const
    {
        return m_state;
    }
    bool isEmpty() const
    {
        return m_state->isEmpty();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Visibility
    // ═══════════════════════════════════════════════════════════════════════

    BasketVisibility visibility() const
    {
        return m_visibility;
    }
    bool isVisible() const
    {
        return m_visibility == BasketVisibility::Visible;
    }
    bool isAutoHidden() const
    {
        return m_visibility == BasketVisibility::AutoHidden;
    }
    bool isShowingOrHiding() const
    {
        return m_isShowingOrHiding;
    }
    bool hasSurface() const
    {
        return m_surface != nullptr;
    }
    IBasketSurface* surface() const
    {
        return m_surface.get();
    }

    /**
     * @brief Show the basket
     *
     * Already Visible: move to @p at (when given), raise and rebind monitors.
     * Otherwise materialize at @p at, at the remembered frame when
     * @p reuseLastPosition is set, at the full-size frame when coming back
     * from AutoHidden, or centered on the pointer.
     *
     * @return false if dropped because a transition is in flight
     */
    bool show(std::optional<QPoint> at = std::nullopt, bool reuseLastPosition = false);

    /**
     * @brief Hide the basket and release its surface
     *
     * Rejected (no state change) when @p force is false, the collection is
     * non-empty and a file operation or share is in progress.
     *
     * @return false if rejected or dropped
     */
    bool hide(bool force = false);

    /**
     * @brief Hide the surface but keep it, the selection and the rename state
     */
    bool hidePreservingState();

    /**
     * @brief Unmap and release everything immediately, bypassing every guard
     *
     * Used when the basket is destroyed by a merge. Stops monitors, clears
     * the deadline and the transitional flags.
     */
    void teardown();

    // ═══════════════════════════════════════════════════════════════════════
    // Auto-hide
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<qint64> hideDeadline() const
    {
        return m_hideDeadline;
    }
    void setHideDeadline(qint64 deadlineMs)
    {
        m_hideDeadline = deadlineMs;
    }

    /**
     * @brief Pointer left the basket: start the hide countdown
     *
     * Ignored when auto-hide is disabled, the collection is empty, a
     * selection drag is active or the basket is not Visible.
     */
    void requestHideTimer();
    void requestHideTimer(qint64 nowMs);

    /**
     * @brief Clear the hide deadline (idempotent)
     */
    void cancelHideTimer();

    /**
     * @brief Whether no guarded state blocks an auto-hide right now
     */
    bool canAutoHideNow() const;

    /**
     * @brief Transition Visible -> AutoHidden
     *
     * Remembers the full-size frame, animates out and stops monitors.
     * Only AutoHideScheduler calls this.
     */
    bool commitAutoHide();

    /**
     * @brief Transition AutoHidden -> Visible at the full-size frame
     */
    bool revealFromAutoHide();

    QRect fullSizeFrame() const
    {
        return m_fullSizeFrame;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Geometry
    // ═══════════════════════════════════════════════════════════════════════

    /**
     * @brief Current on-screen frame, or the last remembered one
     */
    QRect frame() const;

    QRect lastFrame() const
    {
        return m_lastFrame;
    }

    /**
     * @brief Whether @p point lies within this basket while it is on screen
     */
    bool containsPoint(const QPoint& point) const;

    QString displayId() const
    {
        return m_displayId;
    }

    /**
     * @brief Re-resolve the display this basket belongs to
     *
     * Called after every move and whenever the display topology changes, so
     * a basket whose display was disconnected falls back to another one.
     */
    void updateDisplayAffinity();
    bool shouldExpandUpward() const
    {
        return m_expandUpward;
    }

    bool isAccentShown() const
    {
        return m_accentShown;
    }
    void setAccentShown(bool shown);

    // ═══════════════════════════════════════════════════════════════════════
    // Interaction
    // ═══════════════════════════════════════════════════════════════════════

    bool isSelectionDragActive() const
    {
        return m_isSelectionDragActive;
    }
    void beginSelectionDrag();
    void endSelectionDrag();

    bool areMonitorsActive() const
    {
        return m_monitorsActive;
    }

    // IBasketSurfaceEvents
    void onHoverEnter() override;
    void onHoverExit() override;
    bool handleKeyPress(int key, Qt::KeyboardModifiers modifiers) override;
    void handleOutsideClick(const QPoint& globalPos) override;
    void handleItemsDropped(const QList<QUrl>& urls) override;
    void handleCloseRequested() override;

Q_SIGNALS:
    void visibilityChanged(PlasmaBaskets::BasketVisibility visibility);
    void accentShownChanged(bool shown);

    /**
     * @brief A show or hide animation finished and the basket accepts transitions again
     */
    void transitionFinished();

    /**
     * @brief The pointer left the surface and is not over it anymore
     *
     * The registry decides whether a sibling covers the pointer before
     * requesting the hide timer.
     */
    void hoverExited();

    void closeRequested();

private:
    enum class HideStyle {
        Release,
        Preserve
    };

    bool hideInternal(bool force, HideStyle style);
    void materialize(const QRect& frame);
    void setVisibility(BasketVisibility visibility);
    void beginTransition();
    IPresentationLayer::Completion transitionCompletion(std::function<void()> onFinished = {});
    void startMonitors();
    void stopMonitors();

    const QString m_basketId;
    const BasketAccentColor m_accent;
    const bool m_isPrimary;
    BasketEnvironment m_env;

    BasketState* m_state = nullptr; // owned (QObject child)
    std::unique_ptr<IBasketSurface> m_surface;

    BasketVisibility m_visibility = BasketVisibility::Hidden;
    bool m_isShowingOrHiding = false;
    bool m_isSelectionDragActive = false;
    bool m_monitorsActive = false;
    bool m_accentShown = false;
    bool m_expandUpward = false;

    QRect m_lastFrame;
    QRect m_fullSizeFrame;
    QString m_displayId;
    std::optional<qint64> m_hideDeadline;
    quint64 m_transitionSerial = 0;
};

} // namespace PlasmaBaskets
