// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "basketcontroller.h"
#include "../core/constants.h"
#include "../core/geometryutils.h"
#include "../core/logging.h"
#include <QDeadlineTimer>
#include <QPointer>

namespace PlasmaBaskets {

BasketController::BasketController(const QString& basketId, BasketAccentColor accent, bool isPrimary,
                                   const BasketEnvironment& environment, QObject* parent)
    : QObject(parent)
    , m_basketId(basketId)
    , m_accent(accent)
    , m_isPrimary(isPrimary)
    , m_env(environment)
{
    Q_ASSERT(m_env.isComplete());

    m_state = new BasketState(this);
    m_state->setPowerFoldersEnabled(m_env.settings->isPowerFoldersEnabled());
}

BasketController::~BasketController()
{
    if (m_surface) {
        m_surface->orderOut();
    }
}

qint64 BasketController::currentTimeMs()
{
    return QDeadlineTimer::current().deadline();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Visibility
// ═══════════════════════════════════════════════════════════════════════════════

bool BasketController::show(std::optional<QPoint> at, bool reuseLastPosition)
{
    if (m_isShowingOrHiding) {
        qCDebug(lcBasket) << "Show dropped, transition in flight:" << m_basketId;
        return false;
    }

    if (isVisible() && m_surface) {
        if (at) {
            const QRect frame = GeometryUtils::basketFrameAt(*at);
            m_surface->setFrame(frame);
            m_lastFrame = frame;
            updateDisplayAffinity();
        }
        m_surface->raise();
        cancelHideTimer();
        startMonitors();
        return true;
    }

    QRect frame;
    if (at) {
        frame = GeometryUtils::basketFrameAt(*at);
    } else if (isAutoHidden() && m_fullSizeFrame.isValid()) {
        frame = m_fullSizeFrame;
    } else if (reuseLastPosition && m_lastFrame.isValid()) {
        frame = m_lastFrame;
    } else {
        frame = GeometryUtils::basketFrameAt(m_env.pointer->pointerPosition());
    }

    const bool freshSurface = !m_surface;
    if (freshSurface) {
        materialize(frame);
        if (!m_surface) {
            qCWarning(lcBasket) << "Presentation layer returned no surface for" << m_basketId;
            return false;
        }
    } else {
        m_surface->setFrame(frame);
    }

    beginTransition();
    m_lastFrame = frame;
    updateDisplayAffinity();
    cancelHideTimer();
    setVisibility(BasketVisibility::Visible);
    startMonitors();

    if (freshSurface) {
        m_state->validateItems();
    }

    m_env.presentation->animateIn(m_surface.get(), Motion::ShowInitialScale, Motion::ShowDurationMs,
                                  transitionCompletion());
    qCDebug(lcBasket) << "Showing basket" << m_basketId << "at" << frame;
    return true;
}

bool BasketController::hide(bool force)
{
    return hideInternal(force, HideStyle::Release);
}

bool BasketController::hidePreservingState()
{
    return hideInternal(true, HideStyle::Preserve);
}

bool BasketController::hideInternal(bool force, HideStyle style)
{
    if (m_isShowingOrHiding) {
        qCDebug(lcBasket) << "Hide dropped, transition in flight:" << m_basketId;
        return false;
    }

    if (m_visibility == BasketVisibility::Hidden) {
        if (style == HideStyle::Release && m_surface) {
            m_surface->orderOut();
            m_surface.reset();
        }
        return true;
    }

    if (!force && !isEmpty() && m_env.guards->isBlockingHide()) {
        qCDebug(lcBasket) << "Hide rejected, file operation or share in progress:" << m_basketId;
        return false;
    }

    cancelHideTimer();
    stopMonitors();
    m_isSelectionDragActive = false;
    if (style == HideStyle::Release) {
        m_state->setRenaming(false);
    }

    const bool wasAutoHidden = isAutoHidden();
    m_lastFrame = wasAutoHidden ? m_fullSizeFrame : frame();
    setVisibility(BasketVisibility::Hidden);

    if (wasAutoHidden || !m_surface) {
        // Surface is already off screen
        if (style == HideStyle::Release) {
            m_surface.reset();
        }
        return true;
    }

    beginTransition();
    const bool release = style == HideStyle::Release;
    const qreal scale = release ? Motion::HideTargetScale : Motion::HidePreservingTargetScale;
    const int duration = release ? Motion::HideDurationMs : Motion::HidePreservingDurationMs;
    m_env.presentation->animateOut(m_surface.get(), scale, duration, transitionCompletion([this, release]() {
        if (release) {
            m_surface.reset();
        }
    }));

    qCDebug(lcBasket) << "Hiding basket" << m_basketId << (release ? "" : "(preserving state)");
    return true;
}

void BasketController::teardown()
{
    // Invalidate any completion still in flight
    ++m_transitionSerial;
    m_isShowingOrHiding = false;

    stopMonitors();
    cancelHideTimer();
    m_isSelectionDragActive = false;
    m_state->setRenaming(false);

    if (m_surface) {
        m_lastFrame = m_surface->frame();
        m_surface->orderOut();
        m_surface.reset();
    }
    setVisibility(BasketVisibility::Hidden);
}

void BasketController::materialize(const QRect& frame)
{
    m_surface = m_env.presentation->createSurface(m_state, m_accent, frame, this);
    if (m_surface) {
        m_surface->setAccentShown(m_accentShown);
    }
}

void BasketController::setVisibility(BasketVisibility visibility)
{
    if (m_visibility == visibility) {
        return;
    }

    m_visibility = visibility;
    Q_EMIT visibilityChanged(visibility);
}

void BasketController::beginTransition()
{
    ++m_transitionSerial;
    m_isShowingOrHiding = true;
}

IPresentationLayer::Completion BasketController::transitionCompletion(std::function<void()> onFinished)
{
    const quint64 serial = m_transitionSerial;
    QPointer<BasketController> self(this);
    return [self, serial, onFinished]() {
        if (!self || self->m_transitionSerial != serial) {
            return;
        }
        if (onFinished) {
            onFinished();
        }
        self->m_isShowingOrHiding = false;
        Q_EMIT self->transitionFinished();
    };
}

// ═══════════════════════════════════════════════════════════════════════════════
// Auto-hide
// ═══════════════════════════════════════════════════════════════════════════════

void BasketController::requestHideTimer()
{
    requestHideTimer(currentTimeMs());
}

void BasketController::requestHideTimer(qint64 nowMs)
{
    if (!m_env.settings->isAutoHideEnabled() || isEmpty() || m_isSelectionDragActive || !isVisible()) {
        return;
    }

    const qint64 delayMs = qRound64(m_env.settings->autoHideDelaySeconds() * 1000.0);
    m_hideDeadline = nowMs + delayMs;
    qCDebug(lcAutoHide) << "Hide deadline set for" << m_basketId << "in" << delayMs << "ms";
}

void BasketController::cancelHideTimer()
{
    m_hideDeadline.reset();
}

bool BasketController::canAutoHideNow() const
{
    return !m_isSelectionDragActive && !m_isShowingOrHiding && !m_env.guards->isBlockingHide();
}

bool BasketController::commitAutoHide()
{
    if (!isVisible() || !m_surface || m_isShowingOrHiding) {
        return false;
    }

    m_fullSizeFrame = m_surface->frame();
    m_lastFrame = m_fullSizeFrame;
    cancelHideTimer();

    beginTransition();
    setVisibility(BasketVisibility::AutoHidden);
    stopMonitors();
    m_env.presentation->animateOut(m_surface.get(), Motion::AutoHideTargetScale, Motion::AutoHideDurationMs,
                                   transitionCompletion());

    qCInfo(lcAutoHide) << "Auto-hid basket" << m_basketId;
    return true;
}

bool BasketController::revealFromAutoHide()
{
    if (!isAutoHidden()) {
        return false;
    }
    return show();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Geometry
// ═══════════════════════════════════════════════════════════════════════════════

QRect BasketController::frame() const
{
    return m_surface ? m_surface->frame() : m_lastFrame;
}

bool BasketController::containsPoint(const QPoint& point) const
{
    return isVisible() && m_surface && m_surface->frame().contains(point);
}

void BasketController::updateDisplayAffinity()
{
    GeometryUtils::DisplayQuery query;
    query.frame = m_lastFrame;
    query.trackedDisplayId = m_displayId;
    query.pointer = m_env.pointer->pointerPosition();
    query.primaryDisplayId = m_env.displays->primaryDisplayId();

    const auto display = GeometryUtils::resolveDisplay(m_env.displays->listDisplays(), query);
    if (!display) {
        return;
    }

    m_displayId = display->id;
    m_expandUpward = GeometryUtils::shouldExpandUpward(m_lastFrame, display->frame);
    if (m_surface) {
        m_surface->setExpandUpward(m_expandUpward);
    }
}

void BasketController::setAccentShown(bool shown)
{
    if (m_accentShown == shown) {
        return;
    }

    m_accentShown = shown;
    if (m_surface) {
        m_surface->setAccentShown(shown);
    }
    Q_EMIT accentShownChanged(shown);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Interaction
// ═══════════════════════════════════════════════════════════════════════════════

void BasketController::beginSelectionDrag()
{
    m_isSelectionDragActive = true;
    cancelHideTimer();
}

void BasketController::endSelectionDrag()
{
    m_isSelectionDragActive = false;
    if (!frame().contains(m_env.pointer->pointerPosition())) {
        requestHideTimer();
    }
}

void BasketController::startMonitors()
{
    m_monitorsActive = true;
}

void BasketController::stopMonitors()
{
    m_monitorsActive = false;
}

void BasketController::onHoverEnter()
{
    cancelHideTimer();
    if (isAutoHidden()) {
        revealFromAutoHide();
    }
}

void BasketController::onHoverExit()
{
    if (!isVisible()) {
        return;
    }
    if (frame().contains(m_env.pointer->pointerPosition())) {
        return;
    }
    Q_EMIT hoverExited();
}

bool BasketController::handleKeyPress(int key, Qt::KeyboardModifiers modifiers)
{
    if (!m_monitorsActive || !isVisible() || isEmpty() || m_state->isRenaming()) {
        return false;
    }

    if (key == Qt::Key_Space && (modifiers & ~Qt::KeypadModifier) == Qt::NoModifier) {
        DroppedItemList targets = m_state->selectedItems();
        if (targets.isEmpty()) {
            targets.append(m_state->visualOrder().constFirst());
        }
        QList<QUrl> urls;
        urls.reserve(targets.size());
        for (const DroppedItem& item : std::as_const(targets)) {
            urls.append(item.url());
        }
        m_env.presentation->previewItems(urls);
        return true;
    }

    if (key == Qt::Key_A && modifiers.testFlag(Qt::ControlModifier)) {
        m_state->selectAll();
        return true;
    }

    if ((key == Qt::Key_Delete || key == Qt::Key_Backspace) && modifiers == Qt::NoModifier) {
        const DroppedItemList targets = m_state->selectedItems();
        if (targets.isEmpty()) {
            return false;
        }
        for (const DroppedItem& item : targets) {
            m_state->removeItem(item.id());
        }
        qCDebug(lcBasket) << "Removed" << targets.size() << "selected items from" << m_basketId;
        return true;
    }

    return false;
}

void BasketController::handleOutsideClick(const QPoint& globalPos)
{
    if (!m_monitorsActive || !isVisible()) {
        return;
    }
    if (frame().contains(globalPos)) {
        return;
    }

    m_state->deselectAll();
    m_state->setRenaming(false);
}

void BasketController::handleItemsDropped(const QList<QUrl>& urls)
{
    if (urls.isEmpty()) {
        return;
    }

    const int added = m_state->addItems(urls);
    cancelHideTimer();
    qCDebug(lcBasket) << "Dropped" << added << "of" << urls.size() << "items on" << m_basketId;
}

void BasketController::handleCloseRequested()
{
    Q_EMIT closeRequested();
}

} // namespace PlasmaBaskets
