// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include "settings_interfaces.h"
#include "types.h"
#include <QList>
#include <QObject>
#include <QPoint>
#include <QRect>
#include <QString>
#include <QUrl>
#include <QVector>
#include <functional>
#include <memory>

namespace PlasmaBaskets {

class BasketState;

/**
 * @brief Abstract interface for settings management
 *
 * Allows dependency inversion - components depend on this interface
 * rather than the concrete KConfig-backed Settings.
 *
 * Components that only read a value should take the segregated interface
 * (IBasketModeSettings, IAutoHideSettings) instead of the full ISettings.
 */
class PLASMABASKETS_EXPORT ISettings : public QObject, public IBasketModeSettings, public IAutoHideSettings
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // Persistence (unique to ISettings)
    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void multiBasketEnabledChanged();
    void powerFoldersEnabledChanged();
    void autoHideEnabledChanged();
    void autoHideDelaySecondsChanged();
    void autoHidePollIntervalMsChanged();
};

/**
 * @brief Input delivered by a basket surface to the basket that owns it
 *
 * Implemented by BasketController. Surfaces never change basket state
 * directly; they report what the user did and the basket decides.
 */
class PLASMABASKETS_EXPORT IBasketSurfaceEvents
{
public:
    virtual ~IBasketSurfaceEvents();

    virtual void onHoverEnter() = 0;
    virtual void onHoverExit() = 0;

    /**
     * @return true if the key was consumed as an in-surface shortcut
     */
    virtual bool handleKeyPress(int key, Qt::KeyboardModifiers modifiers) = 0;

    virtual void handleOutsideClick(const QPoint& globalPos) = 0;
    virtual void handleItemsDropped(const QList<QUrl>& urls) = 0;
    virtual void handleCloseRequested() = 0;
};

/**
 * @brief A renderable basket surface supplied by the presentation layer
 *
 * Pure interface (no QObject) so fakes in tests and the Qt Quick window
 * can both implement it. The owning BasketController holds it through a
 * std::unique_ptr.
 */
class PLASMABASKETS_EXPORT IBasketSurface
{
public:
    virtual ~IBasketSurface();

    virtual QRect frame() const = 0;
    virtual void setFrame(const QRect& frame) = 0;

    /**
     * @brief Bring the surface to the front and map it if needed
     */
    virtual void raise() = 0;

    /**
     * @brief Unmap immediately, without animation
     */
    virtual void orderOut() = 0;

    virtual bool isOnScreen() const = 0;

    /**
     * @brief Position in the on-screen z-order; higher is closer to the front
     */
    virtual int stackingOrder() const = 0;

    /**
     * @brief Whether the surface holds keyboard focus
     */
    virtual bool isActive() const = 0;

    virtual void setAccentShown(bool shown) = 0;
    virtual void setExpandUpward(bool upward) = 0;

    /**
     * @brief Fade to @p opacity (used while the chooser is shown)
     */
    virtual void fadeTo(qreal opacity, int durationMs) = 0;
};

/**
 * @brief One row of the basket chooser
 */
struct PLASMABASKETS_EXPORT SwitcherEntry
{
    QString basketId;
    BasketAccentColor accent = BasketAccentColor::Teal;
    int itemCount = 0;

    bool operator==(const SwitcherEntry&) const = default;
};

/**
 * @brief Input delivered by the chooser surface
 *
 * Implemented by BasketSwitcherController.
 */
class PLASMABASKETS_EXPORT ISwitcherEvents
{
public:
    virtual ~ISwitcherEvents();

    virtual void onSwitcherPicked(const QString& basketId) = 0;
    virtual void onSwitcherDroppedOnNewBasket(const QList<QUrl>& urls) = 0;
    virtual void onSwitcherDismissed() = 0;

    /**
     * @brief The "hide" action of one entry: put that basket away, keep its items
     */
    virtual void onSwitcherHideRequested(const QString& basketId) = 0;
};

/**
 * @brief Creates basket surfaces and drives their transitions
 *
 * The coordinator never owns animation internals. Completion callbacks are
 * delivered asynchronously on the main thread, exactly once per call, even
 * when the surface is torn down while the animation runs.
 */
class PLASMABASKETS_EXPORT IPresentationLayer
{
public:
    using Completion = std::function<void()>;

    virtual ~IPresentationLayer();

    virtual std::unique_ptr<IBasketSurface> createSurface(BasketState* state, BasketAccentColor accent,
                                                          const QRect& frame, IBasketSurfaceEvents* events) = 0;

    /**
     * @brief Map @p surface and grow it from @p initialScale to full size
     */
    virtual void animateIn(IBasketSurface* surface, qreal initialScale, int durationMs, Completion completion) = 0;

    /**
     * @brief Shrink @p surface to @p targetScale while fading out, then unmap it
     */
    virtual void animateOut(IBasketSurface* surface, qreal targetScale, int durationMs, Completion completion) = 0;

    // Chooser
    virtual void showSwitcher(const QVector<SwitcherEntry>& entries, const QPoint& at, ISwitcherEvents* events) = 0;
    virtual void hideSwitcher() = 0;

    /**
     * @brief Whether the chooser window is actually mapped
     *
     * False right after showSwitcher() when the window could not be created.
     */
    virtual bool isSwitcherShown() const = 0;

    /**
     * @brief Open a quick preview of @p urls
     */
    virtual void previewItems(const QList<QUrl>& urls) = 0;
};

/**
 * @brief External booleans that block hiding a non-empty basket
 */
class PLASMABASKETS_EXPORT IOperationGuards
{
public:
    virtual ~IOperationGuards();

    virtual bool isFileOperationInProgress() const = 0;
    virtual bool isSharingInProgress() const = 0;

    bool isBlockingHide() const
    {
        return isFileOperationInProgress() || isSharingInProgress();
    }
};

/**
 * @brief Current pointer position in global coordinates
 */
class PLASMABASKETS_EXPORT IPointerSource
{
public:
    virtual ~IPointerSource();

    virtual QPoint pointerPosition() const = 0;
};

/**
 * @brief Read-only view of the connected displays
 */
class PLASMABASKETS_EXPORT IDisplayTopology
{
public:
    virtual ~IDisplayTopology();

    virtual QVector<DisplayDescriptor> listDisplays() const = 0;

    /**
     * @brief Identifier of the session's primary display (may be empty)
     */
    virtual QString primaryDisplayId() const = 0;
};

/**
 * @brief Collaborators shared by every basket
 *
 * Held by value in BasketRegistry and handed to each BasketController it
 * creates. All pointers are non-owning and must outlive the registry.
 */
struct PLASMABASKETS_EXPORT BasketEnvironment
{
    ISettings* settings = nullptr;
    IPresentationLayer* presentation = nullptr;
    IOperationGuards* guards = nullptr;
    IPointerSource* pointer = nullptr;
    IDisplayTopology* displays = nullptr;

    bool isComplete() const
    {
        return settings && presentation && guards && pointer && displays;
    }
};

} // namespace PlasmaBaskets
