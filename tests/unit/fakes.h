// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QList>
#include <QPoint>
#include <QRect>
#include <QStringList>
#include <QVector>
#include <memory>

#include "core/interfaces.h"

namespace PlasmaBaskets {

// ═══════════════════════════════════════════════════════════════════════════════
// In-memory collaborators shared by the controller tests
// ═══════════════════════════════════════════════════════════════════════════════

class FakeSettings : public ISettings
{
public:
    bool isMultiBasketEnabled() const override
    {
        return m_multi;
    }
    void setMultiBasketEnabled(bool enabled) override
    {
        if (m_multi != enabled) {
            m_multi = enabled;
            Q_EMIT multiBasketEnabledChanged();
            Q_EMIT settingsChanged();
        }
    }
    bool isPowerFoldersEnabled() const override
    {
        return m_powerFolders;
    }
    void setPowerFoldersEnabled(bool enabled) override
    {
        if (m_powerFolders != enabled) {
            m_powerFolders = enabled;
            Q_EMIT powerFoldersEnabledChanged();
            Q_EMIT settingsChanged();
        }
    }
    bool isAutoHideEnabled() const override
    {
        return m_autoHide;
    }
    void setAutoHideEnabled(bool enabled) override
    {
        if (m_autoHide != enabled) {
            m_autoHide = enabled;
            Q_EMIT autoHideEnabledChanged();
            Q_EMIT settingsChanged();
        }
    }
    qreal autoHideDelaySeconds() const override
    {
        return m_delay;
    }
    void setAutoHideDelaySeconds(qreal seconds) override
    {
        m_delay = seconds;
        Q_EMIT autoHideDelaySecondsChanged();
        Q_EMIT settingsChanged();
    }
    int autoHidePollIntervalMs() const override
    {
        return m_pollMs;
    }
    void setAutoHidePollIntervalMs(int intervalMs) override
    {
        m_pollMs = intervalMs;
        Q_EMIT autoHidePollIntervalMsChanged();
        Q_EMIT settingsChanged();
    }

    void load() override
    {
        ++loadCount;
    }
    void save() override
    {
        ++saveCount;
    }
    void reset() override
    {
        ++resetCount;
    }

    int loadCount = 0;
    int saveCount = 0;
    int resetCount = 0;

private:
    bool m_multi = true;
    bool m_powerFolders = true;
    bool m_autoHide = false;
    qreal m_delay = 1.0;
    int m_pollMs = 200;
};

class FakePresentationLayer;

class FakeSurface : public IBasketSurface
{
public:
    FakeSurface(FakePresentationLayer* layer, const QRect& frame, IBasketSurfaceEvents* events)
        : m_layer(layer)
        , m_frame(frame)
        , m_events(events)
    {
    }

    QRect frame() const override
    {
        return m_frame;
    }
    void setFrame(const QRect& frame) override
    {
        m_frame = frame;
    }
    void raise() override;
    void orderOut() override
    {
        m_onScreen = false;
    }
    bool isOnScreen() const override
    {
        return m_onScreen;
    }
    int stackingOrder() const override
    {
        return m_onScreen ? m_stackingOrder : -1;
    }
    bool isActive() const override
    {
        return false;
    }
    void setAccentShown(bool shown) override
    {
        accentShown = shown;
    }
    void setExpandUpward(bool upward) override
    {
        expandUpward = upward;
    }
    void fadeTo(qreal opacity, int /*durationMs*/) override
    {
        this->opacity = opacity;
    }

    IBasketSurfaceEvents* events() const
    {
        return m_events;
    }

    bool accentShown = false;
    bool expandUpward = false;
    qreal opacity = 1.0;

private:
    friend class FakePresentationLayer;

    FakePresentationLayer* m_layer;
    QRect m_frame;
    IBasketSurfaceEvents* m_events;
    bool m_onScreen = false;
    int m_stackingOrder = -1;
};

/**
 * @brief Presentation layer whose animations finish only when told to
 */
class FakePresentationLayer : public IPresentationLayer
{
public:
    std::unique_ptr<IBasketSurface> createSurface(BasketState* /*state*/, BasketAccentColor /*accent*/,
                                                  const QRect& frame, IBasketSurfaceEvents* events) override
    {
        ++surfacesCreated;
        if (failSurfaceCreation) {
            return nullptr;
        }
        return std::make_unique<FakeSurface>(this, frame, events);
    }

    void animateIn(IBasketSurface* surface, qreal initialScale, int /*durationMs*/, Completion completion) override
    {
        ++animateInCount;
        lastInitialScale = initialScale;
        surface->raise();
        m_pending.append(std::move(completion));
    }

    void animateOut(IBasketSurface* surface, qreal targetScale, int /*durationMs*/, Completion completion) override
    {
        ++animateOutCount;
        lastTargetScale = targetScale;
        surface->orderOut();
        m_pending.append(std::move(completion));
    }

    void showSwitcher(const QVector<SwitcherEntry>& entries, const QPoint& at, ISwitcherEvents* events) override
    {
        ++switcherShowCount;
        switcherEntries = entries;
        switcherAt = at;
        if (failSwitcherWindow) {
            return;
        }
        switcherEvents = events;
        m_switcherShown = true;
    }
    void hideSwitcher() override
    {
        ++switcherHideCount;
        m_switcherShown = false;
        switcherEvents = nullptr;
    }
    bool isSwitcherShown() const override
    {
        return m_switcherShown;
    }

    void previewItems(const QList<QUrl>& urls) override
    {
        previewed = urls;
    }

    int nextStackingOrder()
    {
        return ++m_stackingCounter;
    }

    int pendingCompletions() const
    {
        return m_pending.size();
    }

    /**
     * @brief Finish every animation started so far, each exactly once
     */
    void completeAll()
    {
        while (!m_pending.isEmpty()) {
            Completion completion = m_pending.takeFirst();
            if (completion) {
                completion();
            }
        }
    }

    bool failSurfaceCreation = false;
    bool failSwitcherWindow = false;
    int surfacesCreated = 0;
    int animateInCount = 0;
    int animateOutCount = 0;
    qreal lastInitialScale = 0.0;
    qreal lastTargetScale = 0.0;
    int switcherShowCount = 0;
    int switcherHideCount = 0;
    QVector<SwitcherEntry> switcherEntries;
    QPoint switcherAt;
    ISwitcherEvents* switcherEvents = nullptr;
    QList<QUrl> previewed;

private:
    QList<Completion> m_pending;
    bool m_switcherShown = false;
    int m_stackingCounter = 0;
};

inline void FakeSurface::raise()
{
    m_onScreen = true;
    m_stackingOrder = m_layer->nextStackingOrder();
}

class FakeGuards : public IOperationGuards
{
public:
    bool isFileOperationInProgress() const override
    {
        return fileOperation;
    }
    bool isSharingInProgress() const override
    {
        return sharing;
    }

    bool fileOperation = false;
    bool sharing = false;
};

class FakePointer : public IPointerSource
{
public:
    QPoint pointerPosition() const override
    {
        return position;
    }

    QPoint position{500, 500};
};

class FakeDisplays : public IDisplayTopology
{
public:
    QVector<DisplayDescriptor> listDisplays() const override
    {
        return displays;
    }
    QString primaryDisplayId() const override
    {
        return primaryId;
    }

    QVector<DisplayDescriptor> displays{DisplayDescriptor{QStringLiteral("DP-1"), QRect(0, 0, 1920, 1080)}};
    QString primaryId = QStringLiteral("DP-1");
};

/**
 * @brief All fakes wired into one BasketEnvironment
 */
struct FakeEnvironment
{
    FakeSettings settings;
    FakePresentationLayer presentation;
    FakeGuards guards;
    FakePointer pointer;
    FakeDisplays displays;

    BasketEnvironment environment()
    {
        BasketEnvironment env;
        env.settings = &settings;
        env.presentation = &presentation;
        env.guards = &guards;
        env.pointer = &pointer;
        env.displays = &displays;
        return env;
    }
};

} // namespace PlasmaBaskets
