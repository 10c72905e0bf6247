// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <QPointer>
#include <QString>
#include <QVariantMap>
#include <memory>

#include "../core/interfaces.h"

class QQmlEngine;
class QQuickWindow;
class QScreen;

namespace PlasmaBaskets {

/**
 * @brief Qt Quick presentation layer for baskets and the chooser
 *
 * Every basket gets its own QQuickWindow loaded from qrc:/ui/Basket.qml and
 * configured through LayerShellQt as a floating layer surface. Transitions
 * animate the window's opacity and the QML root's contentScale; their
 * completion callbacks are always delivered from the event loop, never
 * from inside animateIn/animateOut, and still fire when the surface is
 * destroyed mid-animation.
 */
class PLASMABASKETS_EXPORT OverlayService : public QObject, public IPresentationLayer
{
    Q_OBJECT

public:
    explicit OverlayService(QObject* parent = nullptr);
    ~OverlayService() override;

    // IPresentationLayer
    std::unique_ptr<IBasketSurface> createSurface(BasketState* state, BasketAccentColor accent, const QRect& frame,
                                                  IBasketSurfaceEvents* events) override;
    void animateIn(IBasketSurface* surface, qreal initialScale, int durationMs, Completion completion) override;
    void animateOut(IBasketSurface* surface, qreal targetScale, int durationMs, Completion completion) override;

    void showSwitcher(const QVector<SwitcherEntry>& entries, const QPoint& at, ISwitcherEvents* events) override;
    void hideSwitcher() override;
    bool isSwitcherShown() const override;

    void previewItems(const QList<QUrl>& urls) override;

    /**
     * @brief Next value for a raised surface's stacking order
     */
    int nextStackingOrder()
    {
        return ++m_stackingCounter;
    }

    QQuickWindow* createQmlWindow(const QUrl& qmlUrl, QScreen* screen, const char* windowType,
                                  const QVariantMap& initialProperties = {});

private Q_SLOTS:
    void onSwitcherPicked(const QString& basketId);
    void onSwitcherDroppedOnNewBasket(const QVariant& urls);
    void onSwitcherDismissed();
    void onSwitcherHideRequested(const QString& basketId);

private:
    void createSwitcherWindow(QScreen* screen);

    std::unique_ptr<QQmlEngine> m_engine;
    QPointer<QQuickWindow> m_switcherWindow;
    ISwitcherEvents* m_switcherEvents = nullptr;
    int m_stackingCounter = 0;
};

} // namespace PlasmaBaskets
