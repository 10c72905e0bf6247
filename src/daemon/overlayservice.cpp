// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "overlayservice.h"
#include "../core/basketstate.h"
#include "../core/geometryutils.h"
#include "../core/logging.h"

#include <QCoreApplication>
#include <QCursor>
#include <QDesktopServices>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QParallelAnimationGroup>
#include <QPropertyAnimation>
#include <QQmlComponent>
#include <QQmlContext>
#include <QQmlEngine>
#include <QQuickWindow>
#include <QScreen>
#include <QTimer>
#include <KLocalizedContext>

#include <LayerShellQt/Window>

namespace PlasmaBaskets {

namespace {

QScreen* screenForFrame(const QRect& frame)
{
    QScreen* screen = QGuiApplication::screenAt(frame.center());
    return screen ? screen : QGuiApplication::primaryScreen();
}

// Position a layer window at a global frame using top/left anchors and margins
void placeLayerWindow(QQuickWindow* window, const QRect& frame)
{
    if (!window) {
        return;
    }

    QScreen* screen = screenForFrame(frame);
    if (screen && window->screen() != screen) {
        window->setScreen(screen);
    }

    window->setWidth(frame.width());
    window->setHeight(frame.height());

    if (auto* layerWindow = LayerShellQt::Window::get(window)) {
        const QRect screenGeom = screen ? screen->geometry() : QRect();
        layerWindow->setAnchors(
            LayerShellQt::Window::Anchors(LayerShellQt::Window::AnchorTop | LayerShellQt::Window::AnchorLeft));
        layerWindow->setMargins(QMargins(frame.x() - screenGeom.x(), frame.y() - screenGeom.y(), 0, 0));
    } else {
        window->setPosition(frame.topLeft());
    }
}

// Completions run from the event loop with the application as context so they
// outlive the surface that started them
void deliverLater(IPresentationLayer::Completion completion)
{
    if (!completion) {
        return;
    }
    QTimer::singleShot(0, QCoreApplication::instance(), std::move(completion));
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// BasketSurface
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief One basket window
 *
 * Exposed to Basket.qml as the "surface" property so QML can report drops
 * and close requests back to the owning basket.
 */
class BasketSurface : public QObject, public IBasketSurface
{
    Q_OBJECT

public:
    BasketSurface(OverlayService* service, IBasketSurfaceEvents* events, const QRect& frame)
        : m_service(service)
        , m_events(events)
        , m_frame(frame)
    {
    }

    ~BasketSurface() override
    {
        finishPendingAnimation();
        if (m_window) {
            m_window->removeEventFilter(this);
            m_window->close();
            m_window->deleteLater();
        }
    }

    void attachWindow(QQuickWindow* window)
    {
        m_window = window;
        m_window->installEventFilter(this);
        placeLayerWindow(m_window, m_frame);
    }

    Q_INVOKABLE void dropUrls(const QList<QUrl>& urls)
    {
        m_events->handleItemsDropped(urls);
    }

    Q_INVOKABLE void requestClose()
    {
        m_events->handleCloseRequested();
    }

    // IBasketSurface
    QRect frame() const override
    {
        return m_frame;
    }

    void setFrame(const QRect& frame) override
    {
        m_frame = frame;
        placeLayerWindow(m_window, m_frame);
    }

    void raise() override
    {
        m_stackingOrder = m_service->nextStackingOrder();
        if (m_window) {
            m_window->setVisible(true);
            m_window->raise();
            m_window->requestActivate();
        }
    }

    void orderOut() override
    {
        finishPendingAnimation();
        if (m_window) {
            m_window->setVisible(false);
        }
    }

    bool isOnScreen() const override
    {
        return m_window && m_window->isVisible();
    }

    int stackingOrder() const override
    {
        return isOnScreen() ? m_stackingOrder : -1;
    }

    bool isActive() const override
    {
        return m_window && m_window->isActive();
    }

    void setAccentShown(bool shown) override
    {
        if (m_window) {
            m_window->setProperty("accentShown", shown);
        }
    }

    void setExpandUpward(bool upward) override
    {
        if (m_window) {
            m_window->setProperty("expandUpward", upward);
        }
    }

    void fadeTo(qreal opacity, int durationMs) override
    {
        if (!m_window) {
            return;
        }
        auto* fade = new QPropertyAnimation(m_window, "opacity", this);
        fade->setDuration(durationMs);
        fade->setEndValue(opacity);
        fade->setEasingCurve(QEasingCurve::OutCubic);
        fade->start(QAbstractAnimation::DeleteWhenStopped);
    }

    void runTransition(qreal fromScale, qreal toScale, qreal toOpacity, int durationMs, bool unmapAtEnd,
                       IPresentationLayer::Completion completion)
    {
        finishPendingAnimation();
        m_pendingCompletion = std::move(completion);

        if (!m_window) {
            deliverLater(std::exchange(m_pendingCompletion, nullptr));
            return;
        }

        if (!unmapAtEnd) {
            m_window->setOpacity(0.0);
            raise();
        }

        auto* group = new QParallelAnimationGroup(this);

        auto* scale = new QPropertyAnimation(m_window, "contentScale", group);
        scale->setDuration(durationMs);
        scale->setStartValue(fromScale);
        scale->setEndValue(toScale);
        scale->setEasingCurve(unmapAtEnd ? QEasingCurve::InCubic : QEasingCurve::OutBack);

        auto* fade = new QPropertyAnimation(m_window, "opacity", group);
        fade->setDuration(durationMs);
        fade->setEndValue(toOpacity);

        group->addAnimation(scale);
        group->addAnimation(fade);

        connect(group, &QAbstractAnimation::finished, this, [this, unmapAtEnd]() {
            m_animation = nullptr;
            if (unmapAtEnd && m_window) {
                m_window->setVisible(false);
                m_window->setProperty("contentScale", 1.0);
            }
            deliverLater(std::exchange(m_pendingCompletion, nullptr));
        });

        m_animation = group;
        group->start(QAbstractAnimation::DeleteWhenStopped);
    }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override
    {
        if (watched != m_window) {
            return QObject::eventFilter(watched, event);
        }

        switch (event->type()) {
        case QEvent::Enter:
            m_events->onHoverEnter();
            break;
        case QEvent::Leave:
            m_events->onHoverExit();
            break;
        case QEvent::KeyPress: {
            auto* keyEvent = static_cast<QKeyEvent*>(event);
            if (m_events->handleKeyPress(keyEvent->key(), keyEvent->modifiers())) {
                return true;
            }
            break;
        }
        case QEvent::FocusOut:
            // Layer surfaces do not see clicks elsewhere; losing focus is the closest signal
            m_events->handleOutsideClick(QCursor::pos());
            break;
        default:
            break;
        }
        return QObject::eventFilter(watched, event);
    }

private:
    void finishPendingAnimation()
    {
        if (m_animation) {
            disconnect(m_animation, nullptr, this, nullptr);
            m_animation->stop();
            m_animation = nullptr;
        }
        deliverLater(std::exchange(m_pendingCompletion, nullptr));
    }

    OverlayService* m_service = nullptr;
    IBasketSurfaceEvents* m_events = nullptr;
    QPointer<QQuickWindow> m_window;
    QPointer<QAbstractAnimation> m_animation;
    IPresentationLayer::Completion m_pendingCompletion;
    QRect m_frame;
    int m_stackingOrder = -1;
};

// ═══════════════════════════════════════════════════════════════════════════════
// OverlayService
// ═══════════════════════════════════════════════════════════════════════════════

OverlayService::OverlayService(QObject* parent)
    : QObject(parent)
    , m_engine(std::make_unique<QQmlEngine>()) // No parent - unique_ptr manages lifetime
{
    // Set up i18n for QML (makes i18n() available in QML)
    KLocalizedContext* localizedContext = new KLocalizedContext(m_engine.get());
    m_engine->rootContext()->setContextObject(localizedContext);
}

OverlayService::~OverlayService()
{
    if (m_switcherWindow) {
        m_switcherWindow->close();
        delete m_switcherWindow;
    }

    // Process pending deletions before destroying the QML engine.
    // All deleteLater() calls must complete while the engine is still valid.
    QCoreApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
}

QQuickWindow* OverlayService::createQmlWindow(const QUrl& qmlUrl, QScreen* screen, const char* windowType,
                                              const QVariantMap& initialProperties)
{
    if (!screen) {
        qCWarning(lcPresentation) << "Screen is null for" << windowType;
        return nullptr;
    }

    QQmlComponent component(m_engine.get(), qmlUrl);

    if (component.isError()) {
        qCWarning(lcPresentation) << "Failed to load" << windowType << "QML:" << component.errors();
        return nullptr;
    }

    if (component.status() != QQmlComponent::Ready) {
        qCWarning(lcPresentation) << windowType << "QML component not ready, status:" << component.status();
        return nullptr;
    }

    QObject* obj = initialProperties.isEmpty() ? component.create()
                                               : component.createWithInitialProperties(initialProperties);
    if (!obj) {
        qCWarning(lcPresentation) << "Failed to create" << windowType << "window:" << component.errors();
        return nullptr;
    }

    auto* window = qobject_cast<QQuickWindow*>(obj);
    if (!window) {
        qCWarning(lcPresentation) << "Created object is not a QQuickWindow for" << windowType;
        obj->deleteLater();
        return nullptr;
    }

    // Take C++ ownership so QML's GC doesn't delete the window
    QQmlEngine::setObjectOwnership(window, QQmlEngine::CppOwnership);

    // Set the screen before configuring LayerShellQt
    window->setScreen(screen);

    return window;
}

std::unique_ptr<IBasketSurface> OverlayService::createSurface(BasketState* state, BasketAccentColor accent,
                                                              const QRect& frame, IBasketSurfaceEvents* events)
{
    auto surface = std::make_unique<BasketSurface>(this, events, frame);

    QVariantMap properties;
    properties[QStringLiteral("surface")] = QVariant::fromValue(static_cast<QObject*>(surface.get()));
    properties[QStringLiteral("basketState")] = QVariant::fromValue(static_cast<QObject*>(state));
    properties[QStringLiteral("accentColor")] = AccentPalette::color(accent);

    QScreen* screen = screenForFrame(frame);
    auto* window = createQmlWindow(QUrl(QStringLiteral("qrc:/ui/Basket.qml")), screen, "basket", properties);
    if (!window) {
        return nullptr;
    }

    if (auto* layerWindow = LayerShellQt::Window::get(window)) {
        layerWindow->setScreen(screen);
        layerWindow->setLayer(LayerShellQt::Window::LayerTop);
        layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityOnDemand);
        layerWindow->setScope(QStringLiteral("plasmabaskets-basket"));
        layerWindow->setExclusiveZone(-1);
    }

    window->setVisible(false);
    surface->attachWindow(window);
    return surface;
}

void OverlayService::animateIn(IBasketSurface* surface, qreal initialScale, int durationMs, Completion completion)
{
    auto* basketSurface = dynamic_cast<BasketSurface*>(surface);
    if (!basketSurface) {
        deliverLater(std::move(completion));
        return;
    }
    basketSurface->runTransition(initialScale, 1.0, 1.0, durationMs, false, std::move(completion));
}

void OverlayService::animateOut(IBasketSurface* surface, qreal targetScale, int durationMs, Completion completion)
{
    auto* basketSurface = dynamic_cast<BasketSurface*>(surface);
    if (!basketSurface) {
        deliverLater(std::move(completion));
        return;
    }
    basketSurface->runTransition(1.0, targetScale, 0.0, durationMs, true, std::move(completion));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Chooser
// ═══════════════════════════════════════════════════════════════════════════════

void OverlayService::createSwitcherWindow(QScreen* screen)
{
    auto* window = createQmlWindow(QUrl(QStringLiteral("qrc:/ui/BasketSwitcher.qml")), screen, "basket switcher");
    if (!window) {
        return;
    }

    if (auto* layerWindow = LayerShellQt::Window::get(window)) {
        layerWindow->setScreen(screen);
        layerWindow->setLayer(LayerShellQt::Window::LayerOverlay);
        layerWindow->setKeyboardInteractivity(LayerShellQt::Window::KeyboardInteractivityOnDemand);
        layerWindow->setScope(QStringLiteral("plasmabaskets-switcher"));
        layerWindow->setExclusiveZone(-1);
    }

    auto pickedConn = connect(window, SIGNAL(picked(QString)), this, SLOT(onSwitcherPicked(QString)));
    auto droppedConn =
        connect(window, SIGNAL(droppedOnNewBasket(QVariant)), this, SLOT(onSwitcherDroppedOnNewBasket(QVariant)));
    auto dismissedConn = connect(window, SIGNAL(dismissed()), this, SLOT(onSwitcherDismissed()));
    auto hideConn = connect(window, SIGNAL(hideRequested(QString)), this, SLOT(onSwitcherHideRequested(QString)));
    if (!pickedConn || !droppedConn || !dismissedConn || !hideConn) {
        qCWarning(lcPresentation) << "Failed to connect basket switcher signals";
    }

    window->setVisible(false);
    m_switcherWindow = window;
}

void OverlayService::showSwitcher(const QVector<SwitcherEntry>& entries, const QPoint& at, ISwitcherEvents* events)
{
    QScreen* screen = QGuiApplication::screenAt(at);
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }

    if (!m_switcherWindow) {
        createSwitcherWindow(screen);
    }
    if (!m_switcherWindow) {
        return;
    }

    QVariantList model;
    for (const SwitcherEntry& entry : entries) {
        QVariantMap row;
        row[QStringLiteral("basketId")] = entry.basketId;
        row[QStringLiteral("accentColor")] = AccentPalette::color(entry.accent);
        row[QStringLiteral("accentName")] = AccentPalette::name(entry.accent);
        row[QStringLiteral("itemCount")] = entry.itemCount;
        model.append(row);
    }

    m_switcherEvents = events;
    m_switcherWindow->setProperty("baskets", model);

    const QSize size(m_switcherWindow->width(), m_switcherWindow->height());
    placeLayerWindow(m_switcherWindow, GeometryUtils::centeredFrame(at, size));
    m_switcherWindow->setVisible(true);
    m_switcherWindow->raise();
    m_switcherWindow->requestActivate();
}

void OverlayService::hideSwitcher()
{
    m_switcherEvents = nullptr;
    if (m_switcherWindow) {
        m_switcherWindow->setVisible(false);
    }
}

bool OverlayService::isSwitcherShown() const
{
    return m_switcherWindow && m_switcherWindow->isVisible();
}

void OverlayService::onSwitcherPicked(const QString& basketId)
{
    if (m_switcherEvents) {
        m_switcherEvents->onSwitcherPicked(basketId);
    }
}

void OverlayService::onSwitcherDroppedOnNewBasket(const QVariant& urls)
{
    QList<QUrl> dropped;
    const QVariantList list = urls.toList();
    for (const QVariant& url : list) {
        dropped.append(url.toUrl());
    }

    if (m_switcherEvents) {
        m_switcherEvents->onSwitcherDroppedOnNewBasket(dropped);
    }
}

void OverlayService::onSwitcherDismissed()
{
    if (m_switcherEvents) {
        m_switcherEvents->onSwitcherDismissed();
    }
}

void OverlayService::onSwitcherHideRequested(const QString& basketId)
{
    if (m_switcherEvents) {
        m_switcherEvents->onSwitcherHideRequested(basketId);
    }
}

void OverlayService::previewItems(const QList<QUrl>& urls)
{
    for (const QUrl& url : urls) {
        if (!QDesktopServices::openUrl(url)) {
            qCWarning(lcPresentation) << "No handler to preview" << url;
        }
    }
}

} // namespace PlasmaBaskets

#include "overlayservice.moc"
