#include "TrimmerWidget.h"
#include "TrimmerController.h"
#include "MediaProbe.h"
#include "TimeUtil.h"
#include "Logging.h"
#include <QPainter>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QWheelEvent>
#include <QResizeEvent>
#include <QEasingCurve>
#include <algorithm>
#include <cmath>

TrimmerWidget::TrimmerWidget(QWidget* parent)
    : QWidget(parent)
    , m_controller(std::make_unique<TrimmerController>(*this))
{
    setMinimumHeight(60);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);

    m_scrollSettleTimer.setSingleShot(true);
    connect(&m_scrollSettleTimer, &QTimer::timeout, this, [this]() {
        m_controller->scrollSettled();
    });

    m_positionAnimation.setEasingCurve(QEasingCurve::Linear);
    connect(&m_positionAnimation, &QVariantAnimation::valueChanged, this, [this](const QVariant& value) {
        m_displayedPositionOffset = value.toDouble();
        update();
    });

    connect(m_controller.get(), &TrimmerController::positionBarMoved,
            this, &TrimmerWidget::onPositionBarMoved);
    connect(m_controller.get(), &TrimmerController::boundsChanged, this, [this]() {
        if (m_positionAnimation.state() != QAbstractAnimation::Running) {
            m_displayedPositionOffset = m_controller->bounds().state().positionOffset;
        }
        update();
    });
    connect(m_controller.get(), &TrimmerController::layerRaised, this, [this](HandleLayer) {
        update();
    });
}

TrimmerWidget::~TrimmerWidget() = default;

// --- Asset ---

void TrimmerWidget::setAsset(const AssetInfo& info) {
    cancelActiveDrag();
    qCDebug(lcTrimmer) << "Loading asset" << info.filePath << "into trimmer";
    m_duration = info.duration;
    m_zoom = 1.0;
    m_scrollOffset = 0.0;
    m_positionAnimation.stop();
    m_controller->assetDidChange();
    update();
}

void TrimmerWidget::clearAsset() {
    cancelActiveDrag();
    m_duration.reset();
    m_scrollOffset = 0.0;
    m_positionAnimation.stop();
    m_controller->assetDidChange();
    update();
}

// --- Visibility (hidden parts do not take input) ---

void TrimmerWidget::setHandlesHidden(bool hidden) {
    m_handlesHidden = hidden;
    m_controller->setHandlesEnabled(!hidden);
    update();
}

void TrimmerWidget::setMarksHidden(bool hidden) {
    m_marksHidden = hidden;
    m_controller->setMarksEnabled(!hidden);
    update();
}

void TrimmerWidget::setPositionBarHidden(bool hidden) {
    m_positionBarHidden = hidden;
    m_controller->setPositionBarEnabled(!hidden);
    update();
}

// --- Surface geometry ---

double TrimmerWidget::previewWidth() const {
    return std::max(0.0, width() - 2.0 * m_controller->settings().handleWidth);
}

double TrimmerWidget::contentWidth() const {
    return previewWidth() * m_zoom;
}

void TrimmerWidget::setScrollOffset(double offset) {
    double maxScroll = std::max(0.0, contentWidth() - previewWidth());
    m_scrollOffset = std::clamp(offset, 0.0, maxScroll);
}

void TrimmerWidget::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    setScrollOffset(m_scrollOffset);
    m_controller->setViewWidth(width());
}

// --- Hit testing ---

QRectF TrimmerWidget::handleRect(TrimHandle handle) const {
    const auto& bounds = m_controller->bounds();
    double hw = m_controller->settings().handleWidth;
    double h = height();

    switch (handle) {
    case TrimHandle::TrimStart:
        return QRectF(bounds.leftHandleX(), h * 0.05, hw, h * 0.9);
    case TrimHandle::TrimEnd:
        return QRectF(bounds.rightHandleX(), h * 0.05, hw, h * 0.9);
    case TrimHandle::MarkStart:
        return QRectF(bounds.leftMarkX(), 0, hw, h - MarkBottomInset);
    case TrimHandle::MarkEnd:
        return QRectF(bounds.rightMarkX(), 0, hw, h - MarkBottomInset);
    case TrimHandle::PositionBar: {
        double x = bounds.leftHandleX() + hw + m_displayedPositionOffset;
        return QRectF(x, 0, m_controller->settings().positionBarWidth, h);
    }
    }
    return {};
}

std::optional<TrimHandle> TrimmerWidget::handleAt(const QPointF& pos) const {
    // Topmost first: position bar, then whichever handle layer is raised
    if (!m_positionBarHidden && m_controller->positionBarEnabled()) {
        QRectF bar = handleRect(TrimHandle::PositionBar)
            .adjusted(-PositionBarHitSlop, 0, PositionBarHitSlop, 0);
        if (bar.contains(pos)) return TrimHandle::PositionBar;
    }

    const TrimHandle trims[] = {TrimHandle::TrimStart, TrimHandle::TrimEnd};
    const TrimHandle marks[] = {TrimHandle::MarkStart, TrimHandle::MarkEnd};
    bool marksOnTop = m_controller->topLayer() == HandleLayer::Mark;

    auto probe = [&](const TrimHandle* handles, bool enabled) -> std::optional<TrimHandle> {
        if (!enabled) return std::nullopt;
        for (int i = 0; i < 2; ++i) {
            if (handleRect(handles[i]).contains(pos)) return handles[i];
        }
        return std::nullopt;
    };

    bool trimsEnabled = !m_handlesHidden && m_controller->handlesEnabled();
    bool marksEnabled = !m_marksHidden && m_controller->marksEnabled();

    auto first = marksOnTop ? probe(marks, marksEnabled) : probe(trims, trimsEnabled);
    if (first) return first;
    return marksOnTop ? probe(trims, trimsEnabled) : probe(marks, marksEnabled);
}

// --- Mouse events ---

void TrimmerWidget::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton) {
        m_panning = true;
        m_panStartX = event->position().x();
        m_panStartScroll = m_scrollOffset;
        setCursor(Qt::ClosedHandCursor);
        return;
    }

    if (event->button() != Qt::LeftButton || m_activeHandle) return;

    auto handle = handleAt(event->position());
    if (!handle) return;

    m_activeHandle = handle;
    m_pressX = event->position().x();
    m_positionAnimation.stop();
    m_controller->dragBegan(*handle);
}

void TrimmerWidget::mouseMoveEvent(QMouseEvent* event) {
    double mx = event->position().x();

    if (m_panning) {
        setScrollOffset(m_panStartScroll - (mx - m_panStartX));
        m_controller->scrollPositionChanged();
        update();
        return;
    }

    if (m_activeHandle) {
        m_controller->dragMoved(*m_activeHandle, mx - m_pressX);
        return;
    }

    setCursor(handleAt(event->position()) ? Qt::SizeHorCursor : Qt::ArrowCursor);
}

void TrimmerWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::MiddleButton && m_panning) {
        m_panning = false;
        setCursor(Qt::ArrowCursor);
        m_controller->scrollDragEnded(false);
        return;
    }
    if (event->button() == Qt::LeftButton && m_activeHandle) {
        TrimHandle handle = *m_activeHandle;
        m_activeHandle.reset();
        m_controller->dragEnded(handle);
    }
}

void TrimmerWidget::keyPressEvent(QKeyEvent* event) {
    if (event->key() == Qt::Key_Escape && m_activeHandle) {
        cancelActiveDrag();
    } else {
        QWidget::keyPressEvent(event);
    }
}

void TrimmerWidget::focusOutEvent(QFocusEvent* event) {
    cancelActiveDrag();
    QWidget::focusOutEvent(event);
}

void TrimmerWidget::cancelActiveDrag() {
    if (!m_activeHandle) return;
    TrimHandle handle = *m_activeHandle;
    m_activeHandle.reset();
    m_controller->dragCancelled(handle);
}

// --- Wheel: scroll, ctrl+wheel zooms the strip ---

void TrimmerWidget::wheelEvent(QWheelEvent* event) {
    if (!m_duration || contentWidth() <= 0.0) return;

    if (event->modifiers() & Qt::ControlModifier) {
        double factor = event->angleDelta().y() > 0 ? 1.2 : 1.0 / 1.2;
        double anchor = event->position().x() - m_controller->settings().handleWidth;
        double contentAtCursor = (m_scrollOffset + anchor) / contentWidth();

        m_zoom = std::clamp(m_zoom * factor, 1.0, MaxZoom);
        setScrollOffset(contentAtCursor * contentWidth() - anchor);
        m_controller->surfaceGeometryChanged();
    } else {
        double delta = event->angleDelta().y() > 0 ? -20.0 : 20.0;
        setScrollOffset(m_scrollOffset + delta);
    }

    m_controller->scrollPositionChanged();
    m_scrollSettleTimer.start(ScrollSettleMs);
    update();
}

// --- Position bar animation ---

void TrimmerWidget::onPositionBarMoved(double offset, bool animated, double animationSeconds) {
    m_positionAnimation.stop();
    if (animated && animationSeconds > 0.0) {
        m_positionAnimation.setStartValue(m_displayedPositionOffset);
        m_positionAnimation.setEndValue(offset);
        m_positionAnimation.setDuration(static_cast<int>(animationSeconds * 1000.0));
        m_positionAnimation.start();
    } else {
        m_displayedPositionOffset = offset;
        update();
    }
}

// --- Paint ---

void TrimmerWidget::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    painter.fillRect(rect(), QColor(35, 35, 38));

    double hw = m_controller->settings().handleWidth;
    QRectF stripRect(hw, StripInset, previewWidth(), height() - 2 * StripInset);
    paintStrip(painter, stripRect);

    if (!m_duration) return;

    paintMasks(painter);

    // Overlapping handle layers, raised one last
    if (m_controller->topLayer() == HandleLayer::Mark) {
        paintTrimHandles(painter);
        paintMarkHandles(painter);
    } else {
        paintMarkHandles(painter);
        paintTrimHandles(painter);
    }

    paintPositionBar(painter);
}

void TrimmerWidget::paintStrip(QPainter& painter, const QRectF& rect) {
    painter.fillRect(rect, QColor(50, 50, 54));
    if (!m_duration || contentWidth() <= 0.0) return;

    // Ticks on a power-of-two second step, labelled when there is room
    double seconds = m_duration->seconds();
    double pps = contentWidth() / seconds;
    double step = 1.0;
    while (step * pps < 8.0) step *= 2.0;

    painter.save();
    painter.setClipRect(rect);
    painter.setFont(QFont("Arial", 7));
    for (double t = 0.0; t <= seconds; t += step) {
        double x = rect.left() + t * pps - m_scrollOffset;
        if (x < rect.left() || x > rect.right()) continue;
        painter.setPen(QColor(80, 80, 86));
        painter.drawLine(QPointF(x, rect.bottom() - 6), QPointF(x, rect.bottom()));
        if (step * pps >= 60.0) {
            painter.setPen(QColor(130, 130, 130));
            painter.drawText(QPointF(x + 3, rect.bottom() - 8), TimeUtil::secondsToMMSS(t));
        }
    }
    painter.restore();
}

void TrimmerWidget::paintMasks(QPainter& painter) {
    if (m_handlesHidden) return;

    const auto& bounds = m_controller->bounds();
    double hw = m_controller->settings().handleWidth;
    QColor maskColor(0, 0, 0, 102);

    double leftEdge = bounds.leftHandleX() + hw / 2.0;
    double rightEdge = bounds.rightHandleX() + hw / 2.0;
    painter.fillRect(QRectF(0, StripInset, leftEdge, height() - 2 * StripInset), maskColor);
    painter.fillRect(QRectF(rightEdge, StripInset, width() - rightEdge, height() - 2 * StripInset),
                     maskColor);
}

void TrimmerWidget::paintTrimHandles(QPainter& painter) {
    if (m_handlesHidden) return;

    QColor mainColor(255, 149, 0);
    QRectF left = handleRect(TrimHandle::TrimStart);
    QRectF right = handleRect(TrimHandle::TrimEnd);

    painter.setPen(QPen(mainColor, 2));
    painter.drawLine(QPointF(left.right(), 1), QPointF(right.left(), 1));
    painter.drawLine(QPointF(left.right(), height() - 1), QPointF(right.left(), height() - 1));

    painter.setPen(Qt::NoPen);
    painter.setBrush(mainColor);
    painter.drawRoundedRect(left, 2, 2);
    painter.drawRoundedRect(right, 2, 2);

    // Knobs
    painter.setBrush(QColor(30, 30, 200));
    painter.drawRect(QRectF(left.center().x() - 1, height() * 0.25, 2, height() * 0.5));
    painter.setBrush(QColor(128, 128, 128));
    painter.drawRect(QRectF(right.center().x() - 1, height() * 0.25, 2, height() * 0.5));
}

void TrimmerWidget::paintMarkHandles(QPainter& painter) {
    if (m_marksHidden) return;

    QColor markColor(80, 180, 255);
    painter.setPen(Qt::NoPen);
    painter.setBrush(markColor);
    QRectF left = handleRect(TrimHandle::MarkStart);
    QRectF right = handleRect(TrimHandle::MarkEnd);
    painter.drawRoundedRect(left.adjusted(left.width() / 2 - 4, 0, -(left.width() / 2 - 4), 0), 2, 2);
    painter.drawRoundedRect(right.adjusted(right.width() / 2 - 4, 0, -(right.width() / 2 - 4), 0), 2, 2);

    painter.setPen(QColor(220, 220, 220));
    painter.setFont(QFont("Arial", 7));
    painter.drawText(QPointF(left.right() + 2, 10),
                     TimeUtil::formatTime(m_controller->startMarkTime()));
    QString endLabel = TimeUtil::formatTime(m_controller->endMarkTime());
    int labelWidth = painter.fontMetrics().horizontalAdvance(endLabel);
    painter.drawText(QPointF(right.left() - 2 - labelWidth, 10), endLabel);
}

void TrimmerWidget::paintPositionBar(QPainter& painter) {
    if (m_positionBarHidden) return;

    painter.setPen(Qt::NoPen);
    painter.setBrush(Qt::white);
    painter.drawRoundedRect(handleRect(TrimHandle::PositionBar), 1, 1);
}
