#pragma once

#include <QWidget>
#include <QTimer>
#include <QVariantAnimation>
#include <memory>
#include <optional>
#include "TimelineSurface.h"
#include "TrimHandle.h"

class TrimmerController;
struct AssetInfo;

// Paints the trimmer over a scrollable asset strip and feeds mouse and wheel
// input to the TrimmerController. Also serves as the controller's timeline
// surface: the strip is inset by one handle width on each side and can be
// zoomed wider than the view.
class TrimmerWidget : public QWidget, public TimelineSurface {
    Q_OBJECT
public:
    explicit TrimmerWidget(QWidget* parent = nullptr);
    ~TrimmerWidget();

    TrimmerController* controller() { return m_controller.get(); }

    void setAsset(const AssetInfo& info);
    void clearAsset();

    void setHandlesHidden(bool hidden);
    void setMarksHidden(bool hidden);
    void setPositionBarHidden(bool hidden);

    // TimelineSurface
    std::optional<MediaTime> currentDuration() const override { return m_duration; }
    double contentWidth() const override;
    double scrollOffsetX() const override { return m_scrollOffset; }

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void focusOutEvent(QFocusEvent* event) override;
    QSize minimumSizeHint() const override { return QSize(200, 60); }

private:
    void paintStrip(QPainter& painter, const QRectF& rect);
    void paintMasks(QPainter& painter);
    void paintTrimHandles(QPainter& painter);
    void paintMarkHandles(QPainter& painter);
    void paintPositionBar(QPainter& painter);

    QRectF handleRect(TrimHandle handle) const;
    std::optional<TrimHandle> handleAt(const QPointF& pos) const;

    double previewWidth() const;
    void setScrollOffset(double offset);
    void cancelActiveDrag();
    void onPositionBarMoved(double offset, bool animated, double animationSeconds);

    std::unique_ptr<TrimmerController> m_controller;
    std::optional<MediaTime> m_duration;

    double m_zoom = 1.0;          // content width / preview width
    double m_scrollOffset = 0.0;  // pixels

    // Handle drag state
    std::optional<TrimHandle> m_activeHandle;
    double m_pressX = 0.0;

    // Middle-button pan state
    bool m_panning = false;
    double m_panStartX = 0.0;
    double m_panStartScroll = 0.0;

    bool m_handlesHidden = false;
    bool m_marksHidden = false;
    bool m_positionBarHidden = false;

    QTimer m_scrollSettleTimer;
    QVariantAnimation m_positionAnimation;
    double m_displayedPositionOffset = 0.0;

    static constexpr double StripInset = 9.0;
    static constexpr double MarkBottomInset = 11.0;
    static constexpr double PositionBarHitSlop = 10.0;
    static constexpr double MaxZoom = 20.0;
    static constexpr int ScrollSettleMs = 150;
};
