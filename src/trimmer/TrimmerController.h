#pragma once

#include <QObject>
#include <QMetaType>
#include <optional>
#include "MediaTime.h"
#include "TrimHandle.h"
#include "TrimmerSettings.h"
#include "TimePositionMapper.h"
#include "TrimBounds.h"
#include "DurationLimiter.h"
#include "HandleDragController.h"

class TimelineSurface;

// Interaction core of the trimmer control. Owns the committed handle offsets
// and turns drag/scroll events from the host into clamped offsets, seeks and
// position notifications. All calls are expected on the GUI thread.
class TrimmerController : public QObject {
    Q_OBJECT
public:
    explicit TrimmerController(const TimelineSurface& surface, QObject* parent = nullptr);
    ~TrimmerController();

    const TrimmerSettings& settings() const { return m_settings; }
    void setSettings(const TrimmerSettings& settings);

    void setViewWidth(double width);
    double viewWidth() const { return m_bounds.viewWidth(); }

    // Called when the surface's content width changes without a resize
    // (zoom). Re-clamps every handle and re-applies the duration cap.
    void surfaceGeometryChanged();

    const TrimBounds& bounds() const { return m_bounds; }

    // Selected range and indicator times, empty when no asset is loaded
    std::optional<MediaTime> startTime() const { return m_bounds.startTime(); }
    std::optional<MediaTime> endTime() const { return m_bounds.endTime(); }
    std::optional<MediaTime> startMarkTime() const { return m_bounds.startMarkTime(); }
    std::optional<MediaTime> endMarkTime() const { return m_bounds.endMarkTime(); }
    std::optional<MediaTime> thumbTime() const { return m_bounds.thumbTime(); }

    // Called by the asset collaborator once a new asset is loaded.
    void assetDidChange();

    // Gesture source events. translationX is cumulative since dragBegan.
    void dragBegan(TrimHandle handle);
    void dragMoved(TrimHandle handle, double translationX);
    void dragEnded(TrimHandle handle);
    void dragCancelled(TrimHandle handle);

    bool isDragging(HandlePair pair) const { return m_drag.isDragging(pair); }

    /// Move the position bar to the given time. The move is animated only if
    /// the time lies strictly inside the selected range.
    void seek(const MediaTime& time);

    /// Caps the selected range. Rejected if not finite or below the minimum duration.
    bool setMaxDuration(double seconds);
    void clearMaxDuration();
    std::optional<double> maxDuration() const { return m_settings.maxDuration; }

    /// Places the mark handles at absolute times; 0 keeps the natural edge.
    void setMarkedTime(double startSeconds, double endSeconds);

    void setHandlesEnabled(bool enabled);
    bool handlesEnabled() const { return m_drag.isPairEnabled(HandlePair::Trim); }
    void setMarksEnabled(bool enabled);
    bool marksEnabled() const { return m_drag.isPairEnabled(HandlePair::Mark); }
    void setPositionBarEnabled(bool enabled);
    bool positionBarEnabled() const { return m_drag.isPairEnabled(HandlePair::Position); }

    HandleLayer topLayer() const { return m_drag.topLayer(); }
    void raiseLayer(HandleLayer layer);

    // Timeline surface scroll lifecycle
    void scrollPositionChanged();
    void scrollSettled();
    void scrollDragEnded(bool willDecelerate);

    void reportPosition(bool stoppedMoving);

signals:
    void positionChanged(const MediaTime& time);
    void positionSettled(const MediaTime& time);
    void boundsChanged();
    void positionBarMoved(double offset, bool animated, double animationSeconds);
    void layerRaised(HandleLayer layer);

private:
    void finishDrag(TrimHandle handle, const char* how);
    void seekTo(const std::optional<MediaTime>& time);
    void emitLayerIfChanged(HandleLayer before);

    TrimmerSettings m_settings;
    TimePositionMapper m_mapper;
    TrimBounds m_bounds;
    DurationLimiter m_limiter;
    HandleDragController m_drag;
};

Q_DECLARE_METATYPE(MediaTime)
