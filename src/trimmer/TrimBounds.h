#pragma once

#include <optional>
#include "MediaTime.h"
#include "TrimHandle.h"

class TimePositionMapper;
struct TrimmerSettings;

// Committed handle offsets. Start offsets are measured from the left edge of
// the view (>= 0), end offsets from the right edge (<= 0). The position offset
// is measured from the right side of the trim-start handle.
struct BoundsState {
    double leftOffset = 0.0;
    double rightOffset = 0.0;
    double leftMarkOffset = 0.0;
    double rightMarkOffset = 0.0;
    double positionOffset = 0.0;
};

class TrimBounds {
public:
    TrimBounds(const TimePositionMapper& mapper, const TrimmerSettings& settings);

    void setViewWidth(double width) { m_viewWidth = width; }
    double viewWidth() const { return m_viewWidth; }

    const BoundsState& state() const { return m_state; }
    void reset();

    // Pixel x of each handle's left side inside the view
    double leftHandleX() const;
    double rightHandleX() const;
    double leftMarkX() const;
    double rightMarkX() const;
    double positionBarX() const;

    // Minimum pixel distance between the two handles of a pair
    double minimumGap() const;

    double clampLeft(double candidate) const;
    double clampRight(double candidate) const;
    double clampMarkLeft(double candidate) const;
    double clampMarkRight(double candidate) const;
    double clampPosition(double candidate) const;

    double offset(TrimHandle handle) const;
    double clamp(TrimHandle handle, double candidate) const;
    // Stores the value as-is; callers pass clamped values.
    void setOffset(TrimHandle handle, double value);

    // Pulls the position offset back inside the trim selection.
    void reclampPosition();

    // Re-applies both pair clamps after the view, strip or handle width
    // changed. End handles first so each start clamps against a valid end.
    void reclampHandles();

    std::optional<MediaTime> startTime() const;
    std::optional<MediaTime> endTime() const;
    std::optional<MediaTime> startMarkTime() const;
    std::optional<MediaTime> endMarkTime() const;
    std::optional<MediaTime> thumbTime() const;

    // Offsets that would put a start/end edge exactly on the given time
    std::optional<double> startOffsetFor(const MediaTime& time) const;
    std::optional<double> endOffsetFor(const MediaTime& time) const;

private:
    double handleWidth() const;

    const TimePositionMapper& m_mapper;
    const TrimmerSettings& m_settings;
    BoundsState m_state;
    double m_viewWidth = 0.0;
};
