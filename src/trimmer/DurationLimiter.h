#pragma once

#include "TrimHandle.h"

class TrimBounds;
class TimePositionMapper;
struct TrimmerSettings;

// Keeps endTime - startTime <= maxDuration by moving the trim handle that
// was not dragged.
class DurationLimiter {
public:
    DurationLimiter(TrimBounds& bounds, const TimePositionMapper& mapper,
                    const TrimmerSettings& settings);

    // Returns true when the opposite handle was moved.
    bool enforce(TrimHandle moved);

private:
    TrimBounds& m_bounds;
    const TimePositionMapper& m_mapper;
    const TrimmerSettings& m_settings;
};
