#pragma once

#include <optional>
#include "trimmer/TimelineSurface.h"

// Fixed-geometry timeline surface for driving the trimmer core in tests.
struct FakeSurface : public TimelineSurface {
    std::optional<MediaTime> duration;
    double width = 300.0;
    double scroll = 0.0;

    std::optional<MediaTime> currentDuration() const override { return duration; }
    double contentWidth() const override { return width; }
    double scrollOffsetX() const override { return scroll; }

    void loadSeconds(double seconds, int32_t timescale = 600) {
        duration = MediaTime::fromSeconds(seconds, timescale);
    }
};
