#pragma once

#include <optional>
#include "MediaTime.h"

// What the trimmer core needs from the scrollable asset strip it sits on.
class TimelineSurface {
public:
    virtual ~TimelineSurface() = default;

    // Duration of the loaded asset, empty when nothing is loaded.
    virtual std::optional<MediaTime> currentDuration() const = 0;

    // Width of the full (possibly scrolled) preview content in pixels.
    virtual double contentWidth() const = 0;

    // Current horizontal scroll of the preview content in pixels.
    virtual double scrollOffsetX() const = 0;
};
