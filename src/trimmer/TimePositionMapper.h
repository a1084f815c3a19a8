#pragma once

#include <optional>
#include "MediaTime.h"

class TimelineSurface;

// Linear mapping between asset time and content x-offset.
class TimePositionMapper {
public:
    explicit TimePositionMapper(const TimelineSurface& surface);

    std::optional<double> positionFor(const MediaTime& time) const;
    std::optional<MediaTime> timeFor(double position) const;

    // Pixel length of a span of seconds, 0 when no asset is loaded.
    double pixelsFor(double seconds) const;

    std::optional<MediaTime> duration() const;
    double scrollOffset() const;

private:
    const TimelineSurface& m_surface;
};
