#include "TimePositionMapper.h"
#include "TimelineSurface.h"
#include <algorithm>
#include <cmath>

TimePositionMapper::TimePositionMapper(const TimelineSurface& surface)
    : m_surface(surface) {}

std::optional<MediaTime> TimePositionMapper::duration() const {
    auto d = m_surface.currentDuration();
    if (!d || !d->isValid() || d->value <= 0) {
        return std::nullopt;
    }
    return d;
}

double TimePositionMapper::scrollOffset() const {
    return m_surface.scrollOffsetX();
}

std::optional<double> TimePositionMapper::positionFor(const MediaTime& time) const {
    auto d = duration();
    if (!d || !time.isValid()) return std::nullopt;

    double width = m_surface.contentWidth();
    double ratio = (static_cast<double>(time.value) * d->timescale)
                 / (static_cast<double>(time.timescale) * d->value);
    return ratio * width;
}

std::optional<MediaTime> TimePositionMapper::timeFor(double position) const {
    auto d = duration();
    double width = m_surface.contentWidth();
    if (!d || width <= 0.0) return std::nullopt;

    double ratio = std::clamp(position / width, 0.0, 1.0);
    auto value = static_cast<int64_t>(std::llround(ratio * static_cast<double>(d->value)));
    return MediaTime(value, d->timescale);
}

double TimePositionMapper::pixelsFor(double seconds) const {
    auto d = duration();
    if (!d) return 0.0;
    return seconds * m_surface.contentWidth() / d->seconds();
}
