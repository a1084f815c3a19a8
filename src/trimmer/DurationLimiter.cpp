#include "DurationLimiter.h"
#include "TrimBounds.h"
#include "TimePositionMapper.h"
#include "TrimmerSettings.h"
#include "Logging.h"
#include <algorithm>

DurationLimiter::DurationLimiter(TrimBounds& bounds, const TimePositionMapper& mapper,
                                 const TrimmerSettings& settings)
    : m_bounds(bounds), m_mapper(mapper), m_settings(settings) {}

bool DurationLimiter::enforce(TrimHandle moved) {
    if (!m_settings.maxDuration) return false;
    if (moved != TrimHandle::TrimStart && moved != TrimHandle::TrimEnd) return false;

    auto duration = m_mapper.duration();
    auto start = m_bounds.startTime();
    auto end = m_bounds.endTime();
    if (!duration || !start || !end) return false;

    double maxDuration = *m_settings.maxDuration;
    if (end->seconds() - start->seconds() <= maxDuration) return false;

    if (moved == TrimHandle::TrimStart) {
        // Anchor at the start edge, pull the end handle in
        double newEnd = start->seconds() + maxDuration;
        if (newEnd >= duration->seconds()) {
            m_bounds.setOffset(TrimHandle::TrimEnd, 0.0);
        } else {
            auto offset = m_bounds.endOffsetFor(MediaTime::fromSeconds(newEnd, duration->timescale));
            if (!offset) return false;
            m_bounds.setOffset(TrimHandle::TrimEnd, std::min(*offset, 0.0));
        }
    } else {
        double newStart = end->seconds() - maxDuration;
        if (newStart <= 0.0) {
            m_bounds.setOffset(TrimHandle::TrimStart, 0.0);
        } else {
            auto offset = m_bounds.startOffsetFor(MediaTime::fromSeconds(newStart, duration->timescale));
            if (!offset) return false;
            m_bounds.setOffset(TrimHandle::TrimStart, std::max(*offset, 0.0));
        }
    }

    m_bounds.reclampPosition();
    qCDebug(lcTrimmer) << "Max duration" << maxDuration << "s enforced after moving" << handleName(moved);
    return true;
}
