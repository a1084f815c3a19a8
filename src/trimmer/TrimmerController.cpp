#include "TrimmerController.h"
#include "TimelineSurface.h"
#include "Logging.h"
#include <algorithm>
#include <cmath>

TrimmerController::TrimmerController(const TimelineSurface& surface, QObject* parent)
    : QObject(parent)
    , m_mapper(surface)
    , m_bounds(m_mapper, m_settings)
    , m_limiter(m_bounds, m_mapper, m_settings)
    , m_drag(m_bounds)
{
}

TrimmerController::~TrimmerController() = default;

void TrimmerController::setSettings(const TrimmerSettings& settings) {
    m_settings = settings;
    if (m_settings.handleWidth < 0.0) m_settings.handleWidth = 0.0;
    if (m_settings.minDuration < 0.0) m_settings.minDuration = 0.0;

    if (m_settings.maxDuration && *m_settings.maxDuration < m_settings.minDuration) {
        qCWarning(lcTrimmer) << "Ignoring max duration" << *m_settings.maxDuration
                             << "s below min duration" << m_settings.minDuration << "s";
        m_settings.maxDuration.reset();
    }

    surfaceGeometryChanged();
}

void TrimmerController::setViewWidth(double width) {
    m_bounds.setViewWidth(std::max(0.0, width));
    surfaceGeometryChanged();
}

void TrimmerController::surfaceGeometryChanged() {
    m_bounds.reclampHandles();
    m_limiter.enforce(TrimHandle::TrimStart);
    m_bounds.reclampPosition();
    emit boundsChanged();
    emit positionBarMoved(m_bounds.state().positionOffset, false, 0.0);
}

// --- Asset loading ---

void TrimmerController::assetDidChange() {
    m_drag.cancelAll();
    m_bounds.reset();

    auto duration = m_mapper.duration();
    if (duration) {
        qCInfo(lcTrimmer) << "Asset changed, duration" << duration->seconds() << "s";
        m_limiter.enforce(TrimHandle::TrimStart);
    } else {
        qCInfo(lcTrimmer) << "Asset cleared";
    }

    emit boundsChanged();
    emit positionBarMoved(m_bounds.state().positionOffset, false, 0.0);
}

// --- Drag gestures ---

void TrimmerController::dragBegan(TrimHandle handle) {
    HandleLayer before = m_drag.topLayer();
    if (!m_drag.begin(handle)) return;

    emitLayerIfChanged(before);
    reportPosition(false);
}

void TrimmerController::dragMoved(TrimHandle handle, double translationX) {
    HandleLayer before = m_drag.topLayer();
    auto committed = m_drag.move(handle, translationX);
    if (!committed) return;

    if (handle == TrimHandle::TrimStart || handle == TrimHandle::TrimEnd) {
        m_limiter.enforce(handle);
        m_bounds.reclampPosition();
    }

    emitLayerIfChanged(before);
    emit boundsChanged();

    switch (handle) {
    case TrimHandle::TrimStart:
        seekTo(startTime());
        break;
    case TrimHandle::TrimEnd:
        seekTo(endTime());
        break;
    case TrimHandle::MarkStart:
        seekTo(startMarkTime());
        break;
    case TrimHandle::MarkEnd:
        seekTo(endMarkTime());
        break;
    case TrimHandle::PositionBar:
        // Already committed at the dragged offset, which is its own time
        emit positionBarMoved(*committed, false, 0.0);
        break;
    }

    reportPosition(false);
}

void TrimmerController::dragEnded(TrimHandle handle) {
    finishDrag(handle, "ended");
}

void TrimmerController::dragCancelled(TrimHandle handle) {
    // Same as an end: the last clamped offset stays committed
    finishDrag(handle, "cancelled");
}

void TrimmerController::finishDrag(TrimHandle handle, const char* how) {
    if (!m_drag.finish(handle)) return;
    qCDebug(lcTrimmer) << "Drag" << how << "on" << handleName(handle);
    reportPosition(true);
}

// --- Seeking ---

void TrimmerController::seek(const MediaTime& time) {
    auto position = m_mapper.positionFor(time);
    if (!position) return;

    double offset = *position - m_mapper.scrollOffset() - m_bounds.leftHandleX();
    double normalized = m_bounds.clampPosition(offset);
    m_bounds.setOffset(TrimHandle::PositionBar, normalized);

    auto start = startTime();
    auto end = endTime();
    bool animated = start && end && time > *start && time < *end;
    emit positionBarMoved(normalized, animated,
                          animated ? m_settings.positionBarAnimationDuration : 0.0);
}

void TrimmerController::seekTo(const std::optional<MediaTime>& time) {
    if (time) seek(*time);
}

// --- Limits and marks ---

bool TrimmerController::setMaxDuration(double seconds) {
    if (!std::isfinite(seconds)) {
        qCWarning(lcTrimmer) << "Rejecting non-finite max duration";
        return false;
    }
    if (seconds < m_settings.minDuration) {
        qCWarning(lcTrimmer) << "Rejecting max duration" << seconds
                             << "s below min duration" << m_settings.minDuration << "s";
        return false;
    }

    m_settings.maxDuration = seconds;
    if (m_limiter.enforce(TrimHandle::TrimStart)) {
        emit boundsChanged();
        emit positionBarMoved(m_bounds.state().positionOffset, false, 0.0);
    }
    return true;
}

void TrimmerController::clearMaxDuration() {
    m_settings.maxDuration.reset();
}

void TrimmerController::setMarkedTime(double startSeconds, double endSeconds) {
    auto duration = m_mapper.duration();
    int32_t timescale = duration ? duration->timescale : MediaTime::DefaultTimescale;

    if (startSeconds <= 0.0) {
        m_bounds.setOffset(TrimHandle::MarkStart, 0.0);
    } else if (auto offset = m_bounds.startOffsetFor(MediaTime::fromSeconds(startSeconds, timescale))) {
        m_bounds.setOffset(TrimHandle::MarkStart, std::max(*offset, 0.0));
    }

    if (endSeconds <= 0.0) {
        m_bounds.setOffset(TrimHandle::MarkEnd, m_bounds.clampMarkRight(0.0));
    } else if (auto offset = m_bounds.endOffsetFor(MediaTime::fromSeconds(endSeconds, timescale))) {
        m_bounds.setOffset(TrimHandle::MarkEnd, m_bounds.clampMarkRight(*offset));
    }

    m_bounds.setOffset(TrimHandle::MarkStart, m_bounds.clampMarkLeft(m_bounds.state().leftMarkOffset));

    qCDebug(lcTrimmer) << "Marked time set to" << startSeconds << "-" << endSeconds << "s";
    emit boundsChanged();
}

// --- Interaction flags ---

void TrimmerController::setHandlesEnabled(bool enabled) {
    m_drag.setPairEnabled(HandlePair::Trim, enabled);
}

void TrimmerController::setMarksEnabled(bool enabled) {
    m_drag.setPairEnabled(HandlePair::Mark, enabled);
}

void TrimmerController::setPositionBarEnabled(bool enabled) {
    m_drag.setPairEnabled(HandlePair::Position, enabled);
}

void TrimmerController::raiseLayer(HandleLayer layer) {
    if (m_drag.raiseLayer(layer)) {
        emit layerRaised(layer);
    }
}

void TrimmerController::emitLayerIfChanged(HandleLayer before) {
    if (m_drag.topLayer() != before) {
        emit layerRaised(m_drag.topLayer());
    }
}

// --- Notifications ---

void TrimmerController::scrollPositionChanged() {
    reportPosition(false);
}

void TrimmerController::scrollSettled() {
    reportPosition(true);
}

void TrimmerController::scrollDragEnded(bool willDecelerate) {
    if (!willDecelerate) {
        reportPosition(true);
    }
}

void TrimmerController::reportPosition(bool stoppedMoving) {
    auto time = thumbTime();
    if (!time) return;

    if (stoppedMoving) {
        emit positionSettled(*time);
    } else {
        emit positionChanged(*time);
    }
}
