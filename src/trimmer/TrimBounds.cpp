#include "TrimBounds.h"
#include "TimePositionMapper.h"
#include "TrimmerSettings.h"
#include <algorithm>

TrimBounds::TrimBounds(const TimePositionMapper& mapper, const TrimmerSettings& settings)
    : m_mapper(mapper), m_settings(settings) {}

void TrimBounds::reset() {
    m_state = BoundsState{};
}

double TrimBounds::handleWidth() const {
    return m_settings.handleWidth;
}

// --- Geometry ---

double TrimBounds::leftHandleX() const {
    return m_state.leftOffset;
}

double TrimBounds::rightHandleX() const {
    return m_viewWidth + m_state.rightOffset - handleWidth();
}

double TrimBounds::leftMarkX() const {
    return m_state.leftMarkOffset;
}

double TrimBounds::rightMarkX() const {
    return m_viewWidth + m_state.rightMarkOffset - handleWidth();
}

double TrimBounds::positionBarX() const {
    return leftHandleX() + handleWidth() + m_state.positionOffset;
}

double TrimBounds::minimumGap() const {
    // Not cached: follows the live asset duration and content width
    return m_mapper.pixelsFor(m_settings.minDuration);
}

// --- Clamping ---

double TrimBounds::clampLeft(double candidate) const {
    double maxOffset = std::max(rightHandleX() - handleWidth() - minimumGap(), 0.0);
    return std::min(std::max(0.0, candidate), maxOffset);
}

double TrimBounds::clampRight(double candidate) const {
    double minOffset = std::min(2.0 * handleWidth() - m_viewWidth + leftHandleX() + minimumGap(), 0.0);
    return std::max(std::min(0.0, candidate), minOffset);
}

double TrimBounds::clampMarkLeft(double candidate) const {
    double maxOffset = std::max(rightMarkX() - handleWidth() - minimumGap(), 0.0);
    return std::min(std::max(0.0, candidate), maxOffset);
}

double TrimBounds::clampMarkRight(double candidate) const {
    double minOffset = std::min(2.0 * handleWidth() - m_viewWidth + leftMarkX() + minimumGap(), 0.0);
    return std::max(std::min(0.0, candidate), minOffset);
}

double TrimBounds::clampPosition(double candidate) const {
    double maxOffset = std::max(rightHandleX() - handleWidth(), 0.0);
    return std::min(std::max(0.0, candidate), maxOffset);
}

double TrimBounds::offset(TrimHandle handle) const {
    switch (handle) {
    case TrimHandle::TrimStart:   return m_state.leftOffset;
    case TrimHandle::TrimEnd:     return m_state.rightOffset;
    case TrimHandle::MarkStart:   return m_state.leftMarkOffset;
    case TrimHandle::MarkEnd:     return m_state.rightMarkOffset;
    case TrimHandle::PositionBar: return m_state.positionOffset;
    }
    return 0.0;
}

double TrimBounds::clamp(TrimHandle handle, double candidate) const {
    switch (handle) {
    case TrimHandle::TrimStart:   return clampLeft(candidate);
    case TrimHandle::TrimEnd:     return clampRight(candidate);
    case TrimHandle::MarkStart:   return clampMarkLeft(candidate);
    case TrimHandle::MarkEnd:     return clampMarkRight(candidate);
    case TrimHandle::PositionBar: return clampPosition(candidate);
    }
    return candidate;
}

void TrimBounds::setOffset(TrimHandle handle, double value) {
    switch (handle) {
    case TrimHandle::TrimStart:   m_state.leftOffset = value; break;
    case TrimHandle::TrimEnd:     m_state.rightOffset = value; break;
    case TrimHandle::MarkStart:   m_state.leftMarkOffset = value; break;
    case TrimHandle::MarkEnd:     m_state.rightMarkOffset = value; break;
    case TrimHandle::PositionBar: m_state.positionOffset = value; break;
    }
}

void TrimBounds::reclampPosition() {
    m_state.positionOffset = clampPosition(m_state.positionOffset);
}

void TrimBounds::reclampHandles() {
    m_state.rightOffset = clampRight(m_state.rightOffset);
    m_state.leftOffset = clampLeft(m_state.leftOffset);
    m_state.rightMarkOffset = clampMarkRight(m_state.rightMarkOffset);
    m_state.leftMarkOffset = clampMarkLeft(m_state.leftMarkOffset);
}

// --- Times under the handles ---

std::optional<MediaTime> TrimBounds::startTime() const {
    return m_mapper.timeFor(leftHandleX() + m_mapper.scrollOffset());
}

std::optional<MediaTime> TrimBounds::endTime() const {
    return m_mapper.timeFor(rightHandleX() - handleWidth() + m_mapper.scrollOffset());
}

std::optional<MediaTime> TrimBounds::startMarkTime() const {
    return m_mapper.timeFor(leftMarkX() + m_mapper.scrollOffset());
}

std::optional<MediaTime> TrimBounds::endMarkTime() const {
    return m_mapper.timeFor(rightMarkX() - handleWidth() + m_mapper.scrollOffset());
}

std::optional<MediaTime> TrimBounds::thumbTime() const {
    return m_mapper.timeFor(positionBarX() - handleWidth() + m_mapper.scrollOffset());
}

std::optional<double> TrimBounds::startOffsetFor(const MediaTime& time) const {
    auto position = m_mapper.positionFor(time);
    if (!position) return std::nullopt;
    return *position - m_mapper.scrollOffset();
}

std::optional<double> TrimBounds::endOffsetFor(const MediaTime& time) const {
    auto position = m_mapper.positionFor(time);
    if (!position) return std::nullopt;
    return *position - m_mapper.scrollOffset() + 2.0 * handleWidth() - m_viewWidth;
}
