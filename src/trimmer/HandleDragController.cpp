#include "HandleDragController.h"
#include "TrimBounds.h"
#include "Logging.h"

HandleDragController::HandleDragController(TrimBounds& bounds)
    : m_bounds(bounds) {}

bool HandleDragController::begin(TrimHandle handle) {
    auto pair = pairOf(handle);
    if (!pair) {
        qCDebug(lcTrimmer) << "Ignoring drag begin for unknown handle" << static_cast<int>(handle);
        return false;
    }
    if (!m_enabled[slot(*pair)]) return false;

    auto& session = m_sessions[slot(*pair)];
    if (session) {
        qCDebug(lcTrimmer) << "Ignoring drag begin on" << handleName(handle)
                           << "while" << handleName(session->handle) << "is dragging";
        return false;
    }

    session = DragSession{handle, m_bounds.offset(handle)};
    raiseFor(handle);
    qCDebug(lcTrimmer) << "Drag began on" << handleName(handle) << "baseline" << session->baseline;
    return true;
}

std::optional<double> HandleDragController::move(TrimHandle handle, double translationX) {
    auto pair = pairOf(handle);
    if (!pair) return std::nullopt;

    const auto& session = m_sessions[slot(*pair)];
    if (!session || session->handle != handle) return std::nullopt;

    double committed = m_bounds.clamp(handle, session->baseline + translationX);
    m_bounds.setOffset(handle, committed);
    raiseFor(handle);
    return committed;
}

bool HandleDragController::finish(TrimHandle handle) {
    auto pair = pairOf(handle);
    if (!pair) return false;

    auto& session = m_sessions[slot(*pair)];
    if (!session || session->handle != handle) return false;

    qCDebug(lcTrimmer) << "Drag finished on" << handleName(handle)
                       << "offset" << m_bounds.offset(handle);
    session.reset();
    return true;
}

void HandleDragController::cancelAll() {
    for (auto& session : m_sessions) {
        session.reset();
    }
}

bool HandleDragController::isDragging(HandlePair pair) const {
    return m_sessions[slot(pair)].has_value();
}

std::optional<TrimHandle> HandleDragController::activeHandle(HandlePair pair) const {
    const auto& session = m_sessions[slot(pair)];
    if (!session) return std::nullopt;
    return session->handle;
}

void HandleDragController::setPairEnabled(HandlePair pair, bool enabled) {
    m_enabled[slot(pair)] = enabled;
}

bool HandleDragController::isPairEnabled(HandlePair pair) const {
    return m_enabled[slot(pair)];
}

bool HandleDragController::raiseLayer(HandleLayer layer) {
    if (m_topLayer == layer) return false;
    m_topLayer = layer;
    return true;
}

void HandleDragController::raiseFor(TrimHandle handle) {
    auto pair = pairOf(handle);
    if (pair == HandlePair::Trim) {
        raiseLayer(HandleLayer::Trim);
    } else if (pair == HandlePair::Mark) {
        raiseLayer(HandleLayer::Mark);
    }
}
