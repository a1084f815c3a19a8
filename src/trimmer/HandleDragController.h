#pragma once

#include <array>
#include <optional>
#include "TrimHandle.h"

class TrimBounds;

// Per-pair drag lifecycle: Idle -> Dragging(handle, baseline) -> Idle.
// Each pair has its own session, so a trim drag and a mark drag can run at
// the same time, but the two handles of one pair cannot.
class HandleDragController {
public:
    explicit HandleDragController(TrimBounds& bounds);

    // Captures the committed offset as baseline. False if the pair is busy
    // or disabled.
    bool begin(TrimHandle handle);

    // Commits clamp(baseline + translationX) and returns the committed value.
    // Empty if the handle has no running session.
    std::optional<double> move(TrimHandle handle, double translationX);

    // End and cancel alike: the last committed offset stays.
    bool finish(TrimHandle handle);

    void cancelAll();

    bool isDragging(HandlePair pair) const;
    std::optional<TrimHandle> activeHandle(HandlePair pair) const;

    void setPairEnabled(HandlePair pair, bool enabled);
    bool isPairEnabled(HandlePair pair) const;

    HandleLayer topLayer() const { return m_topLayer; }
    // Returns true when the topmost layer changed.
    bool raiseLayer(HandleLayer layer);

private:
    struct DragSession {
        TrimHandle handle;
        double baseline = 0.0;
    };

    static std::size_t slot(HandlePair pair) { return static_cast<std::size_t>(pair); }
    void raiseFor(TrimHandle handle);

    TrimBounds& m_bounds;
    std::array<std::optional<DragSession>, 3> m_sessions;
    std::array<bool, 3> m_enabled{{true, true, true}};
    HandleLayer m_topLayer = HandleLayer::Trim;
};
