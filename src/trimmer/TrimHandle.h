#pragma once

#include <optional>

enum class TrimHandle {
    TrimStart,
    TrimEnd,
    MarkStart,
    MarkEnd,
    PositionBar
};

// Handles that share a drag session and gap constraint
enum class HandlePair {
    Trim,
    Mark,
    Position
};

// The trim and mark handles overlap; one layer is drawn above the other.
enum class HandleLayer {
    Trim,
    Mark
};

inline std::optional<HandlePair> pairOf(TrimHandle handle) {
    switch (handle) {
    case TrimHandle::TrimStart:
    case TrimHandle::TrimEnd:
        return HandlePair::Trim;
    case TrimHandle::MarkStart:
    case TrimHandle::MarkEnd:
        return HandlePair::Mark;
    case TrimHandle::PositionBar:
        return HandlePair::Position;
    }
    return std::nullopt;
}

inline bool isStartHandle(TrimHandle handle) {
    return handle == TrimHandle::TrimStart || handle == TrimHandle::MarkStart;
}

inline const char* handleName(TrimHandle handle) {
    switch (handle) {
    case TrimHandle::TrimStart:   return "trim-start";
    case TrimHandle::TrimEnd:     return "trim-end";
    case TrimHandle::MarkStart:   return "mark-start";
    case TrimHandle::MarkEnd:     return "mark-end";
    case TrimHandle::PositionBar: return "position-bar";
    }
    return "unknown";
}
