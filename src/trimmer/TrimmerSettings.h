#pragma once

#include <optional>

struct TrimmerSettings {
    double handleWidth = 15.0;                 // pixels
    double minDuration = 3.0;                  // seconds; handles stop panning at this span
    double positionBarAnimationDuration = 0.1; // seconds
    double positionBarWidth = 3.0;             // pixels
    std::optional<double> maxDuration;         // seconds; unset = no cap
};
