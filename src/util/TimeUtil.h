#pragma once

#include <QString>
#include <optional>
#include "MediaTime.h"

namespace TimeUtil {

inline QString secondsToHMS(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

inline QString secondsToMMSS(double totalSeconds) {
    int minutes = static_cast<int>(totalSeconds) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    return QString("%1:%2")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'));
}

// Label for an optional trimmer time; "--:--" when no asset is loaded
inline QString formatTime(const std::optional<MediaTime>& time) {
    if (!time) return QStringLiteral("--:--");
    return secondsToHMS(time->seconds());
}

} // namespace TimeUtil
