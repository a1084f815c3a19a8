#pragma once

namespace AppConstants {
    inline constexpr const char* AppName = "ClipTrimmer";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ClipTrimmer";

    inline constexpr int DefaultWindowWidth = 900;
    inline constexpr int DefaultWindowHeight = 260;

    // Settings file looked up in the application config location
    inline constexpr const char* ConfigFileName = "trimmer.json";
}
