#pragma once
#include "Subtitler/Settings.h"
#include <iosfwd>
#include <string>
#include <memory>
#include <spdlog/spdlog.h>

namespace Subtitler {

struct OverlayStyle {
    SubtitleFont font{};
    std::string color{"#FFFFFF"};
    int backgroundAlpha{128};

    bool operator==(const OverlayStyle&) const = default;
};

OverlayStyle StyleFromSettings(const Settings& settings);

// Always-on-top subtitle surface. Called from the UI thread only.
class ISubtitleOverlay {
public:
    virtual ~ISubtitleOverlay() = default;
    virtual bool Initialize(const OverlayStyle& style) = 0;
    virtual void ApplyStyle(const OverlayStyle& style) = 0;
    virtual void ShowText(const std::string& text) = 0;
    virtual void Hide() = 0;
};

// Writes each subtitle line to out, prefixed with "[subtitle] ".
std::unique_ptr<ISubtitleOverlay> CreateOverlayConsole(std::ostream& out, std::shared_ptr<spdlog::logger> logger);
// Topmost click-through Direct2D window (Windows)
std::unique_ptr<ISubtitleOverlay> CreateOverlayWindow(std::shared_ptr<spdlog::logger> logger);

// Window overlay on Windows unless SUBTITLER_OVERLAY=console; console elsewhere.
std::unique_ptr<ISubtitleOverlay> CreateConfiguredOverlay(std::shared_ptr<spdlog::logger> logger);

}
