#include "Subtitler/Overlay.h"
#include "Subtitler/Paths.h"
#include <iostream>
#include <ostream>

namespace Subtitler {

OverlayStyle StyleFromSettings(const Settings& settings){
    return OverlayStyle{settings.subtitleFont, settings.subtitleColor, settings.subtitleBackgroundAlpha};
}

class OverlayConsole : public ISubtitleOverlay {
public:
    OverlayConsole(std::ostream& out, std::shared_ptr<spdlog::logger> logger)
        : out_(out), logger_(std::move(logger)) {}

    bool Initialize(const OverlayStyle& style) override {
        style_ = style;
        if (logger_) logger_->debug("Console overlay initialized ({}, {})", FormatFont(style.font), style.color);
        return true;
    }
    void ApplyStyle(const OverlayStyle& style) override {
        style_ = style;
        if (logger_) logger_->info("Subtitle style: font={} color={} alpha={}", FormatFont(style.font), style.color, style.backgroundAlpha);
    }
    void ShowText(const std::string& text) override {
        if (text == last_) return;
        last_ = text;
        out_ << "[subtitle] " << text << std::endl;
    }
    void Hide() override {
        last_.clear();
    }
private:
    std::ostream& out_;
    std::shared_ptr<spdlog::logger> logger_;
    OverlayStyle style_{};
    std::string last_;
};

std::unique_ptr<ISubtitleOverlay> CreateOverlayConsole(std::ostream& out, std::shared_ptr<spdlog::logger> logger){
    return std::make_unique<OverlayConsole>(out, std::move(logger));
}

std::unique_ptr<ISubtitleOverlay> CreateConfiguredOverlay(std::shared_ptr<spdlog::logger> logger){
#ifdef _WIN32
    if (!EnvEquals("SUBTITLER_OVERLAY", "console")) return CreateOverlayWindow(std::move(logger));
#endif
    return CreateOverlayConsole(std::cout, std::move(logger));
}

}
