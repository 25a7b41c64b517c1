#pragma once
#include "Subtitler/Audio.h"
#include "Subtitler/Overlay.h"
#include "Subtitler/Settings.h"
#include "Subtitler/TranslationSession.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace Subtitler {

struct CommandResult {
    bool ok{true};
    bool quit{false};
    std::string message;
};

using DeviceLister = std::function<std::vector<AudioDevice>()>;

// The settings action: every mutation of the settings record goes through here, on the UI thread.
// Accepted changes are persisted immediately; rejected values leave the record untouched.
class CommandProcessor {
public:
    CommandProcessor(Settings& settings, const SettingsStore& store, ISubtitleOverlay& overlay,
                     TranslationSession& session, DeviceLister devices,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    CommandResult Execute(const std::string& line);

    static std::string Help();

private:
    CommandResult Commit(const Settings& next, bool restyle, std::string message);
    CommandResult SetLanguage(std::string Settings::* field, const std::string& value, const char* what);
    CommandResult SetDevice(const std::string& value);
    CommandResult SetFont(const std::string& value);
    CommandResult SetColor(const std::string& value);
    CommandResult SetAlpha(const std::string& value);
    CommandResult ListDevices();
    CommandResult Import(const std::string& path);
    CommandResult Export(const std::string& path);
    CommandResult StartSession();
    std::string Describe() const;

    Settings& settings_;
    const SettingsStore& store_;
    ISubtitleOverlay& overlay_;
    TranslationSession& session_;
    DeviceLister devices_;
    std::shared_ptr<spdlog::logger> logger_;
};

}
