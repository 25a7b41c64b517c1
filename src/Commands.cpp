#include "Subtitler/Commands.h"
#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace Subtitler {

namespace {

std::string Trim(const std::string& s){
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::string ToLower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::optional<int> ParseNonNegative(const std::string& s, int maxValue){
    if (s.empty() || s.size() > 9) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return std::nullopt;
    int v = std::stoi(s);
    if (v > maxValue) return std::nullopt;
    return v;
}

std::string MaskSecret(const std::string& s){
    if (s.empty()) return "(not set)";
    if (s.size() <= 4) return std::string(s.size(), '*');
    return std::string(s.size() - 4, '*') + s.substr(s.size() - 4);
}

CommandResult Rejected(std::string message){
    return CommandResult{false, false, std::move(message)};
}

}

CommandProcessor::CommandProcessor(Settings& settings, const SettingsStore& store, ISubtitleOverlay& overlay,
                                   TranslationSession& session, DeviceLister devices,
                                   std::shared_ptr<spdlog::logger> logger)
    : settings_(settings), store_(store), overlay_(overlay), session_(session),
      devices_(std::move(devices)), logger_(std::move(logger)) {}

std::string CommandProcessor::Help(){
    return
        "Commands:\n"
        "  start | stop | status        control translation\n"
        "  in <tag> | out <tag>         input/output language (e.g. en-US, es-ES)\n"
        "  devices | device <n>         list audio devices / choose one\n"
        "  font <Family,Size>           subtitle font (e.g. Arial,24)\n"
        "  color <#RRGGBB>              subtitle color\n"
        "  alpha <0-255>                subtitle background opacity\n"
        "  key <key> | region <region>  Azure Speech credentials\n"
        "  reset                        restore default settings\n"
        "  import <path> | export <path>\n"
        "  show | help | quit";
}

CommandResult CommandProcessor::Execute(const std::string& line){
    std::string trimmed = Trim(line);
    if (trimmed.empty()) return CommandResult{true, false, {}};

    auto space = std::find_if(trimmed.begin(), trimmed.end(), [](unsigned char c){ return std::isspace(c); });
    std::string verb = ToLower(std::string(trimmed.begin(), space));
    std::string arg = Trim(std::string(space, trimmed.end()));
    if (logger_) logger_->debug("Command '{}' arg='{}'", verb, verb == "key" ? MaskSecret(arg) : arg);

    if (verb == "help" || verb == "?") return CommandResult{true, false, Help()};
    if (verb == "quit" || verb == "exit"){
        session_.Stop();
        return CommandResult{true, true, "Bye."};
    }
    if (verb == "start") return StartSession();
    if (verb == "stop"){
        session_.Stop();
        return CommandResult{true, false, session_.Status()};
    }
    if (verb == "status") return CommandResult{true, false, session_.Status()};
    if (verb == "show") return CommandResult{true, false, Describe()};
    if (verb == "devices") return ListDevices();
    if (verb == "reset") return Commit(SettingsStore::ResetToDefaults(), true, "Settings reset to defaults.");

    static const std::vector<std::string> needsArg{"in", "out", "device", "font", "color", "alpha", "key", "region", "import", "export"};
    bool known = std::find(needsArg.begin(), needsArg.end(), verb) != needsArg.end();
    if (!known) return Rejected(fmt::format("Unknown command '{}'. Type 'help' for a list.", verb));
    // Credentials may legitimately be cleared with an empty value.
    if (arg.empty() && verb != "key" && verb != "region") return Rejected(fmt::format("'{}' needs a value.", verb));
    // Values end up in the JSON settings file, which only holds UTF-8. Paths are left to the filesystem.
    if (verb != "import" && verb != "export" && !IsValidUtf8(arg)){
        return Rejected(fmt::format("'{}' value is not valid UTF-8 text.", verb));
    }

    if (verb == "in") return SetLanguage(&Settings::inputLanguage, arg, "Input language");
    if (verb == "out") return SetLanguage(&Settings::outputLanguage, arg, "Output language");
    if (verb == "device") return SetDevice(arg);
    if (verb == "font") return SetFont(arg);
    if (verb == "color") return SetColor(arg);
    if (verb == "alpha") return SetAlpha(arg);
    if (verb == "import") return Import(arg);
    if (verb == "export") return Export(arg);

    Settings next = settings_;
    if (verb == "key"){
        next.azureSubscriptionKey = arg;
        return Commit(next, false, "Subscription key updated.");
    }
    next.azureRegion = arg;
    return Commit(next, false, fmt::format("Region set to '{}'.", arg));
}

CommandResult CommandProcessor::Commit(const Settings& next, bool restyle, std::string message){
    settings_ = next;
    if (restyle) overlay_.ApplyStyle(StyleFromSettings(settings_));
    if (session_.IsRunning() && !restyle) message += " Takes effect on next start.";
    if (!store_.Save(settings_)){
        return CommandResult{false, false, message + fmt::format(" Warning: settings could not be saved to '{}'.", store_.Path())};
    }
    return CommandResult{true, false, std::move(message)};
}

CommandResult CommandProcessor::SetLanguage(std::string Settings::* field, const std::string& value, const char* what){
    if (!IsValidLanguageTag(value)) return Rejected(fmt::format("'{}' is not a language tag like en-US.", value));
    Settings next = settings_;
    next.*field = value;
    return Commit(next, false, fmt::format("{} set to {}.", what, value));
}

CommandResult CommandProcessor::SetDevice(const std::string& value){
    auto index = ParseNonNegative(value, std::numeric_limits<int>::max());
    if (!index) return Rejected(fmt::format("'{}' is not a device index.", value));
    Settings next = settings_;
    next.audioDeviceIndex = *index;
    return Commit(next, false, fmt::format("Audio device set to {}.", *index));
}

CommandResult CommandProcessor::SetFont(const std::string& value){
    auto font = ParseFont(value);
    if (!font) return Rejected(fmt::format("'{}' is not a font like Arial,24 (size {}-{}).", value, kMinFontSize, kMaxFontSize));
    Settings next = settings_;
    next.subtitleFont = *font;
    return Commit(next, true, fmt::format("Subtitle font set to {}.", FormatFont(*font)));
}

CommandResult CommandProcessor::SetColor(const std::string& value){
    auto color = NormalizeColor(value);
    if (!color) return Rejected(fmt::format("'{}' is not a color like #FFFFFF.", value));
    Settings next = settings_;
    next.subtitleColor = *color;
    return Commit(next, true, fmt::format("Subtitle color set to {}.", *color));
}

CommandResult CommandProcessor::SetAlpha(const std::string& value){
    auto alpha = ParseNonNegative(value, 255);
    if (!alpha) return Rejected(fmt::format("'{}' is not an opacity between 0 and 255.", value));
    Settings next = settings_;
    next.subtitleBackgroundAlpha = *alpha;
    return Commit(next, true, fmt::format("Subtitle background opacity set to {}.", *alpha));
}

CommandResult CommandProcessor::ListDevices(){
    std::vector<AudioDevice> devices = devices_ ? devices_() : std::vector<AudioDevice>{};
    if (devices.empty()) return CommandResult{true, false, "No capture devices found; the silent source will be used."};
    std::ostringstream out;
    for (const auto& d : devices){
        out << (d.index == settings_.audioDeviceIndex ? "* " : "  ") << d.index << ": " << d.name << "\n";
    }
    std::string text = out.str();
    text.pop_back();
    return CommandResult{true, false, text};
}

CommandResult CommandProcessor::Import(const std::string& path){
    LoadReport report = store_.Import(path);
    if (!report.ok()){
        return Rejected(fmt::format("Could not import '{}' ({}); settings unchanged.", path, ToString(report.source)));
    }
    settings_ = report.settings;
    overlay_.ApplyStyle(StyleFromSettings(settings_));
    std::string message = fmt::format("Imported settings from '{}'.", path);
    if (!report.defaultedFields.empty()){
        message += fmt::format(" Defaults used for: {}.", fmt::join(report.defaultedFields, ", "));
    }
    return CommandResult{true, false, message};
}

CommandResult CommandProcessor::Export(const std::string& path){
    if (!store_.Export(settings_, path)) return Rejected(fmt::format("Could not export settings to '{}'.", path));
    return CommandResult{true, false, fmt::format("Settings exported to '{}'.", path)};
}

CommandResult CommandProcessor::StartSession(){
    if (session_.IsRunning()) return CommandResult{true, false, session_.Status()};
    bool saved = store_.Save(settings_);
    if (!session_.Start(settings_)) return Rejected("Translation could not be started. " + session_.Status());
    std::string message = session_.Status();
    if (!saved) message += fmt::format(" Warning: settings could not be saved to '{}'.", store_.Path());
    return CommandResult{saved, false, message};
}

std::string CommandProcessor::Describe() const {
    return fmt::format(
        "input_language: {}\noutput_language: {}\naudio_device_index: {}\nsubtitle_font: {}\n"
        "subtitle_color: {}\nsubtitle_background_alpha: {}\nazure_subscription_key: {}\nazure_region: {}\n"
        "settings file: {}\n{}",
        settings_.inputLanguage, settings_.outputLanguage, settings_.audioDeviceIndex,
        FormatFont(settings_.subtitleFont), settings_.subtitleColor, settings_.subtitleBackgroundAlpha,
        MaskSecret(settings_.azureSubscriptionKey), settings_.azureRegion.empty() ? "(not set)" : settings_.azureRegion,
        store_.Path(), session_.Status());
}

}
