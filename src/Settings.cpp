#include "Subtitler/Settings.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace Subtitler {

namespace {

constexpr const char* kInputLanguage = "input_language";
constexpr const char* kOutputLanguage = "output_language";
constexpr const char* kAudioDeviceIndex = "audio_device_index";
constexpr const char* kSubtitleFont = "subtitle_font";
constexpr const char* kSubtitleColor = "subtitle_color";
constexpr const char* kSubscriptionKey = "azure_subscription_key";
constexpr const char* kRegion = "azure_region";
constexpr const char* kBackgroundAlpha = "subtitle_background_alpha";

std::string Trim(const std::string& s){
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

int HexDigit(char c){
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool IsAlnumRun(const std::string& s, size_t minLen, size_t maxLen, bool lettersOnly){
    if (s.size() < minLen || s.size() > maxLen) return false;
    return std::all_of(s.begin(), s.end(), [lettersOnly](unsigned char c){
        return lettersOnly ? std::isalpha(c) != 0 : std::isalnum(c) != 0;
    });
}

std::optional<int> ReadInt(const nlohmann::json& v, int minValue, int maxValue){
    if (!v.is_number_integer()) return std::nullopt;
    if (v.is_number_unsigned()){
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(maxValue)) return std::nullopt;
        return static_cast<int>(u);
    }
    auto i = v.get<std::int64_t>();
    if (i < minValue || i > maxValue) return std::nullopt;
    return static_cast<int>(i);
}

// Applies one field: present and valid values overwrite the default, anything else is recorded.
template <typename Parse>
void ApplyField(const nlohmann::json& root, const char* key, LoadReport& report,
                const std::shared_ptr<spdlog::logger>& logger, Parse&& parse){
    auto it = root.find(key);
    if (it == root.end()){
        report.defaultedFields.emplace_back(key);
        if (logger) logger->debug("Settings: '{}' missing, using default", key);
        return;
    }
    if (!parse(*it)){
        report.defaultedFields.emplace_back(key);
        if (logger) logger->warn("Settings: '{}' has invalid value {}, using default", key, it->dump());
    }
}

nlohmann::json ToJson(const Settings& s){
    nlohmann::json j;
    j[kInputLanguage] = s.inputLanguage;
    j[kOutputLanguage] = s.outputLanguage;
    j[kAudioDeviceIndex] = s.audioDeviceIndex;
    j[kSubtitleFont] = FormatFont(s.subtitleFont);
    j[kSubtitleColor] = s.subtitleColor;
    j[kSubscriptionKey] = s.azureSubscriptionKey;
    j[kRegion] = s.azureRegion;
    j[kBackgroundAlpha] = s.subtitleBackgroundAlpha;
    return j;
}

LoadReport FromJson(const nlohmann::json& root, const std::shared_ptr<spdlog::logger>& logger){
    LoadReport report;
    report.source = SettingsSource::File;
    Settings& s = report.settings;

    auto language = [](std::string& field){
        return [&field](const nlohmann::json& v){
            if (!v.is_string() || !IsValidLanguageTag(v.get<std::string>())) return false;
            field = v.get<std::string>();
            return true;
        };
    };
    auto text = [](std::string& field){
        return [&field](const nlohmann::json& v){
            if (!v.is_string()) return false;
            field = v.get<std::string>();
            return true;
        };
    };

    ApplyField(root, kInputLanguage, report, logger, language(s.inputLanguage));
    ApplyField(root, kOutputLanguage, report, logger, language(s.outputLanguage));
    ApplyField(root, kAudioDeviceIndex, report, logger, [&s](const nlohmann::json& v){
        auto index = ReadInt(v, 0, std::numeric_limits<int>::max());
        if (!index) return false;
        s.audioDeviceIndex = *index;
        return true;
    });
    ApplyField(root, kSubtitleFont, report, logger, [&s](const nlohmann::json& v){
        if (!v.is_string()) return false;
        auto font = ParseFont(v.get<std::string>());
        if (!font) return false;
        s.subtitleFont = *font;
        return true;
    });
    ApplyField(root, kSubtitleColor, report, logger, [&s](const nlohmann::json& v){
        if (!v.is_string()) return false;
        auto color = NormalizeColor(v.get<std::string>());
        if (!color) return false;
        s.subtitleColor = *color;
        return true;
    });
    ApplyField(root, kSubscriptionKey, report, logger, text(s.azureSubscriptionKey));
    ApplyField(root, kRegion, report, logger, text(s.azureRegion));
    ApplyField(root, kBackgroundAlpha, report, logger, [&s](const nlohmann::json& v){
        auto alpha = ReadInt(v, 0, 255);
        if (!alpha) return false;
        s.subtitleBackgroundAlpha = *alpha;
        return true;
    });
    return report;
}

}

std::optional<SubtitleFont> ParseFont(const std::string& text){
    auto comma = text.rfind(',');
    if (comma == std::string::npos) return std::nullopt;
    std::string family = Trim(text.substr(0, comma));
    std::string size = Trim(text.substr(comma + 1));
    if (family.empty() || size.empty() || size.size() > 3) return std::nullopt;
    if (!std::all_of(size.begin(), size.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return std::nullopt;
    int points = std::stoi(size);
    if (points < kMinFontSize || points > kMaxFontSize) return std::nullopt;
    return SubtitleFont{family, points};
}

std::string FormatFont(const SubtitleFont& font){
    return font.family + "," + std::to_string(font.pointSize);
}

std::optional<std::string> NormalizeColor(const std::string& text){
    std::string s = Trim(text);
    if (s.empty() || s[0] != '#') return std::nullopt;
    std::string digits = s.substr(1);
    if (digits.size() == 3){
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6) return std::nullopt;
    for (char& c : digits){
        if (HexDigit(c) < 0) return std::nullopt;
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return "#" + digits;
}

std::optional<Rgb> ParseColor(const std::string& text){
    auto normalized = NormalizeColor(text);
    if (!normalized) return std::nullopt;
    const std::string& n = *normalized;
    auto channel = [&n](size_t at){ return static_cast<std::uint8_t>(HexDigit(n[at]) * 16 + HexDigit(n[at + 1])); };
    return Rgb{channel(1), channel(3), channel(5)};
}

bool IsValidLanguageTag(const std::string& tag){
    if (tag.empty()) return false;
    std::stringstream ss(tag);
    std::string part;
    bool primary = true;
    size_t consumed = 0;
    while (std::getline(ss, part, '-')){
        consumed += part.size() + 1;
        if (primary){
            if (!IsAlnumRun(part, 2, 3, true)) return false;
            primary = false;
        } else if (!IsAlnumRun(part, 1, 8, false)){
            return false;
        }
    }
    // getline drops a trailing empty segment ("en-")
    return consumed == tag.size() + 1;
}

bool IsValidUtf8(const std::string& text){
    size_t i = 0;
    while (i < text.size()){
        const unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra;
        std::uint32_t cp;
        if (c < 0x80){ ++i; continue; }
        else if (c >= 0xC2 && c <= 0xDF){ extra = 1; cp = c & 0x1F; }
        else if (c >= 0xE0 && c <= 0xEF){ extra = 2; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4){ extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= text.size()) return false;
        for (size_t k = 1; k <= extra; ++k){
            const unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += extra + 1;
    }
    return true;
}

const char* ToString(SettingsSource source){
    switch (source){
        case SettingsSource::File: return "file";
        case SettingsSource::MissingFile: return "missing file";
        case SettingsSource::Unreadable: return "unreadable file";
        case SettingsSource::Malformed: return "malformed file";
        default: return "unknown";
    }
}

SettingsStore::SettingsStore(std::string path, std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)), logger_(std::move(logger)) {}

Settings SettingsStore::ResetToDefaults(){
    return Settings{};
}

LoadReport SettingsStore::LoadFrom(const std::string& path, const std::shared_ptr<spdlog::logger>& logger){
    LoadReport defaults;
    std::error_code ec;
    if (!fs::exists(path, ec)){
        defaults.source = ec ? SettingsSource::Unreadable : SettingsSource::MissingFile;
        if (logger) logger->warn("Settings file '{}' not found, using defaults", path);
        return defaults;
    }

    if (!fs::is_regular_file(path, ec)){
        defaults.source = SettingsSource::Unreadable;
        if (logger) logger->error("Settings path '{}' is not a regular file, using defaults", path);
        return defaults;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()){
        defaults.source = SettingsSource::Unreadable;
        if (logger) logger->error("Settings file '{}' could not be opened, using defaults", path);
        return defaults;
    }
    std::ostringstream ss; ss << f.rdbuf();
    if (f.bad()){
        defaults.source = SettingsSource::Unreadable;
        if (logger) logger->error("Settings file '{}' could not be read, using defaults", path);
        return defaults;
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e){
        defaults.source = SettingsSource::Malformed;
        if (logger) logger->error("Error decoding settings file '{}': {}. Using defaults", path, e.what());
        return defaults;
    }
    if (!root.is_object()){
        defaults.source = SettingsSource::Malformed;
        if (logger) logger->error("Settings file '{}' is not a JSON object, using defaults", path);
        return defaults;
    }

    LoadReport report = FromJson(root, logger);
    if (logger) logger->info("Loaded settings from '{}' ({} field(s) defaulted)", path, report.defaultedFields.size());
    return report;
}

bool SettingsStore::SaveTo(const Settings& settings, const std::string& path, const std::shared_ptr<spdlog::logger>& logger){
    const fs::path target(path);
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()){
        fs::create_directories(target.parent_path(), ec);
        if (ec){
            if (logger) logger->error("Cannot create settings directory '{}': {}", target.parent_path().string(), ec.message());
            return false;
        }
    }

    std::string text;
    try {
        text = ToJson(settings).dump(4);
    } catch (const nlohmann::json::exception& e){
        if (logger) logger->error("Cannot serialize settings for '{}': {}", path, e.what());
        return false;
    }
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f.is_open()){
            if (logger) logger->error("Cannot open '{}' for writing", tmp.string());
            return false;
        }
        f << text << '\n';
        f.flush();
        if (!f){
            f.close();
            fs::remove(tmp, ec);
            if (logger) logger->error("Failed writing settings to '{}'", tmp.string());
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec){
        if (logger) logger->error("Cannot replace settings file '{}': {}", path, ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    if (logger) logger->debug("Saved settings to '{}'", path);
    return true;
}

LoadReport SettingsStore::Load() const {
    return LoadFrom(path_, logger_);
}

bool SettingsStore::Save(const Settings& settings) const {
    return SaveTo(settings, path_, logger_);
}

bool SettingsStore::Export(const Settings& settings, const std::string& destination) const {
    if (logger_) logger_->info("Exporting settings to '{}'", destination);
    return SaveTo(settings, destination, logger_);
}

LoadReport SettingsStore::Import(const std::string& source) const {
    if (logger_) logger_->info("Importing settings from '{}'", source);
    LoadReport report = LoadFrom(source, logger_);
    if (!report.ok()){
        report.settings = ResetToDefaults();
        return report;
    }
    if (!Save(report.settings)){
        if (logger_) logger_->error("Imported settings could not be persisted to '{}'", path_);
    }
    return report;
}

}
