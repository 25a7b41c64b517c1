#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace Subtitler {

struct SubtitleFont {
    std::string family{"Arial"};
    int pointSize{24};

    bool operator==(const SubtitleFont&) const = default;
};

struct Settings {
    std::string inputLanguage{"en-US"};
    std::string outputLanguage{"es-ES"};
    int audioDeviceIndex{0};
    SubtitleFont subtitleFont{};
    std::string subtitleColor{"#FFFFFF"};
    std::string azureSubscriptionKey;
    std::string azureRegion;
    int subtitleBackgroundAlpha{128};

    bool operator==(const Settings&) const = default;
};

struct Rgb {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
};

inline constexpr int kMinFontSize = 6;
inline constexpr int kMaxFontSize = 200;

// "Family,Size" as stored in the settings file. Family is trimmed; size must be in range.
std::optional<SubtitleFont> ParseFont(const std::string& text);
std::string FormatFont(const SubtitleFont& font);

// Accepts #RGB and #RRGGBB; returns upper-case #RRGGBB.
std::optional<std::string> NormalizeColor(const std::string& text);
std::optional<Rgb> ParseColor(const std::string& text);

bool IsValidLanguageTag(const std::string& tag);
// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool IsValidUtf8(const std::string& text);

// How a load obtained its record.
enum class SettingsSource {
    File,        // parsed; individual fields may still have been defaulted
    MissingFile,
    Unreadable,
    Malformed    // not JSON, or the root is not an object
};

const char* ToString(SettingsSource source);

struct LoadReport {
    Settings settings{};
    SettingsSource source{SettingsSource::MissingFile};
    std::vector<std::string> defaultedFields;

    bool ok() const { return source == SettingsSource::File; }
};

// Owns the location of the settings file. All calls happen on the UI thread.
class SettingsStore {
public:
    explicit SettingsStore(std::string path, std::shared_ptr<spdlog::logger> logger = nullptr);

    const std::string& Path() const { return path_; }

    static Settings ResetToDefaults();

    // Never throws. Missing or malformed content yields defaults field by field.
    static LoadReport LoadFrom(const std::string& path, const std::shared_ptr<spdlog::logger>& logger = nullptr);
    // Writes atomically through a sibling temporary file; the prior file survives any failure.
    static bool SaveTo(const Settings& settings, const std::string& path, const std::shared_ptr<spdlog::logger>& logger = nullptr);

    LoadReport Load() const;
    bool Save(const Settings& settings) const;
    bool Export(const Settings& settings, const std::string& destination) const;
    // Persists the imported record only when the source parsed as a settings document.
    LoadReport Import(const std::string& source) const;

private:
    std::string path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}
