#include <cassert>
#include <algorithm>
#include <filesystem>
#include <string>
#include "Subtitler/Settings.h"
#include "../test_support.h"

using namespace Subtitler;
namespace fs = std::filesystem;

static bool Defaulted(const LoadReport& r, const std::string& key){
    return std::find(r.defaultedFields.begin(), r.defaultedFields.end(), key) != r.defaultedFields.end();
}

static Settings Customized(){
    Settings s;
    s.inputLanguage = "fr-FR";
    s.outputLanguage = "de-DE";
    s.audioDeviceIndex = 3;
    s.subtitleFont = SubtitleFont{"Segoe UI", 32};
    s.subtitleColor = "#FFCC00";
    s.azureSubscriptionKey = "0123456789abcdef";
    s.azureRegion = "westeurope";
    s.subtitleBackgroundAlpha = 200;
    return s;
}

static void defaults_match_documented_values(){
    Settings d = SettingsStore::ResetToDefaults();
    assert(d.inputLanguage == "en-US");
    assert(d.outputLanguage == "es-ES");
    assert(d.audioDeviceIndex == 0);
    assert(FormatFont(d.subtitleFont) == "Arial,24");
    assert(d.subtitleColor == "#FFFFFF");
    assert(d.azureSubscriptionKey.empty());
    assert(d.azureRegion.empty());
    assert(d.subtitleBackgroundAlpha == 128);
    assert(SettingsStore::ResetToDefaults() == d);
}

static void missing_file_yields_defaults(){
    testsupport::TempDir dir("settings_missing");
    LoadReport r = SettingsStore::LoadFrom(dir.file("nope.json"));
    assert(r.source == SettingsSource::MissingFile);
    assert(!r.ok());
    assert(r.settings == Settings{});
}

static void save_then_load_round_trips(){
    testsupport::TempDir dir("settings_roundtrip");
    SettingsStore store(dir.file("nested/config.json"));
    Settings s = Customized();
    assert(store.Save(s));
    assert(!fs::exists(dir.file("nested/config.json.tmp")));

    LoadReport r = store.Load();
    assert(r.ok());
    assert(r.defaultedFields.empty());
    assert(r.settings == s);
}

static void missing_fields_take_defaults(){
    testsupport::TempDir dir("settings_partial");
    std::string path = dir.file("config.json");
    testsupport::WriteFile(path, R"({"input_language": "ja-JP", "subtitle_color": "#0f0"})");

    LoadReport r = SettingsStore::LoadFrom(path);
    assert(r.ok());
    assert(r.settings.inputLanguage == "ja-JP");
    assert(r.settings.subtitleColor == "#00FF00");
    assert(r.settings.outputLanguage == "es-ES");
    assert(r.settings.audioDeviceIndex == 0);
    assert(Defaulted(r, "output_language"));
    assert(Defaulted(r, "azure_region"));
    assert(!Defaulted(r, "input_language"));
    assert(r.defaultedFields.size() == 6);
}

static void invalid_fields_are_defaulted_individually(){
    testsupport::TempDir dir("settings_invalid");
    std::string path = dir.file("config.json");
    testsupport::WriteFile(path, R"({
        "input_language": "english",
        "output_language": "it-IT",
        "audio_device_index": -1,
        "subtitle_font": "Arial,500",
        "subtitle_color": "red",
        "azure_subscription_key": 42,
        "azure_region": "eastus",
        "subtitle_background_alpha": 12.5
    })");

    LoadReport r = SettingsStore::LoadFrom(path);
    assert(r.ok());
    assert(r.settings.inputLanguage == "en-US");
    assert(r.settings.outputLanguage == "it-IT");
    assert(r.settings.audioDeviceIndex == 0);
    assert(FormatFont(r.settings.subtitleFont) == "Arial,24");
    assert(r.settings.subtitleColor == "#FFFFFF");
    assert(r.settings.azureSubscriptionKey.empty());
    assert(r.settings.azureRegion == "eastus");
    assert(r.settings.subtitleBackgroundAlpha == 128);
    assert(r.defaultedFields.size() == 6);
}

static void unknown_keys_are_ignored(){
    testsupport::TempDir dir("settings_unknown");
    std::string path = dir.file("config.json");
    testsupport::WriteFile(path, R"({"output_language": "pt-BR", "theme": "dark"})");
    LoadReport r = SettingsStore::LoadFrom(path);
    assert(r.ok());
    assert(r.settings.outputLanguage == "pt-BR");
}

static void malformed_documents_yield_defaults(){
    testsupport::TempDir dir("settings_malformed");
    std::string broken = dir.file("broken.json");
    testsupport::WriteFile(broken, "{\"input_language\": \"fr-FR\",");
    LoadReport r = SettingsStore::LoadFrom(broken);
    assert(r.source == SettingsSource::Malformed);
    assert(r.settings == Settings{});

    std::string array = dir.file("array.json");
    testsupport::WriteFile(array, "[1, 2, 3]");
    r = SettingsStore::LoadFrom(array);
    assert(r.source == SettingsSource::Malformed);
    assert(r.settings == Settings{});

    std::string empty = dir.file("empty.json");
    testsupport::WriteFile(empty, "");
    assert(SettingsStore::LoadFrom(empty).source == SettingsSource::Malformed);
}

static void failed_save_keeps_previous_file(){
    testsupport::TempDir dir("settings_failsave");
    std::string path = dir.file("config.json");
    SettingsStore store(path);
    Settings saved = Customized();
    assert(store.Save(saved));
    std::string before = testsupport::ReadFile(path);

    // The temporary file cannot be created when a directory occupies its name.
    fs::create_directories(path + ".tmp");
    Settings other;
    other.outputLanguage = "ko-KR";
    assert(!store.Save(other));
    assert(testsupport::ReadFile(path) == before);
    assert(store.Load().settings == saved);

    std::string blocker = dir.file("plainfile");
    testsupport::WriteFile(blocker, "x");
    assert(!SettingsStore::SaveTo(other, blocker + "/config.json"));
}

static void directory_at_settings_path_is_unreadable(){
    testsupport::TempDir dir("settings_dirpath");
    std::string path = dir.file("config.json");
    fs::create_directories(path);
    LoadReport r = SettingsStore::LoadFrom(path);
    assert(r.source == SettingsSource::Unreadable);
    assert(r.settings == Settings{});
}

static void unserializable_record_is_not_saved(){
    testsupport::TempDir dir("settings_badtext");
    std::string path = dir.file("config.json");
    SettingsStore store(path);
    Settings saved = Customized();
    assert(store.Save(saved));

    Settings bad = saved;
    bad.azureSubscriptionKey = "\xFF\xFE";
    assert(!store.Save(bad));
    assert(!fs::exists(path + ".tmp"));
    assert(store.Load().settings == saved);
}

static void export_and_import(){
    testsupport::TempDir dir("settings_transfer");
    SettingsStore store(dir.file("config.json"));
    Settings s = Customized();
    assert(store.Export(s, dir.file("exported.json")));
    assert(!fs::exists(dir.file("config.json")));

    LoadReport imported = store.Import(dir.file("exported.json"));
    assert(imported.ok());
    assert(imported.settings == s);
    assert(store.Load().settings == s);
}

static void corrupted_import_does_not_overwrite(){
    testsupport::TempDir dir("settings_badimport");
    SettingsStore store(dir.file("config.json"));
    Settings s = Customized();
    assert(store.Save(s));

    std::string bad = dir.file("bad.json");
    testsupport::WriteFile(bad, "not json at all");
    LoadReport r = store.Import(bad);
    assert(!r.ok());
    assert(r.source == SettingsSource::Malformed);
    assert(r.settings == Settings{});
    assert(store.Load().settings == s);

    r = store.Import(dir.file("does_not_exist.json"));
    assert(r.source == SettingsSource::MissingFile);
    assert(store.Load().settings == s);
}

static void font_parsing(){
    auto f = ParseFont("Arial,24");
    assert(f && f->family == "Arial" && f->pointSize == 24);
    f = ParseFont(" Segoe UI , 18 ");
    assert(f && f->family == "Segoe UI" && f->pointSize == 18);
    assert(!ParseFont("Arial"));
    assert(!ParseFont(",24"));
    assert(!ParseFont("Arial,5"));
    assert(!ParseFont("Arial,201"));
    assert(!ParseFont("Arial,big"));
    assert(ParseFont("Arial,6") && ParseFont("Arial,200"));
    assert(FormatFont(SubtitleFont{"Consolas", 40}) == "Consolas,40");
}

static void color_parsing(){
    assert(NormalizeColor("#ffcc00") == std::optional<std::string>("#FFCC00"));
    assert(NormalizeColor("#abc") == std::optional<std::string>("#AABBCC"));
    assert(!NormalizeColor("ffcc00"));
    assert(!NormalizeColor("#ffcc0"));
    assert(!NormalizeColor("#ggcc00"));
    auto rgb = ParseColor("#10FF80");
    assert(rgb && rgb->r == 0x10 && rgb->g == 0xFF && rgb->b == 0x80);
}

static void language_tags(){
    assert(IsValidLanguageTag("en-US"));
    assert(IsValidLanguageTag("es"));
    assert(IsValidLanguageTag("zh-Hans-CN"));
    assert(IsValidLanguageTag("yue-HK"));
    assert(!IsValidLanguageTag(""));
    assert(!IsValidLanguageTag("english"));
    assert(!IsValidLanguageTag("en-"));
    assert(!IsValidLanguageTag("-US"));
    assert(!IsValidLanguageTag("e1-US"));
    assert(!IsValidLanguageTag("en--US"));
}

static void utf8_validation(){
    assert(IsValidUtf8(""));
    assert(IsValidUtf8("Arial"));
    assert(IsValidUtf8("Se\xC3\xB1or"));
    assert(IsValidUtf8("\xE6\x97\xA5\xE6\x9C\xAC"));
    assert(IsValidUtf8("\xF0\x9F\x98\x80"));
    assert(!IsValidUtf8("Se\xF1or"));
    assert(!IsValidUtf8("\xFF"));
    assert(!IsValidUtf8("\xC3"));
    assert(!IsValidUtf8("\xC0\xAF"));
    assert(!IsValidUtf8("\xED\xA0\x80"));
    assert(!IsValidUtf8("\xF4\x90\x80\x80"));
}

int main(){
    defaults_match_documented_values();
    missing_file_yields_defaults();
    save_then_load_round_trips();
    missing_fields_take_defaults();
    invalid_fields_are_defaulted_individually();
    unknown_keys_are_ignored();
    malformed_documents_yield_defaults();
    failed_save_keeps_previous_file();
    directory_at_settings_path_is_unreadable();
    unserializable_record_is_not_saved();
    export_and_import();
    corrupted_import_does_not_overwrite();
    font_parsing();
    color_parsing();
    language_tags();
    utf8_validation();
    return 0;
}
