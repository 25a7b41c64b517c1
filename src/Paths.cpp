#include "Subtitler/Paths.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <spdlog/spdlog.h>
#ifdef _WIN32
#include <windows.h>
#include <shlobj.h>
#endif

namespace fs = std::filesystem;

namespace Subtitler {

namespace {

fs::path UserConfigDirectory(){
#ifdef _WIN32
    PWSTR path = nullptr;
    if (SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, NULL, &path) != S_OK) return {};
    fs::path p(path);
    CoTaskMemFree(path);
    return p / "Subtitler";
#else
    std::string xdg = GetEnv("XDG_CONFIG_HOME");
    if (!xdg.empty()) return fs::path(xdg) / "subtitler";
    std::string home = GetEnv("HOME");
    if (home.empty()) return {};
    return fs::path(home) / ".config" / "subtitler";
#endif
}

}

std::string GetEnv(const char* name){
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string{};
}

bool EnvEquals(const char* name, const std::string& value){
    std::string v = GetEnv(name);
    return std::equal(v.begin(), v.end(), value.begin(), value.end(), [](unsigned char a, unsigned char b){
        return std::tolower(a) == std::tolower(b);
    });
}

fs::path GetConfigurationPath(){
    std::string overridePath = GetEnv("SUBTITLER_CONFIG_PATH");
    if (!overridePath.empty()) return fs::path(overridePath);

    fs::path dir = UserConfigDirectory();
    if (dir.empty()) return fs::current_path() / "config.json";

    fs::path cfgPath = dir / "config.json";
    std::error_code ec;
    if (!fs::exists(cfgPath, ec)){
        fs::path sample = fs::current_path(ec) / "config.sample.json";
        if (!ec && fs::exists(sample, ec)){
            fs::create_directories(dir, ec);
            fs::copy_file(sample, cfgPath, fs::copy_options::skip_existing, ec);
            if (ec) spdlog::warn("Could not seed settings from '{}': {}", sample.string(), ec.message());
        }
    }
    return cfgPath;
}

fs::path GetLogDirectory(const fs::path& configPath){
    fs::path dir = configPath.parent_path();
    if (dir.empty()) dir = fs::current_path();
    return dir / "logs";
}

}
