#include "Subtitler/Audio.h"
#include "Subtitler/Commands.h"
#include "Subtitler/Logging.h"
#include "Subtitler/Overlay.h"
#include "Subtitler/Paths.h"
#include "Subtitler/Settings.h"
#include "Subtitler/TranslationSession.h"
#include "Subtitler/Translator.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#ifdef _WIN32
#include <windows.h>
#endif
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace Subtitler {

// Lines typed on stdin, handed to the UI thread.
struct InputQueue {
    std::mutex mu;
    std::deque<std::string> lines;
    std::atomic<bool> closed{false};
};

struct AppComponents {
    std::unique_ptr<SettingsStore> store;
    Settings settings;
    std::unique_ptr<ISubtitleOverlay> overlay;
    std::unique_ptr<TranslationSession> session;
    std::unique_ptr<CommandProcessor> commands;
};

// Missing or partly invalid files are recovered silently; unreadable ones are reported.
void ReportLoad(const LoadReport& report, const std::string& path){
    switch (report.source){
        case SettingsSource::File:
            if (!report.defaultedFields.empty())
                std::cerr << "Some settings in '" << path << "' were invalid or missing; defaults used for them.\n";
            break;
        case SettingsSource::MissingFile:
            break;
        case SettingsSource::Unreadable:
        case SettingsSource::Malformed:
            std::cerr << "Settings file '" << path << "' could not be used (" << ToString(report.source)
                      << "); continuing with default settings.\n";
            break;
    }
}

std::unique_ptr<AppComponents> InitializeComponents(const fs::path& cfgPath){
    auto components = std::make_unique<AppComponents>();

    components->store = std::make_unique<SettingsStore>(cfgPath.string(), logsys::component("settings"));
    LoadReport report = components->store->Load();
    ReportLoad(report, cfgPath.string());
    components->settings = report.settings;

    auto overlayLogger = logsys::component("overlay");
    components->overlay = CreateConfiguredOverlay(overlayLogger);
    if (!components->overlay->Initialize(StyleFromSettings(components->settings))){
        spdlog::warn("Overlay window unavailable, printing subtitles to the console");
        components->overlay = CreateOverlayConsole(std::cout, overlayLogger);
        if (!components->overlay->Initialize(StyleFromSettings(components->settings))) return nullptr;
    }

    auto audioLogger = logsys::component("audio");
    auto translatorLogger = logsys::component("translator");
    components->session = std::make_unique<TranslationSession>(
        *components->overlay,
        [audioLogger](int deviceIndex){ return CreateConfiguredAudioSource(deviceIndex, audioLogger); },
        [translatorLogger]{ return CreateConfiguredTranslator(translatorLogger); },
        logsys::component("session"));

    components->commands = std::make_unique<CommandProcessor>(
        components->settings, *components->store, *components->overlay, *components->session,
        [audioLogger]{ return EnumerateAudioDevices(audioLogger); },
        logsys::component("commands"));
    return components;
}

void StartInputReader(const std::shared_ptr<InputQueue>& queue){
    // Detached: std::getline cannot be interrupted, and the queue outlives the thread via shared_ptr.
    std::thread([queue]{
        std::string line;
        while (std::getline(std::cin, line)){
            std::lock_guard<std::mutex> lk(queue->mu);
            queue->lines.push_back(line);
        }
        queue->closed = true;
    }).detach();
}

void RunMainLoop(AppComponents& components){
    auto input = std::make_shared<InputQueue>();
    StartInputReader(input);
    std::cout << CommandProcessor::Help() << "\n" << components.session->Status() << std::endl;

    bool quit = false;
    while (!quit){
#ifdef _WIN32
        MSG msg{};
        while (PeekMessage(&msg, nullptr, 0, 0, PM_REMOVE)){
            if (msg.message == WM_QUIT) quit = true;
            TranslateMessage(&msg);
            DispatchMessage(&msg);
        }
#endif
        std::deque<std::string> lines;
        {
            std::lock_guard<std::mutex> lk(input->mu);
            lines.swap(input->lines);
        }
        for (const auto& line : lines){
            CommandResult result = components.commands->Execute(line);
            if (!result.message.empty()) (result.ok ? std::cout : std::cerr) << result.message << std::endl;
            if (result.quit){ quit = true; break; }
        }
        if (lines.empty() && input->closed) quit = true;

        components.session->Pump();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    components.session->Stop();
    components.overlay->Hide();
}

}

int main(){
    using namespace Subtitler;

    fs::path cfgPath = GetConfigurationPath();
    logsys::init(!GetEnv("SUBTITLER_VERBOSE").empty(), GetLogDirectory(cfgPath).string());
    spdlog::info("Subtitler starting, settings at '{}'", cfgPath.string());

    auto components = InitializeComponents(cfgPath);
    if (!components){
        spdlog::critical("Failed to initialize application");
        logsys::shutdown();
        return 1;
    }

    RunMainLoop(*components);
    components.reset();
    logsys::shutdown();
    return 0;
}
