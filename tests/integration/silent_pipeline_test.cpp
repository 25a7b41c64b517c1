// End to end without devices or network: silent capture, stub translator, console overlay.
#include <cassert>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <thread>
#include "Subtitler/Audio.h"
#include "Subtitler/Commands.h"
#include "Subtitler/Logging.h"
#include "Subtitler/Overlay.h"
#include "Subtitler/TranslationSession.h"
#include "Subtitler/Translator.h"
#include "../test_support.h"

using namespace Subtitler;

int main(){
    testsupport::TempDir dir("pipeline");
    logsys::init(true, (dir.path() / "logs").string());

    testsupport::SetEnv("SUBTITLER_AUDIO_SOURCE", "silent");
    testsupport::SetEnv("SUBTITLER_TRANSLATOR", "stub");

    std::ostringstream subtitles;
    auto overlay = CreateOverlayConsole(subtitles, logsys::component("overlay"));
    assert(overlay->Initialize(StyleFromSettings(Settings{})));

    auto audioLogger = logsys::component("audio");
    auto translatorLogger = logsys::component("translator");
    TranslationSession session(
        *overlay,
        [audioLogger](int device){ return CreateConfiguredAudioSource(device, audioLogger); },
        [translatorLogger]{ return CreateConfiguredTranslator(translatorLogger); },
        logsys::component("session"));

    SettingsStore store(dir.file("config.json"), logsys::component("settings"));
    Settings settings = store.Load().settings;
    CommandProcessor commands(settings, store, *overlay, session, []{ return std::vector<AudioDevice>{}; },
                              logsys::component("commands"));

    CommandResult r = commands.Execute("start");
    assert(r.ok);
    assert(session.IsRunning());
    for (int i = 0; i < 5; ++i){
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        // The stub translator consumes audio but never emits.
        assert(session.Pump() == 0);
    }
    assert(commands.Execute("stop").ok);
    assert(!session.IsRunning());
    assert(subtitles.str().empty());
    assert(commands.Execute("devices").message.find("silent source") != std::string::npos);

    // Without the stub, the Azure translator refuses to start with no credentials.
    testsupport::SetEnv("SUBTITLER_TRANSLATOR", "");
    r = commands.Execute("start");
    assert(!r.ok);
    assert(!session.IsRunning());
    assert(subtitles.str().rfind("[subtitle] Error in translation:", 0) == 0);

    // Repeated identical subtitles are shown once.
    overlay->ShowText("hola");
    overlay->ShowText("hola");
    std::string out = subtitles.str();
    assert(out.find("[subtitle] hola") != std::string::npos);
    assert(out.find("[subtitle] hola") == out.rfind("[subtitle] hola"));

    assert(commands.Execute("quit").quit);
    logsys::shutdown();
    assert(std::filesystem::exists(dir.path() / "logs" / "subtitler.log"));
    return 0;
}
