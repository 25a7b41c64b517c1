#include <cassert>
#include <algorithm>
#include <utility>
#include <memory>
#include <string>
#include <vector>
#include "Subtitler/TranslationSession.h"

using namespace Subtitler;

namespace {

struct RecordingOverlay : ISubtitleOverlay {
    std::vector<std::string> shown;
    std::vector<OverlayStyle> styles;
    int hides = 0;
    bool Initialize(const OverlayStyle& style) override { styles.push_back(style); return true; }
    void ApplyStyle(const OverlayStyle& style) override { styles.push_back(style); }
    void ShowText(const std::string& text) override { shown.push_back(text); }
    void Hide() override { ++hides; }
};

// Observations shared between the test and the components the session owns.
struct Probe {
    TranslationConfig config;
    TranslationCallback emit;
    std::vector<size_t> pushedFrames;
    float lastPeak = 0.0f;
    int requestedDevice = -1;
    AudioCallback capture;
    int translatorStops = 0;
    int audioStops = 0;
};

struct FakeTranslator : ITranslator {
    Probe& probe;
    bool initOk;
    bool startOk;
    bool running = false;
    FakeTranslator(Probe& p, bool ok, bool starts) : probe(p), initOk(ok), startOk(starts) {}
    bool Initialize(const TranslationConfig& config, const std::shared_ptr<spdlog::logger>&) override {
        probe.config = config;
        return initOk;
    }
    void Start(TranslationCallback onEvent) override {
        probe.emit = std::move(onEvent);
        running = startOk;
        if (!startOk) probe.emit({TranslationEvent::Kind::Error, "service unreachable", {}});
    }
    bool IsRunning() const override { return running; }
    void PushAudio(const AudioBuffer& frame) override {
        probe.pushedFrames.push_back(frame.size());
        float peak = 0.0f;
        for (float s : frame) peak = std::max(peak, s < 0 ? -s : s);
        probe.lastPeak = peak;
    }
    void Stop() override { ++probe.translatorStops; probe.emit = nullptr; }
};

struct FakeAudio : IAudioSource {
    Probe& probe;
    explicit FakeAudio(Probe& p) : probe(p) {}
    bool Initialize(int, int, int) override { return true; }
    void Start(AudioCallback onAudio) override { probe.capture = std::move(onAudio); }
    void Stop() override { ++probe.audioStops; probe.capture = nullptr; }
};

struct Fixture {
    Probe probe;
    RecordingOverlay overlay;
    bool translatorInitOk = true;
    bool translatorStartOk = true;
    bool audioAvailable = true;
    TranslationSession session{
        overlay,
        [this](int device) -> std::unique_ptr<IAudioSource> {
            probe.requestedDevice = device;
            if (!audioAvailable) return nullptr;
            return std::make_unique<FakeAudio>(probe);
        },
        [this]{ return std::make_unique<FakeTranslator>(probe, translatorInitOk, translatorStartOk); }};
};

Settings SampleSettings(){
    Settings s;
    s.inputLanguage = "en-GB";
    s.outputLanguage = "fr-FR";
    s.audioDeviceIndex = 2;
    s.azureSubscriptionKey = "key";
    s.azureRegion = "westus";
    return s;
}

}

static void start_wires_settings_into_components(){
    Fixture f;
    assert(f.session.Status() == "Status: Stopped");
    assert(f.session.Start(SampleSettings()));
    assert(f.session.IsRunning());
    assert(f.session.Status() == "Status: Running");
    assert(f.probe.config.sourceLanguage == "en-GB");
    assert(f.probe.config.targetLanguage == "fr-FR");
    assert(f.probe.config.subscriptionKey == "key");
    assert(f.probe.config.region == "westus");
    assert(f.probe.requestedDevice == 2);
    assert(f.probe.emit && f.probe.capture);

    // Starting again is a no-op.
    assert(f.session.Start(SampleSettings()));
    f.session.Stop();
}

static void audio_is_conditioned_and_forwarded(){
    Fixture f;
    assert(f.session.Start(SampleSettings()));
    AudioBuffer frame(320, 0.0f);
    frame[10] = 0.05f;
    f.probe.capture(frame);
    assert(f.probe.pushedFrames.size() == 1);
    assert(f.probe.pushedFrames[0] == 320);
    assert(f.probe.lastPeak > 0.999f && f.probe.lastPeak < 1.001f);
    f.session.Stop();
}

static void events_reach_overlay_only_on_pump(){
    Fixture f;
    assert(f.session.Start(SampleSettings()));
    f.probe.emit({TranslationEvent::Kind::Translated, "bonjour", "hello"});
    f.probe.emit({TranslationEvent::Kind::NoMatch, "No speech could be recognized.", {}});
    f.probe.emit({TranslationEvent::Kind::Canceled, "Error: bad key", {}});
    f.probe.emit({TranslationEvent::Kind::Error, "socket closed", {}});
    f.probe.emit({TranslationEvent::Kind::Translated, "", {}});
    assert(f.overlay.shown.empty());

    assert(f.session.Pump() == 4);
    assert(f.overlay.shown.size() == 4);
    assert(f.overlay.shown[0] == "bonjour");
    assert(f.overlay.shown[1] == "No speech could be recognized.");
    assert(f.overlay.shown[2] == "Speech Recognition canceled: Error: bad key");
    assert(f.overlay.shown[3] == "Error in translation: socket closed");
    assert(f.session.Pump() == 0);
    f.session.Stop();
}

static void translator_init_failure_keeps_session_stopped(){
    Fixture f;
    f.translatorInitOk = false;
    assert(!f.session.Start(SampleSettings()));
    assert(!f.session.IsRunning());
    assert(f.session.Status() == "Status: Stopped");
    assert(f.probe.requestedDevice == -1);
    assert(f.overlay.shown.size() == 1);
    assert(f.overlay.shown[0].rfind("Error in translation:", 0) == 0);
}

static void recognition_start_failure_keeps_session_stopped(){
    Fixture f;
    f.translatorStartOk = false;
    assert(!f.session.Start(SampleSettings()));
    assert(!f.session.IsRunning());
    assert(f.session.Status() == "Status: Stopped");
    assert(f.probe.translatorStops == 1);
    assert(f.overlay.shown.size() == 1);
    assert(f.overlay.shown[0].rfind("Error in translation:", 0) == 0);
    // The failure is reported once, not again from the event queue.
    assert(f.session.Pump() == 0);
    assert(f.overlay.shown.size() == 1);
}

static void missing_audio_source_keeps_session_stopped(){
    Fixture f;
    f.audioAvailable = false;
    assert(!f.session.Start(SampleSettings()));
    assert(!f.session.IsRunning());
    assert(f.overlay.shown.size() == 1);
    assert(f.overlay.shown[0].rfind("Error in audio capture:", 0) == 0);
}

static void stop_is_idempotent_and_restart_works(){
    Fixture f;
    f.session.Stop();
    assert(f.probe.audioStops == 0);

    assert(f.session.Start(SampleSettings()));
    f.session.Stop();
    f.session.Stop();
    assert(f.probe.audioStops == 1);
    assert(f.probe.translatorStops == 1);
    assert(!f.session.IsRunning());

    Settings changed = SampleSettings();
    changed.outputLanguage = "de-DE";
    assert(f.session.Start(changed));
    assert(f.probe.config.targetLanguage == "de-DE");
    f.session.Stop();
}

static void restart_discards_stale_events(){
    Fixture f;
    assert(f.session.Start(SampleSettings()));
    f.probe.emit({TranslationEvent::Kind::Translated, "stale", {}});
    f.session.Stop();
    assert(f.session.Start(SampleSettings()));
    f.probe.emit({TranslationEvent::Kind::Translated, "fresh", {}});
    assert(f.session.Pump() == 1);
    assert(f.overlay.shown.size() == 1);
    assert(f.overlay.shown[0] == "fresh");
    f.session.Stop();
}

int main(){
    start_wires_settings_into_components();
    audio_is_conditioned_and_forwarded();
    events_reach_overlay_only_on_pump();
    translator_init_failure_keeps_session_stopped();
    recognition_start_failure_keeps_session_stopped();
    missing_audio_source_keeps_session_stopped();
    stop_is_idempotent_and_restart_works();
    restart_discards_stale_events();
    return 0;
}
