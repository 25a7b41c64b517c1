#pragma once
#include "Subtitler/Audio.h"
#include "Subtitler/AudioConditioner.h"
#include "Subtitler/Overlay.h"
#include "Subtitler/Settings.h"
#include "Subtitler/Translator.h"
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace Subtitler {

using AudioSourceFactory = std::function<std::unique_ptr<IAudioSource>(int deviceIndex)>;
using TranslatorFactory = std::function<std::unique_ptr<ITranslator>()>;

// Wires capture -> conditioning -> translation -> overlay. Start/Stop/Pump run on the UI thread;
// translator events arrive on SDK threads and wait in a queue until Pump().
class TranslationSession {
public:
    TranslationSession(ISubtitleOverlay& overlay, AudioSourceFactory audioFactory,
                       TranslatorFactory translatorFactory, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~TranslationSession();

    TranslationSession(const TranslationSession&) = delete;
    TranslationSession& operator=(const TranslationSession&) = delete;

    bool Start(const Settings& settings);
    void Stop();
    // Delivers queued translator events to the overlay; returns how many were shown.
    size_t Pump();

    bool IsRunning() const { return running_; }
    std::string Status() const;

private:
    void Enqueue(const TranslationEvent& ev);
    static std::string DisplayText(const TranslationEvent& ev);

    ISubtitleOverlay& overlay_;
    AudioSourceFactory audioFactory_;
    TranslatorFactory translatorFactory_;
    std::shared_ptr<spdlog::logger> logger_;

    std::unique_ptr<IAudioSource> audio_;
    std::unique_ptr<ITranslator> translator_;
    AudioConditioner conditioner_;
    bool running_{false};

    std::mutex mu_;
    std::deque<TranslationEvent> pending_;
};

}
