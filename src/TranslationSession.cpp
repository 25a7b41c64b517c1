#include "Subtitler/TranslationSession.h"
#include <utility>

namespace Subtitler {

TranslationSession::TranslationSession(ISubtitleOverlay& overlay, AudioSourceFactory audioFactory,
                                       TranslatorFactory translatorFactory, std::shared_ptr<spdlog::logger> logger)
    : overlay_(overlay),
      audioFactory_(std::move(audioFactory)),
      translatorFactory_(std::move(translatorFactory)),
      logger_(std::move(logger)) {}

TranslationSession::~TranslationSession(){
    Stop();
}

bool TranslationSession::Start(const Settings& settings){
    if (running_){
        if (logger_) logger_->info("Translation already running");
        return true;
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        pending_.clear();
    }

    translator_ = translatorFactory_();
    TranslationConfig config{settings.inputLanguage, settings.outputLanguage,
                             settings.azureSubscriptionKey, settings.azureRegion};
    if (!translator_ || !translator_->Initialize(config, logger_)){
        if (logger_) logger_->error("Translator failed to initialize; translation not started");
        translator_.reset();
        overlay_.ShowText("Error in translation: translator could not be initialized (check subscription key and region)");
        return false;
    }

    audio_ = audioFactory_(settings.audioDeviceIndex);
    if (!audio_){
        if (logger_) logger_->error("No audio source available");
        translator_.reset();
        overlay_.ShowText("Error in audio capture: no audio source available");
        return false;
    }

    conditioner_.Reset();
    translator_->Start([this](const TranslationEvent& ev){ Enqueue(ev); });
    if (!translator_->IsRunning()){
        if (logger_) logger_->error("Translator failed to start recognition; translation not started");
        translator_->Stop();
        translator_.reset();
        audio_.reset();
        {
            std::lock_guard<std::mutex> lk(mu_);
            pending_.clear();
        }
        overlay_.ShowText("Error in translation: speech recognition could not be started");
        return false;
    }
    ITranslator* translator = translator_.get();
    audio_->Start([this, translator](const AudioBuffer& frame){
        AudioBuffer conditioned = frame;
        conditioner_.Process(conditioned);
        translator->PushAudio(conditioned);
    });

    running_ = true;
    if (logger_) logger_->info("Translation started: {} -> {} (device {})",
                               settings.inputLanguage, settings.outputLanguage, settings.audioDeviceIndex);
    return true;
}

void TranslationSession::Stop(){
    if (!running_) return;
    if (audio_) audio_->Stop();
    if (translator_) translator_->Stop();
    audio_.reset();
    translator_.reset();
    running_ = false;
    if (logger_) logger_->info("Translation stopped.");
}

size_t TranslationSession::Pump(){
    std::deque<TranslationEvent> ready;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ready.swap(pending_);
    }
    size_t shown = 0;
    for (const auto& ev : ready){
        std::string text = DisplayText(ev);
        if (text.empty()) continue;
        overlay_.ShowText(text);
        ++shown;
    }
    return shown;
}

std::string TranslationSession::Status() const {
    return running_ ? "Status: Running" : "Status: Stopped";
}

void TranslationSession::Enqueue(const TranslationEvent& ev){
    std::lock_guard<std::mutex> lk(mu_);
    pending_.push_back(ev);
}

std::string TranslationSession::DisplayText(const TranslationEvent& ev){
    switch (ev.kind){
        case TranslationEvent::Kind::Translated: return ev.text;
        case TranslationEvent::Kind::NoMatch: return ev.text;
        case TranslationEvent::Kind::Canceled: return "Speech Recognition canceled: " + ev.text;
        case TranslationEvent::Kind::Error: return "Error in translation: " + ev.text;
        default: return ev.text;
    }
}

}
