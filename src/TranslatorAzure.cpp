#include "Subtitler/Translator.h"

#include <speechapi_cxx.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <vector>

namespace Subtitler {

using namespace Microsoft::CognitiveServices::Speech;
using namespace Microsoft::CognitiveServices::Speech::Audio;
using namespace Microsoft::CognitiveServices::Speech::Translation;

namespace {

const char* CancellationText(CancellationReason reason){
    switch (reason){
        case CancellationReason::Error: return "Error";
        case CancellationReason::EndOfStream: return "EndOfStream";
        case CancellationReason::CancelledByUser: return "CancelledByUser";
        default: return "Unknown";
    }
}

// The service keys translations by the language it resolved, which may be shorter than the requested tag.
std::string PickTranslation(const std::map<std::string, std::string>& translations, const std::string& target){
    auto it = translations.find(target);
    if (it != translations.end()) return it->second;
    const std::string primary = target.substr(0, target.find('-'));
    it = translations.find(primary);
    if (it != translations.end()) return it->second;
    return translations.empty() ? std::string{} : translations.begin()->second;
}

}

class TranslatorAzure : public ITranslator {
public:
    ~TranslatorAzure() override { Stop(); }

    bool Initialize(const TranslationConfig& config, const std::shared_ptr<spdlog::logger>& logger) override {
        logger_ = logger;
        config_ = config;
        if (config_.subscriptionKey.empty() || config_.region.empty()){
            if (logger_) logger_->error("Azure subscription key and region must be set before starting");
            return false;
        }
        try {
            auto speech = SpeechTranslationConfig::FromSubscription(config_.subscriptionKey, config_.region);
            speech->SetSpeechRecognitionLanguage(config_.sourceLanguage);
            speech->AddTargetLanguage(config_.targetLanguage);

            auto format = AudioStreamFormat::GetWaveFormatPCM(kCaptureSampleRate, 16, 1);
            stream_ = AudioInputStream::CreatePushStream(format);
            recognizer_ = TranslationRecognizer::FromConfig(speech, AudioConfig::FromStreamInput(stream_));
        } catch (const std::exception& e){
            if (logger_) logger_->error("Azure translation setup failed: {}", e.what());
            stream_.reset();
            recognizer_.reset();
            return false;
        }
        if (logger_) logger_->info("Azure translator ready: {} -> {} ({})", config_.sourceLanguage, config_.targetLanguage, config_.region);
        return true;
    }

    void Start(TranslationCallback onEvent) override {
        if (!recognizer_ || running_) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            cb_ = std::move(onEvent);
        }

        recognizer_->Recognized.Connect([this](const TranslationRecognitionEventArgs& e){
            const auto& result = e.Result;
            if (result->Reason == ResultReason::TranslatedSpeech){
                std::string text = PickTranslation(result->Translations, config_.targetLanguage);
                if (logger_) logger_->info("Recognized: {}", result->Text);
                Emit({TranslationEvent::Kind::Translated, text, result->Text});
            } else if (result->Reason == ResultReason::NoMatch){
                if (logger_) logger_->warn("No speech could be recognized.");
                Emit({TranslationEvent::Kind::NoMatch, "No speech could be recognized.", {}});
            }
        });
        recognizer_->Canceled.Connect([this](const TranslationRecognitionCanceledEventArgs& e){
            std::string reason = CancellationText(e.Reason);
            if (e.Reason == CancellationReason::Error && !e.ErrorDetails.empty()) reason += ": " + e.ErrorDetails;
            if (logger_) logger_->error("Speech Recognition canceled: {}", reason);
            Emit({TranslationEvent::Kind::Canceled, reason, {}});
        });

        try {
            recognizer_->StartContinuousRecognitionAsync().get();
            running_ = true;
        } catch (const std::exception& e){
            if (logger_) logger_->error("StartContinuousRecognition failed: {}", e.what());
            recognizer_->Recognized.DisconnectAll();
            recognizer_->Canceled.DisconnectAll();
            std::lock_guard<std::mutex> lk(mu_);
            cb_ = nullptr;
        }
    }

    bool IsRunning() const override { return running_; }

    void PushAudio(const AudioBuffer& frame) override {
        if (!running_ || !stream_) return;
        pcm_.resize(frame.size());
        for (size_t i = 0; i < frame.size(); ++i){
            float s = std::max(-1.0f, std::min(1.0f, frame[i]));
            pcm_[i] = static_cast<int16_t>(std::lrintf(s * 32767.0f));
        }
        stream_->Write(reinterpret_cast<uint8_t*>(pcm_.data()), static_cast<uint32_t>(pcm_.size() * sizeof(int16_t)));
    }

    void Stop() override {
        if (!running_) return;
        running_ = false;
        try {
            if (stream_) stream_->Close();
            recognizer_->StopContinuousRecognitionAsync().get();
        } catch (const std::exception& e){
            if (logger_) logger_->error("StopContinuousRecognition failed: {}", e.what());
        }
        recognizer_->Recognized.DisconnectAll();
        recognizer_->Canceled.DisconnectAll();
        std::lock_guard<std::mutex> lk(mu_);
        cb_ = nullptr;
    }

private:
    void Emit(const TranslationEvent& ev){
        std::lock_guard<std::mutex> lk(mu_);
        if (cb_) cb_(ev);
    }

    TranslationConfig config_;
    std::shared_ptr<PushAudioInputStream> stream_;
    std::shared_ptr<TranslationRecognizer> recognizer_;
    std::vector<int16_t> pcm_;
    std::atomic<bool> running_{false};
    std::mutex mu_;
    TranslationCallback cb_;
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<ITranslator> CreateTranslatorAzure(){
    return std::make_unique<TranslatorAzure>();
}

}
