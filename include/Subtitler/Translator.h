#pragma once
#include "Subtitler/Audio.h"
#include <string>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>

namespace Subtitler {

struct TranslationConfig {
    std::string sourceLanguage;
    std::string targetLanguage;
    std::string subscriptionKey;
    std::string region;
};

struct TranslationEvent {
    enum class Kind { Translated, NoMatch, Canceled, Error };
    Kind kind{Kind::Translated};
    std::string text;       // translation, or the reason for NoMatch/Canceled/Error
    std::string recognized; // source-language transcript when available
};

// Runs on the translator's own thread (SDK callback thread).
using TranslationCallback = std::function<void(const TranslationEvent&)>;

class ITranslator {
public:
    virtual ~ITranslator() = default;
    virtual bool Initialize(const TranslationConfig& config, const std::shared_ptr<spdlog::logger>& logger) = 0;
    virtual void Start(TranslationCallback onEvent) = 0;
    // False when Start could not bring recognition up.
    virtual bool IsRunning() const = 0;
    // Called from the capture thread with conditioned 16kHz mono frames.
    virtual void PushAudio(const AudioBuffer& frame) = 0;
    virtual void Stop() = 0;
};

std::unique_ptr<ITranslator> CreateTranslatorStub();
// Azure Speech continuous translation (SUBTITLER_ENABLE_AZURE_SPEECH)
std::unique_ptr<ITranslator> CreateTranslatorAzure();

// Azure unless SUBTITLER_TRANSLATOR=stub.
std::unique_ptr<ITranslator> CreateConfiguredTranslator(const std::shared_ptr<spdlog::logger>& logger);

}
