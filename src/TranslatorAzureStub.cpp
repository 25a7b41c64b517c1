#include "Subtitler/Translator.h"

namespace Subtitler {

class TranslatorAzureStub : public ITranslator {
public:
    bool Initialize(const TranslationConfig&, const std::shared_ptr<spdlog::logger>& logger) override {
        if (logger) logger->error("Azure Speech backend not enabled at build time (SUBTITLER_ENABLE_AZURE_SPEECH=OFF)");
        return false;
    }
    void Start(TranslationCallback) override {}
    bool IsRunning() const override { return false; }
    void PushAudio(const AudioBuffer&) override {}
    void Stop() override {}
};

std::unique_ptr<ITranslator> CreateTranslatorAzure(){ return std::make_unique<TranslatorAzureStub>(); }

}
