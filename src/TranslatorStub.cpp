#include "Subtitler/Translator.h"
#include "Subtitler/Paths.h"
#include <atomic>

namespace Subtitler {

class TranslatorStub : public ITranslator {
public:
    bool Initialize(const TranslationConfig& config, const std::shared_ptr<spdlog::logger>& logger) override {
        logger_ = logger;
        if (logger_) logger_->debug("TranslatorStub::Initialize {} -> {}", config.sourceLanguage, config.targetLanguage);
        return true;
    }
    void Start(TranslationCallback) override {
        if (logger_) logger_->debug("TranslatorStub::Start");
        samples_ = 0;
        running_ = true;
    }
    bool IsRunning() const override { return running_; }
    void PushAudio(const AudioBuffer& frame) override {
        samples_ += frame.size();
    }
    void Stop() override {
        running_ = false;
        if (logger_) logger_->debug("TranslatorStub::Stop after {} samples", samples_.load());
    }
private:
    std::atomic<size_t> samples_{0};
    bool running_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<ITranslator> CreateTranslatorStub(){
    return std::make_unique<TranslatorStub>();
}

std::unique_ptr<ITranslator> CreateConfiguredTranslator(const std::shared_ptr<spdlog::logger>& logger){
    if (EnvEquals("SUBTITLER_TRANSLATOR", "stub")){
        if (logger) logger->info("Translator: stub (SUBTITLER_TRANSLATOR)");
        return CreateTranslatorStub();
    }
    return CreateTranslatorAzure();
}

}
