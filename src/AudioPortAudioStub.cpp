#include "Subtitler/Audio.h"

namespace Subtitler {

class AudioPortAudioStub : public IAudioSource {
public:
    explicit AudioPortAudioStub(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}
    bool Initialize(int, int, int) override {
        if (logger_) logger_->error("PortAudio capture not enabled at build time (SUBTITLER_ENABLE_PORTAUDIO=OFF)");
        return false;
    }
    void Start(AudioCallback) override {}
    void Stop() override {}
private:
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<IAudioSource> CreateAudioPortAudio(std::shared_ptr<spdlog::logger> logger){
    return std::make_unique<AudioPortAudioStub>(std::move(logger));
}

std::vector<AudioDevice> EnumeratePortAudioDevices(const std::shared_ptr<spdlog::logger>&){
    return {};
}

}
