#include "Subtitler/Audio.h"
#include <thread>
#include <atomic>
#include <chrono>

namespace Subtitler {

// AudioSilent: produces zero-filled buffers every 20ms (320 samples at 16kHz).
// Used when loopback capture is unavailable and by tests.
class AudioSilent : public IAudioSource {
public:
    bool Initialize(int, int sampleRate, int) override {
        samplesPerFrame_ = sampleRate > 0 ? static_cast<size_t>(sampleRate / 50) : 320;
        return true;
    }
    void Start(AudioCallback onAudio) override {
        if (worker_.joinable()) return;
        stop_ = false;
        worker_ = std::thread([this, onAudio]{
            while(!stop_){
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                AudioBuffer buf(samplesPerFrame_);
                onAudio(buf);
            }
        });
    }
    void Stop() override {
        stop_ = true;
        if (worker_.joinable()) worker_.join();
    }
    ~AudioSilent() override { Stop(); }
private:
    std::thread worker_;
    std::atomic<bool> stop_{false};
    size_t samplesPerFrame_{320};
};

std::unique_ptr<IAudioSource> CreateAudioSilent(){
    return std::make_unique<AudioSilent>();
}

}
