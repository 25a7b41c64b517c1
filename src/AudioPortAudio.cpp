#include "Subtitler/Audio.h"

#include <portaudio.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>

namespace Subtitler {

namespace {
// Pa_Initialize/Pa_Terminate are reference counted by PortAudio itself.
class PaSession {
public:
    PaSession() : err_(Pa_Initialize()) {}
    ~PaSession(){ if (err_ == paNoError) Pa_Terminate(); }
    bool ok() const { return err_ == paNoError; }
    const char* error() const { return Pa_GetErrorText(err_); }
private:
    PaError err_;
};
}

class AudioPortAudio final : public IAudioSource {
public:
    explicit AudioPortAudio(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}
    ~AudioPortAudio() override { Stop(); }

    bool Initialize(int deviceIndex, int sampleRate, int channels) override {
        session_ = std::make_unique<PaSession>();
        if (!session_->ok()){
            if (logger_) logger_->error("Pa_Initialize failed: {}", session_->error());
            session_.reset();
            return false;
        }
        const int count = Pa_GetDeviceCount();
        if (deviceIndex >= 0 && deviceIndex < count){
            device_ = deviceIndex;
        } else {
            device_ = Pa_GetDefaultInputDevice();
            if (logger_) logger_->warn("Audio device {} not available ({} devices), using default input", deviceIndex, count);
        }
        const PaDeviceInfo* info = device_ == paNoDevice ? nullptr : Pa_GetDeviceInfo(device_);
        if (!info || info->maxInputChannels < 1){
            if (logger_) logger_->error("No usable PortAudio input device");
            return false;
        }

        PaStreamParameters in{};
        in.device = device_;
        in.channelCount = channels;
        in.sampleFormat = paFloat32;
        in.suggestedLatency = info->defaultLowInputLatency;
        in.hostApiSpecificStreamInfo = nullptr;
        PaError err = Pa_IsFormatSupported(&in, nullptr, sampleRate);
        if (err != paFormatIsSupported){
            if (logger_) logger_->error("Device '{}' cannot capture {} Hz x{}: {}", info->name, sampleRate, channels, Pa_GetErrorText(err));
            return false;
        }
        params_ = in;
        sampleRate_ = sampleRate;
        if (logger_) logger_->info("PortAudio capture device: {} ({})", info->name, device_);
        return true;
    }

    void Start(AudioCallback onAudio) override {
        if (stream_ || !session_) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            callback_ = std::move(onAudio);
        }
        PaError err = Pa_OpenStream(&stream_, &params_, nullptr, sampleRate_,
                                    static_cast<unsigned long>(sampleRate_ / 50), paClipOff, &AudioPortAudio::OnStream, this);
        if (err != paNoError){
            if (logger_) logger_->error("Pa_OpenStream failed: {}", Pa_GetErrorText(err));
            stream_ = nullptr;
            return;
        }
        err = Pa_StartStream(stream_);
        if (err != paNoError){
            if (logger_) logger_->error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
            Pa_CloseStream(stream_);
            stream_ = nullptr;
        }
    }

    void Stop() override {
        if (!stream_) return;
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError && logger_) logger_->warn("Pa_StopStream: {}", Pa_GetErrorText(err));
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }

private:
    static int OnStream(const void* input, void*, unsigned long frames,
                        const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user){
        auto* self = static_cast<AudioPortAudio*>(user);
        const float* in = static_cast<const float*>(input);
        AudioBuffer buf(frames * static_cast<size_t>(self->params_.channelCount), 0.0f);
        if (in) std::copy(in, in + buf.size(), buf.begin());
        std::lock_guard<std::mutex> lk(self->mu_);
        if (self->callback_) self->callback_(buf);
        return paContinue;
    }

    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<PaSession> session_;
    PaStream* stream_{nullptr};
    PaStreamParameters params_{};
    PaDeviceIndex device_{paNoDevice};
    int sampleRate_{kCaptureSampleRate};
    std::mutex mu_;
    AudioCallback callback_;
};

std::unique_ptr<IAudioSource> CreateAudioPortAudio(std::shared_ptr<spdlog::logger> logger){
    return std::make_unique<AudioPortAudio>(std::move(logger));
}

std::vector<AudioDevice> EnumeratePortAudioDevices(const std::shared_ptr<spdlog::logger>& logger){
    std::vector<AudioDevice> devices;
    PaSession session;
    if (!session.ok()){
        if (logger) logger->error("Pa_Initialize failed: {}", session.error());
        return devices;
    }
    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i){
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;
        devices.push_back({i, info->name ? info->name : ""});
    }
    return devices;
}

}
