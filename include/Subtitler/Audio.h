#pragma once
#include <functional>
#include <vector>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace Subtitler {

using AudioBuffer = std::vector<float>; // mono, 16kHz, [-1, 1]
using AudioCallback = std::function<void(const AudioBuffer&)>;

inline constexpr int kCaptureSampleRate = 16000;

struct AudioDevice {
    int index{0};
    std::string name;
};

class IAudioSource {
public:
    virtual ~IAudioSource() = default;
    // deviceIndex comes from the settings; implementations may fall back to a default endpoint.
    virtual bool Initialize(int deviceIndex, int sampleRate, int channels) = 0;
    // onAudio runs on a capture thread.
    virtual void Start(AudioCallback onAudio) = 0;
    virtual void Stop() = 0;
};

// Zero-filled 20ms frames; fallback when no capture backend is usable.
std::unique_ptr<IAudioSource> CreateAudioSilent();
// WASAPI loopback of a render endpoint (Windows)
std::unique_ptr<IAudioSource> CreateAudioWasapiLoopback(std::shared_ptr<spdlog::logger> logger);
// PortAudio input device; pick a monitor source for loopback (SUBTITLER_ENABLE_PORTAUDIO)
std::unique_ptr<IAudioSource> CreateAudioPortAudio(std::shared_ptr<spdlog::logger> logger);

// Platform backend, or the silent source when SUBTITLER_AUDIO_SOURCE=silent or the backend fails.
std::unique_ptr<IAudioSource> CreateConfiguredAudioSource(int deviceIndex, std::shared_ptr<spdlog::logger> logger);

// Devices addressable by audio_device_index for the platform backend.
std::vector<AudioDevice> EnumerateAudioDevices(const std::shared_ptr<spdlog::logger>& logger = nullptr);
std::vector<AudioDevice> EnumerateWasapiRenderDevices(const std::shared_ptr<spdlog::logger>& logger);
std::vector<AudioDevice> EnumeratePortAudioDevices(const std::shared_ptr<spdlog::logger>& logger);

}
