#include "Subtitler/Audio.h"
#include "Subtitler/Paths.h"

namespace Subtitler {

std::unique_ptr<IAudioSource> CreateConfiguredAudioSource(int deviceIndex, std::shared_ptr<spdlog::logger> logger){
    std::unique_ptr<IAudioSource> audio;
    if (EnvEquals("SUBTITLER_AUDIO_SOURCE", "silent")){
        if (logger) logger->info("Audio: silent (SUBTITLER_AUDIO_SOURCE)");
        audio = CreateAudioSilent();
    } else {
#ifdef _WIN32
        audio = CreateAudioWasapiLoopback(logger);
#else
        audio = CreateAudioPortAudio(logger);
#endif
    }

    if (!audio->Initialize(deviceIndex, kCaptureSampleRate, 1)){
        if (logger) logger->warn("Audio backend unavailable, falling back to silence");
        audio = CreateAudioSilent();
        audio->Initialize(deviceIndex, kCaptureSampleRate, 1);
    }
    return audio;
}

std::vector<AudioDevice> EnumerateAudioDevices(const std::shared_ptr<spdlog::logger>& logger){
#ifdef _WIN32
    return EnumerateWasapiRenderDevices(logger);
#else
    return EnumeratePortAudioDevices(logger);
#endif
}

}
