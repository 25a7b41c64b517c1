#include "Subtitler/Audio.h"

#include <windows.h>
#include <mmdeviceapi.h>
#include <audioclient.h>
#include <Functiondiscoverykeys_devpkey.h>
#include <wrl/client.h>
#include <ks.h>
#include <ksmedia.h>

#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <cmath>
#include <algorithm>
#include <memory>
#include <string>
#include <cstdint>

using Microsoft::WRL::ComPtr;

namespace Subtitler {

namespace {
    struct CoInit {
        HRESULT hr;
        CoInit(){ hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED); }
        ~CoInit(){ if (SUCCEEDED(hr)) CoUninitialize(); }
    };

    std::string WToUtf8(const wchar_t* w){
        if (!w) return {};
        int len = WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
        std::string s; if (len <= 0) return s; s.resize(len - 1);
        WideCharToMultiByte(CP_UTF8, 0, w, -1, s.data(), len, nullptr, nullptr);
        return s;
    }

    std::string FriendlyName(IMMDevice* device){
        ComPtr<IPropertyStore> store;
        std::string name;
        if (SUCCEEDED(device->OpenPropertyStore(STGM_READ, &store)) && store){
            PROPVARIANT pv; PropVariantInit(&pv);
            if (SUCCEEDED(store->GetValue(PKEY_Device_FriendlyName, &pv)) && pv.vt == VT_LPWSTR){
                name = WToUtf8(pv.pwszVal);
            }
            PropVariantClear(&pv);
        }
        return name;
    }

    // Downmix to mono and linear-resample to outRate.
    void DownmixAndResample(const float* in, size_t inFrames, int inChannels, int inRate,
                            std::vector<float>& out, int outRate){
        if (inFrames == 0){ out.clear(); return; }
        std::vector<float> mono(inFrames);
        if (inChannels <= 1){
            std::copy(in, in + inFrames, mono.begin());
        } else {
            for (size_t i = 0; i < inFrames; ++i){
                double acc = 0.0;
                const float* frame = in + i * inChannels;
                for (int ch = 0; ch < inChannels; ++ch){ acc += frame[ch]; }
                mono[i] = static_cast<float>(acc / inChannels);
            }
        }
        if (inRate == outRate){ out = std::move(mono); return; }
        const double ratio = static_cast<double>(outRate) / static_cast<double>(inRate);
        const size_t outFrames = static_cast<size_t>(std::floor(mono.size() * ratio));
        out.resize(outFrames);
        for (size_t i = 0; i < outFrames; ++i){
            const double pos = static_cast<double>(i) / ratio;
            const size_t i0 = static_cast<size_t>(pos);
            const size_t i1 = std::min(i0 + 1, mono.size() - 1);
            const double t = pos - static_cast<double>(i0);
            out[i] = static_cast<float>((1.0 - t) * mono[i0] + t * mono[i1]);
        }
    }

    // Active render endpoints in enumeration order; index i is audio_device_index i.
    HRESULT RenderEndpoints(IMMDeviceEnumerator* enumerator, ComPtr<IMMDeviceCollection>& out){
        return enumerator->EnumAudioEndpoints(eRender, DEVICE_STATE_ACTIVE, &out);
    }
}

class AudioWasapiLoopback final : public IAudioSource {
public:
    explicit AudioWasapiLoopback(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}
    ~AudioWasapiLoopback() override { Stop(); }

    bool Initialize(int deviceIndex, int sampleRate, int channels) override {
        if (sampleRate <= 0 || channels <= 0){
            if (logger_) logger_->error("WASAPI loopback invalid params ({} Hz, {} ch)", sampleRate, channels);
            return false;
        }
        deviceIndex_ = deviceIndex;
        targetRate_ = sampleRate;
        targetChannels_ = channels;
        // Device activation happens on the capture thread; only check that an endpoint exists.
        CoInit co;
        ComPtr<IMMDeviceEnumerator> enumerator;
        HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL, IID_PPV_ARGS(&enumerator));
        if (FAILED(hr)){
            if (logger_) logger_->error("MMDeviceEnumerator CoCreateInstance failed: 0x{:08X}", static_cast<unsigned>(hr));
            return false;
        }
        ComPtr<IMMDevice> device;
        return SUCCEEDED(enumerator->GetDefaultAudioEndpoint(eRender, eConsole, &device));
    }

    void Start(AudioCallback onAudio) override {
        if (running_) return;
        stop_ = false;
        running_ = true;
        worker_ = std::thread([this, onAudio]{ Run(onAudio); running_ = false; });
    }

    void Stop() override {
        stop_ = true;
        if (worker_.joinable()) worker_.join();
        running_ = false;
    }

private:
    ComPtr<IMMDevice> SelectEndpoint(IMMDeviceEnumerator* enumerator){
        ComPtr<IMMDevice> device;
        ComPtr<IMMDeviceCollection> endpoints;
        UINT count = 0;
        if (SUCCEEDED(RenderEndpoints(enumerator, endpoints)) && SUCCEEDED(endpoints->GetCount(&count))
            && deviceIndex_ >= 0 && static_cast<UINT>(deviceIndex_) < count){
            if (SUCCEEDED(endpoints->Item(static_cast<UINT>(deviceIndex_), &device))) return device;
        }
        if (logger_) logger_->warn("Audio device {} not available ({} render endpoints), using default output", deviceIndex_, count);
        if (FAILED(enumerator->GetDefaultAudioEndpoint(eRender, eConsole, &device))) return nullptr;
        return device;
    }

    void Run(const AudioCallback& onAudio){
        CoInit co;

        ComPtr<IMMDeviceEnumerator> enumerator;
        HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL, IID_PPV_ARGS(&enumerator));
        if (FAILED(hr)){
            if (logger_) logger_->error("MMDeviceEnumerator CoCreateInstance failed: 0x{:08X}", static_cast<unsigned>(hr));
            return;
        }
        ComPtr<IMMDevice> device = SelectEndpoint(enumerator.Get());
        if (!device){
            if (logger_) logger_->error("No render endpoint to loop back");
            return;
        }
        if (logger_) logger_->info("WASAPI loopback endpoint: {}", FriendlyName(device.Get()));

        ComPtr<IAudioClient> client;
        hr = device->Activate(__uuidof(IAudioClient), CLSCTX_ALL, nullptr, &client);
        if (FAILED(hr)){ if (logger_) logger_->error("Activate IAudioClient failed: 0x{:08X}", static_cast<unsigned>(hr)); return; }

        WAVEFORMATEX* mix = nullptr;
        hr = client->GetMixFormat(&mix);
        if (FAILED(hr) || !mix){ if (logger_) logger_->error("GetMixFormat failed: 0x{:08X}", static_cast<unsigned>(hr)); return; }
        std::unique_ptr<WAVEFORMATEX, decltype(&CoTaskMemFree)> mixGuard(mix, &CoTaskMemFree);

        const int inRate = static_cast<int>(mix->nSamplesPerSec);
        const int inChannels = static_cast<int>(mix->nChannels);
        const bool isFloat = (mix->wFormatTag == WAVE_FORMAT_IEEE_FLOAT) ||
                             (mix->wFormatTag == WAVE_FORMAT_EXTENSIBLE &&
                              reinterpret_cast<WAVEFORMATEXTENSIBLE*>(mix)->SubFormat == KSDATAFORMAT_SUBTYPE_IEEE_FLOAT);

        // Loopback streams cannot use event callbacks on every Windows version; poll instead.
        REFERENCE_TIME dur = 10000000; // 1s
        hr = client->Initialize(AUDCLNT_SHAREMODE_SHARED, AUDCLNT_STREAMFLAGS_LOOPBACK, dur, 0, mix, nullptr);
        if (FAILED(hr)){ if (logger_) logger_->error("IAudioClient Initialize (loopback) failed: 0x{:08X}", static_cast<unsigned>(hr)); return; }

        UINT32 bufferFrames = 0; client->GetBufferSize(&bufferFrames);
        if (logger_) logger_->info("WASAPI mix: {} Hz, {} ch, float={}; bufferFrames={}; output: {} Hz, {} ch",
            inRate, inChannels, isFloat, bufferFrames, targetRate_, targetChannels_);

        ComPtr<IAudioCaptureClient> capture;
        hr = client->GetService(IID_PPV_ARGS(&capture));
        if (FAILED(hr)){ if (logger_) logger_->error("GetService(IAudioCaptureClient) failed: 0x{:08X}", static_cast<unsigned>(hr)); return; }

        hr = client->Start();
        if (FAILED(hr)){ if (logger_) logger_->error("IAudioClient Start failed: 0x{:08X}", static_cast<unsigned>(hr)); return; }

        std::vector<float> out;
        std::vector<float> scratch;
        while (!stop_){
            std::this_thread::sleep_for(std::chrono::milliseconds(10));

            UINT32 packet = 0;
            if (FAILED(capture->GetNextPacketSize(&packet))) continue;
            while (packet > 0){
                BYTE* pData = nullptr; UINT32 frames = 0; DWORD flags = 0;
                hr = capture->GetBuffer(&pData, &frames, &flags, nullptr, nullptr);
                if (FAILED(hr)) break;

                const bool silent = (flags & AUDCLNT_BUFFERFLAGS_SILENT) != 0;
                const float* fin = nullptr;
                const size_t total = static_cast<size_t>(frames) * std::max(1, inChannels);
                if (!silent && isFloat){
                    fin = reinterpret_cast<const float*>(pData);
                } else if (!silent && mix->wBitsPerSample == 16){
                    const int16_t* s = reinterpret_cast<const int16_t*>(pData);
                    scratch.resize(total);
                    for (size_t i = 0; i < total; ++i){ scratch[i] = static_cast<float>(s[i] / 32768.0f); }
                    fin = scratch.data();
                } else {
                    scratch.assign(total, 0.0f);
                    fin = scratch.data();
                }

                if (frames > 0){
                    DownmixAndResample(fin, frames, inChannels, inRate, out, targetRate_);
                    onAudio(out);
                }

                capture->ReleaseBuffer(frames);
                if (FAILED(capture->GetNextPacketSize(&packet))) break;
            }
        }

        client->Stop();
    }

    std::shared_ptr<spdlog::logger> logger_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};
    int deviceIndex_{0};
    int targetRate_{kCaptureSampleRate};
    int targetChannels_{1};
};

std::unique_ptr<IAudioSource> CreateAudioWasapiLoopback(std::shared_ptr<spdlog::logger> logger){
    return std::make_unique<AudioWasapiLoopback>(std::move(logger));
}

std::vector<AudioDevice> EnumerateWasapiRenderDevices(const std::shared_ptr<spdlog::logger>& logger){
    std::vector<AudioDevice> devices;
    CoInit co;
    ComPtr<IMMDeviceEnumerator> enumerator;
    HRESULT hr = CoCreateInstance(__uuidof(MMDeviceEnumerator), nullptr, CLSCTX_ALL, IID_PPV_ARGS(&enumerator));
    if (FAILED(hr)){
        if (logger) logger->error("MMDeviceEnumerator CoCreateInstance failed: 0x{:08X}", static_cast<unsigned>(hr));
        return devices;
    }
    ComPtr<IMMDeviceCollection> endpoints;
    UINT count = 0;
    if (FAILED(RenderEndpoints(enumerator.Get(), endpoints)) || FAILED(endpoints->GetCount(&count))) return devices;
    for (UINT i = 0; i < count; ++i){
        ComPtr<IMMDevice> device;
        if (FAILED(endpoints->Item(i, &device))) continue;
        devices.push_back({static_cast<int>(i), FriendlyName(device.Get())});
    }
    return devices;
}

} // namespace Subtitler
