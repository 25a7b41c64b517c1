#include <cassert>
#include <cmath>
#include <algorithm>
#include <vector>
#include "Subtitler/AudioConditioner.h"

using namespace Subtitler;

static const double kPi = 3.14159265358979323846;

static AudioBuffer Sine(double freq, double amplitude, size_t n, size_t offset = 0){
    AudioBuffer b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<float>(amplitude * std::sin(2.0 * kPi * freq * double(i + offset) / kCaptureSampleRate));
    return b;
}

static float Peak(const AudioBuffer& b, size_t from = 0){
    float p = 0.0f;
    for (size_t i = from; i < b.size(); ++i) p = std::max(p, std::fabs(b[i]));
    return p;
}

static void high_pass_removes_dc(){
    Biquad hp = Biquad::HighPass(kCaptureSampleRate, 300.0);
    float last = 1.0f;
    for (int i = 0; i < 4000; ++i) last = hp.Process(0.5f);
    assert(std::fabs(last) < 1e-3f);
}

static void low_pass_passes_dc_and_attenuates_high_frequencies(){
    Biquad lp = Biquad::LowPass(kCaptureSampleRate, 3000.0);
    float last = 0.0f;
    for (int i = 0; i < 4000; ++i) last = lp.Process(0.5f);
    assert(std::fabs(last - 0.5f) < 1e-3f);

    lp.Reset();
    AudioBuffer tone = Sine(7000.0, 1.0, 4000);
    for (float& s : tone) s = lp.Process(s);
    // Well past the cutoff; skip the settling transient.
    assert(Peak(tone, 2000) < 0.2f);
}

static void speech_band_survives(){
    AudioConditioner c;
    AudioBuffer frame;
    for (int i = 0; i < 20; ++i){
        frame = Sine(1000.0, 0.25, 320, size_t(i) * 320);
        c.Process(frame);
    }
    // Normalized to unit peak, and still a tone rather than noise.
    assert(std::fabs(Peak(frame) - 1.0f) < 1e-5f);
    int crossings = 0;
    for (size_t i = 1; i < frame.size(); ++i) if ((frame[i - 1] < 0.0f) != (frame[i] < 0.0f)) ++crossings;
    // 1 kHz over 20 ms is 20 periods, so about 40 zero crossings.
    assert(crossings >= 36 && crossings <= 44);
    assert(frame.size() == 320);
}

static void normalize_peak(){
    AudioBuffer b{0.1f, -0.4f, 0.2f};
    NormalizePeak(b);
    assert(std::fabs(b[1] + 1.0f) < 1e-6f);
    assert(std::fabs(b[0] - 0.25f) < 1e-6f);

    AudioBuffer silent(320, 0.0f);
    NormalizePeak(silent);
    assert(Peak(silent) == 0.0f);

    AudioBuffer empty;
    NormalizePeak(empty);
    assert(empty.empty());
}

static void silent_frames_stay_silent(){
    AudioConditioner c;
    AudioBuffer frame(320, 0.0f);
    c.Process(frame);
    assert(Peak(frame) == 0.0f);
}

int main(){
    high_pass_removes_dc();
    low_pass_passes_dc_and_attenuates_high_frequencies();
    speech_band_survives();
    normalize_peak();
    silent_frames_stay_silent();
    return 0;
}
