#include "Subtitler/AudioConditioner.h"
#include <algorithm>
#include <cmath>

namespace Subtitler {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

Biquad::Biquad(double b0, double b1, double b2, double a0, double a1, double a2)
    : b0_(b0 / a0), b1_(b1 / a0), b2_(b2 / a0), a1_(a1 / a0), a2_(a2 / a0) {}

Biquad Biquad::LowPass(double sampleRate, double cutoff, double q){
    const double w0 = 2.0 * kPi * cutoff / sampleRate;
    const double cosw = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    return Biquad((1.0 - cosw) / 2.0, 1.0 - cosw, (1.0 - cosw) / 2.0,
                  1.0 + alpha, -2.0 * cosw, 1.0 - alpha);
}

Biquad Biquad::HighPass(double sampleRate, double cutoff, double q){
    const double w0 = 2.0 * kPi * cutoff / sampleRate;
    const double cosw = std::cos(w0);
    const double alpha = std::sin(w0) / (2.0 * q);
    return Biquad((1.0 + cosw) / 2.0, -(1.0 + cosw), (1.0 + cosw) / 2.0,
                  1.0 + alpha, -2.0 * cosw, 1.0 - alpha);
}

float Biquad::Process(float x){
    const double in = x;
    const double y = b0_ * in + z1_;
    z1_ = b1_ * in - a1_ * y + z2_;
    z2_ = b2_ * in - a2_ * y;
    return static_cast<float>(y);
}

void NormalizePeak(AudioBuffer& frame){
    float peak = 0.0f;
    for (float s : frame) peak = std::max(peak, std::fabs(s));
    if (peak <= 0.0f) return;
    for (float& s : frame) s /= peak;
}

AudioConditioner::AudioConditioner(int sampleRate, double lowCut, double highCut)
    : highPass_(Biquad::HighPass(sampleRate, lowCut)),
      lowPass_(Biquad::LowPass(sampleRate, highCut)) {}

void AudioConditioner::Process(AudioBuffer& frame){
    for (float& s : frame) s = lowPass_.Process(highPass_.Process(s));
    NormalizePeak(frame);
}

void AudioConditioner::Reset(){
    highPass_.Reset();
    lowPass_.Reset();
}

}
