#pragma once
#include "Subtitler/Audio.h"

namespace Subtitler {

// Second-order section, transposed direct form II. Coefficients from the RBJ audio EQ cookbook.
class Biquad {
public:
    static Biquad LowPass(double sampleRate, double cutoff, double q = 0.70710678118654752);
    static Biquad HighPass(double sampleRate, double cutoff, double q = 0.70710678118654752);

    float Process(float x);
    void Reset() { z1_ = 0.0; z2_ = 0.0; }

private:
    Biquad(double b0, double b1, double b2, double a0, double a1, double a2);

    double b0_, b1_, b2_, a1_, a2_;
    double z1_{0.0}, z2_{0.0};
};

// Scales the frame so its largest magnitude is 1. Silent frames are left alone.
void NormalizePeak(AudioBuffer& frame);

// Speech band-pass followed by per-frame peak normalization. Filter state carries across frames.
class AudioConditioner {
public:
    explicit AudioConditioner(int sampleRate = kCaptureSampleRate, double lowCut = 300.0, double highCut = 3000.0);

    void Process(AudioBuffer& frame);
    void Reset();

private:
    Biquad highPass_;
    Biquad lowPass_;
};

}
