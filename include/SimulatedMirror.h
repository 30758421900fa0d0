#pragma once

#include "MirrorDevice.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace tipalign {

// Synthetic steering mirror + power sensor.
//
// Transmission = baseline + sum of Gaussian lobes + Gaussian sensor noise,
// clamped at 0. Deterministic for a given seed.
class SimulatedMirror : public MirrorDevice {
public:
    struct Lobe {
        VoltagePair center{};
        double amplitude_mW = 1.0;
        double sigma_V = 0.15;
    };

    struct Config {
        DeviceLimits limits{};
        double baseline_mW = 0.1;
        double noise_sigma_mW = 0.0;
        std::uint32_t seed = 1337u;
        std::vector<Lobe> lobes{};

        // Throw HardwareFaultError on the measurement after this many samples (-1 = never).
        long fault_after_samples = -1;

        // Acquisition time per step (mirror settle + sensor integration).
        double step_time_ms = 5.0;
    };

    explicit SimulatedMirror(const Config& cfg);

    DeviceLimits limits() const override { return cfg_.limits; }
    Sample measureAt(const VoltagePair& v) override;
    void moveTo(const VoltagePair& v) override;

    // Noise-free transmission at v.
    double truePower(const VoltagePair& v) const;

    const VoltagePair& position() const { return position_; }
    std::size_t samplesTaken() const { return samples_taken_; }
    int moveCount() const { return move_count_; }

    // Re-arm (or disable with -1) fault injection relative to the current sample count.
    void injectFaultAfter(long samples);

private:
    void requireSafe(const VoltagePair& v) const;

    Config cfg_{};
    std::mt19937 rng_;
    std::normal_distribution<double> noise_{0.0, 1.0};
    VoltagePair position_{};
    std::size_t samples_taken_ = 0;
    int move_count_ = 0;
};

} // namespace tipalign
