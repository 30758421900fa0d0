#include "SimulatedMirror.h"

#include "AlignErrors.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tipalign {

SimulatedMirror::SimulatedMirror(const Config& cfg) : cfg_(cfg), rng_(cfg.seed) {}

double SimulatedMirror::truePower(const VoltagePair& v) const {
    double p = cfg_.baseline_mW;
    for (const auto& lobe : cfg_.lobes) {
        if (!(lobe.sigma_V > 0.0)) continue;
        const double dx = v.x_V - lobe.center.x_V;
        const double dy = v.y_V - lobe.center.y_V;
        p += lobe.amplitude_mW * std::exp(-(dx * dx + dy * dy) / (2.0 * lobe.sigma_V * lobe.sigma_V));
    }
    return p;
}

void SimulatedMirror::requireSafe(const VoltagePair& v) const {
    const DeviceLimits& l = cfg_.limits;
    if (!(v.x_V >= l.v_min_V && v.x_V <= l.v_max_V && v.y_V >= l.v_min_V && v.y_V <= l.v_max_V)) {
        std::ostringstream os;
        os << "commanded voltage (" << v.x_V << ", " << v.y_V << ") V outside the safe window";
        throw HardwareFaultError(os.str());
    }
}

Sample SimulatedMirror::measureAt(const VoltagePair& v) {
    if (cfg_.fault_after_samples >= 0 &&
        samples_taken_ >= static_cast<std::size_t>(cfg_.fault_after_samples)) {
        std::ostringstream os;
        os << "power sensor stopped responding after " << samples_taken_ << " samples";
        throw HardwareFaultError(os.str());
    }
    requireSafe(v);
    position_ = v;

    Sample s;
    s.v = v;
    s.t_ms = static_cast<double>(samples_taken_) * cfg_.step_time_ms;
    double p = truePower(v);
    if (cfg_.noise_sigma_mW > 0.0) {
        p += cfg_.noise_sigma_mW * noise_(rng_);
    }
    s.power_mW = std::max(0.0, p);
    ++samples_taken_;
    return s;
}

void SimulatedMirror::moveTo(const VoltagePair& v) {
    requireSafe(v);
    position_ = v;
    ++move_count_;
}

void SimulatedMirror::injectFaultAfter(long samples) {
    cfg_.fault_after_samples = (samples < 0) ? -1 : static_cast<long>(samples_taken_) + samples;
}

} // namespace tipalign
