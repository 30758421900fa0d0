#pragma once

#include <cmath>

namespace tipalign {

// Steering-mirror drive voltages (volts, X and Y channels).
struct VoltagePair {
    double x_V = 0.0;
    double y_V = 0.0;
};

inline bool operator==(const VoltagePair& a, const VoltagePair& b) {
    return a.x_V == b.x_V && a.y_V == b.y_V;
}

inline bool operator!=(const VoltagePair& a, const VoltagePair& b) {
    return !(a == b);
}

inline bool operator<(const VoltagePair& a, const VoltagePair& b) {
    return (a.x_V < b.x_V) || (a.x_V == b.x_V && a.y_V < b.y_V);
}

// One scan axis. Valid iff both bounds are finite and min_V < max_V.
struct AxisRange {
    double min_V = 0.0;
    double max_V = 1.0;

    double span() const { return max_V - min_V; }
    double center() const { return 0.5 * (min_V + max_V); }
    bool isValid() const {
        return std::isfinite(min_V) && std::isfinite(max_V) && min_V < max_V;
    }
};

// Device-safe drive window (same for both channels) and the smallest
// increment the mirror driver resolves.
struct DeviceLimits {
    double v_min_V = -30.0;
    double v_max_V = 30.0;
    double min_step_V = 0.01;

    bool contains(const AxisRange& r) const {
        return r.min_V >= v_min_V && r.max_V <= v_max_V;
    }
};

// One scan step as reported by the hardware layer.
struct Sample {
    VoltagePair v{};
    double power_mW = 0.0; // transmitted power, >= 0
    double t_ms = 0.0;     // acquisition time relative to scan start
};

inline bool operator==(const Sample& a, const Sample& b) {
    return a.v == b.v && a.power_mW == b.power_mW && a.t_ms == b.t_ms;
}

enum class ScheduleOrdering : int {
    Raster       = 0, // row-major, x fastest
    Serpentine   = 1, // column-major boustrophedon (y up, then down)
    Shuffled     = 2, // random permutation
    SpaceFilling = 3, // Hilbert curve
};

const char* orderingName(ScheduleOrdering o);

// Accepts the names produced by orderingName() (case-insensitive).
// Returns false for an unknown name.
bool parseOrdering(const char* name, ScheduleOrdering* out);

} // namespace tipalign
