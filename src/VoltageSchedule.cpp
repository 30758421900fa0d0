#include "VoltageSchedule.h"

#include "AlignErrors.h"
#include "MirrorDevice.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>

namespace tipalign {

namespace {

// Relative slack when comparing a grid step with the device's minimum step.
constexpr double kStepSlack = 1e-9;

std::string describe(const char* axis, const AxisRange& r) {
    std::ostringstream os;
    os << axis << " range [" << r.min_V << ", " << r.max_V << "] V";
    return os.str();
}

void checkAxis(const char* axis, const AxisRange& r, const DeviceLimits& limits) {
    if (!r.isValid()) {
        throw InvalidRangeError(describe(axis, r) + ": min must be finite and below max");
    }
    if (!limits.contains(r)) {
        std::ostringstream os;
        os << describe(axis, r) << " exceeds the device-safe window ["
           << limits.v_min_V << ", " << limits.v_max_V << "] V";
        throw InvalidRangeError(os.str());
    }
}

void checkStep(const char* axis, const AxisRange& r, int nodes, const DeviceLimits& limits) {
    const double step = r.span() / static_cast<double>(nodes - 1);
    if (step < limits.min_step_V * (1.0 - kStepSlack)) {
        std::ostringstream os;
        os << axis << " step " << step << " V is finer than the device minimum step "
           << limits.min_step_V << " V";
        throw InfeasibleResolutionError(os.str());
    }
}

// Hilbert index -> (u, v) on a side x side square (side is a power of two).
void hilbertPoint(int side, std::uint64_t d, int& u, int& v) {
    u = 0;
    v = 0;
    for (int s = 1; s < side; s *= 2) {
        const int ru = static_cast<int>(1u & (d / 2));
        const int rv = static_cast<int>(1u & (d ^ static_cast<std::uint64_t>(ru)));
        if (rv == 0) {
            if (ru == 1) {
                u = s - 1 - u;
                v = s - 1 - v;
            }
            std::swap(u, v);
        }
        u += s * ru;
        v += s * rv;
        d /= 4;
    }
}

// Hilbert traversal over square blocks laid along the long axis of the grid.
std::vector<std::uint32_t> spaceFillingOrder(int nx, int ny) {
    std::vector<std::uint32_t> order;
    order.reserve(static_cast<std::size_t>(nx) * static_cast<std::size_t>(ny));

    const bool x_long = nx >= ny;
    const int long_side = x_long ? nx : ny;
    const int short_side = x_long ? ny : nx;
    int block = 1;
    while (block < short_side) block <<= 1;

    const std::uint64_t cells = static_cast<std::uint64_t>(block) * static_cast<std::uint64_t>(block);
    for (int base = 0; base < long_side; base += block) {
        for (std::uint64_t d = 0; d < cells; ++d) {
            int u = 0;
            int v = 0;
            hilbertPoint(block, d, u, v);
            const int lu = base + u;
            if (lu >= long_side || v >= short_side) continue;
            const int i = x_long ? lu : v;
            const int j = x_long ? v : lu;
            order.push_back(static_cast<std::uint32_t>(j * nx + i));
        }
    }
    return order;
}

double axisValue(const AxisRange& r, int index, int nodes) {
    if (index <= 0) return r.min_V;
    if (index >= nodes - 1) return r.max_V;
    const double t = static_cast<double>(index) / static_cast<double>(nodes - 1);
    return std::min(r.max_V, r.min_V + r.span() * t);
}

} // namespace

// --------------------
// VoltageSchedule
// --------------------

bool VoltageSchedule::next(VoltagePair& out) {
    if (done()) {
        return false;
    }
    const std::size_t emit_index = cursor_ / static_cast<std::size_t>(repeats_);

    // Even stride over the traversal; strictly increasing because node_count_ >= emitted_count_.
    const std::size_t t = (emitted_count_ == node_count_)
        ? emit_index
        : static_cast<std::size_t>((static_cast<std::uint64_t>(emit_index) * node_count_) / emitted_count_);

    out = nodeVoltage(traversalNode(t));
    ++cursor_;
    return true;
}

std::size_t VoltageSchedule::traversalNode(std::size_t t) const {
    switch (config_.ordering) {
        case ScheduleOrdering::Raster:
            return t;
        case ScheduleOrdering::Serpentine: {
            const std::size_t ny = static_cast<std::size_t>(ny_);
            const std::size_t col = t / ny;
            const std::size_t k = t % ny;
            const std::size_t row = (col % 2 == 0) ? k : (ny - 1 - k);
            return row * static_cast<std::size_t>(nx_) + col;
        }
        case ScheduleOrdering::Shuffled:
        case ScheduleOrdering::SpaceFilling:
            return order_[t];
    }
    return t;
}

VoltagePair VoltageSchedule::nodeVoltage(std::size_t node) const {
    const int i = static_cast<int>(node % static_cast<std::size_t>(nx_));
    const int j = static_cast<int>(node / static_cast<std::size_t>(nx_));
    return VoltagePair{axisValue(config_.x, i, nx_), axisValue(config_.y, j, ny_)};
}

// --------------------
// ScheduleGenerator
// --------------------

ScheduleGenerator::ScheduleGenerator(const DeviceLimits& limits)
    : limits_(limits), entropy_(std::random_device{}()) {
    if (!(limits_.v_min_V < limits_.v_max_V) || !std::isfinite(limits_.min_step_V) ||
        limits_.min_step_V < 0.0) {
        throw InvalidRangeError("device limits must satisfy v_min < v_max and min_step >= 0");
    }
}

ScheduleGenerator::ScheduleGenerator(const MirrorDevice& device)
    : ScheduleGenerator(device.limits()) {}

ScheduleGenerator::GridShape ScheduleGenerator::resolveGrid(const ScheduleConfig& cfg) const {
    checkAxis("x", cfg.x, limits_);
    checkAxis("y", cfg.y, limits_);

    if (cfg.repeats_per_point < 1) {
        throw InfeasibleResolutionError("repeats_per_point must be >= 1");
    }
    if (cfg.sample_count < 0) {
        throw InfeasibleResolutionError("sample_count must be >= 0");
    }

    GridShape g{};
    if (cfg.sample_count > 0) {
        const double n = static_cast<double>(cfg.sample_count);
        const double aspect = cfg.x.span() / cfg.y.span();
        const double nx = std::max(2.0, std::ceil(std::sqrt(n * aspect)));
        const double ny = std::max(2.0, std::ceil(n / nx));
        if (nx * ny > static_cast<double>(kMaxScheduleNodes)) {
            throw InfeasibleResolutionError("requested sample count exceeds the schedule node limit");
        }
        g.nx = static_cast<int>(nx);
        g.ny = static_cast<int>(ny);
    } else {
        if (cfg.x_steps < 1 || cfg.y_steps < 1) {
            throw InfeasibleResolutionError("x_steps and y_steps must be >= 1");
        }
        const double nodes = (static_cast<double>(cfg.x_steps) + 1.0) *
                             (static_cast<double>(cfg.y_steps) + 1.0);
        if (nodes > static_cast<double>(kMaxScheduleNodes)) {
            throw InfeasibleResolutionError("grid resolution exceeds the schedule node limit");
        }
        g.nx = cfg.x_steps + 1;
        g.ny = cfg.y_steps + 1;
    }

    checkStep("x", cfg.x, g.nx, limits_);
    checkStep("y", cfg.y, g.ny, limits_);
    return g;
}

void ScheduleGenerator::validate(const ScheduleConfig& cfg) const {
    (void)resolveGrid(cfg);
}

VoltageSchedule ScheduleGenerator::generate(const ScheduleConfig& cfg) {
    const GridShape g = resolveGrid(cfg);

    VoltageSchedule s;
    s.config_ = cfg;
    s.nx_ = g.nx;
    s.ny_ = g.ny;
    s.repeats_ = cfg.repeats_per_point;
    s.node_count_ = static_cast<std::size_t>(g.nx) * static_cast<std::size_t>(g.ny);
    s.emitted_count_ = (cfg.sample_count > 0) ? static_cast<std::size_t>(cfg.sample_count) : s.node_count_;

    if (cfg.ordering == ScheduleOrdering::Shuffled) {
        s.seed_used_ = cfg.seeded ? cfg.seed : static_cast<std::uint32_t>(entropy_());
        s.order_.resize(s.node_count_);
        std::iota(s.order_.begin(), s.order_.end(), 0u);
        std::mt19937 rng(s.seed_used_);
        std::shuffle(s.order_.begin(), s.order_.end(), rng);
    } else if (cfg.ordering == ScheduleOrdering::SpaceFilling) {
        s.order_ = spaceFillingOrder(g.nx, g.ny);
    }
    return s;
}

} // namespace tipalign
