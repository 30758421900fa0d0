#pragma once

#include "AlignTypes.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace tipalign {

class MirrorDevice;

struct ScheduleConfig {
    AxisRange x{0.0, 1.0};
    AxisRange y{0.0, 1.0};

    // Grid resolution: intervals per axis, i.e. (x_steps + 1) * (y_steps + 1) nodes.
    int x_steps = 10;
    int y_steps = 10;

    // If > 0, emit exactly this many distinct pairs instead of the full grid.
    // The grid is then derived from the count and the axis aspect.
    int sample_count = 0;

    ScheduleOrdering ordering = ScheduleOrdering::Raster;

    // Consecutive measurements per pair (> 1 only for noise averaging).
    int repeats_per_point = 1;

    // Shuffled order only. Unseeded schedules draw a fresh seed per generate().
    bool seeded = false;
    std::uint32_t seed = 0u;
};

// Finite, single-pass sequence of voltage pairs. Pairs are computed on demand.
class VoltageSchedule {
public:
    // Writes the next pair; returns false once the schedule is exhausted.
    bool next(VoltagePair& out);

    std::size_t size() const { return emitted_count_ * static_cast<std::size_t>(repeats_); }
    std::size_t remaining() const { return size() - cursor_; }
    bool done() const { return cursor_ >= size(); }

    // Resolved grid (intervals per axis); differs from the request in sample-count mode.
    int xSteps() const { return nx_ - 1; }
    int ySteps() const { return ny_ - 1; }

    const ScheduleConfig& config() const { return config_; }

    // Seed actually used for a shuffled schedule.
    std::uint32_t seedUsed() const { return seed_used_; }

private:
    friend class ScheduleGenerator;
    VoltageSchedule() = default;

    std::size_t traversalNode(std::size_t t) const;
    VoltagePair nodeVoltage(std::size_t node) const;

    ScheduleConfig config_{};
    int nx_ = 0;
    int ny_ = 0;
    int repeats_ = 1;
    std::size_t node_count_ = 0;
    std::size_t emitted_count_ = 0;
    std::size_t cursor_ = 0;
    std::uint32_t seed_used_ = 0u;

    // Node table for orderings without closed-form traversal (shuffled, space-filling).
    std::vector<std::uint32_t> order_{};
};

// Produces schedules bounded by a device's limits.
class ScheduleGenerator {
public:
    static constexpr std::size_t kMaxScheduleNodes = std::size_t(1) << 22;

    explicit ScheduleGenerator(const DeviceLimits& limits);
    explicit ScheduleGenerator(const MirrorDevice& device);

    // Throws InvalidRangeError / InfeasibleResolutionError before anything is emitted.
    VoltageSchedule generate(const ScheduleConfig& cfg);

    // Same checks as generate() without building a schedule.
    void validate(const ScheduleConfig& cfg) const;

    const DeviceLimits& limits() const { return limits_; }

private:
    struct GridShape {
        int nx = 0;
        int ny = 0;
    };

    GridShape resolveGrid(const ScheduleConfig& cfg) const;

    DeviceLimits limits_{};
    std::mt19937 entropy_;
};

} // namespace tipalign
