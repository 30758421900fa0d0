#pragma once

#include "AlignTypes.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace tipalign {

class VoltageSchedule;

// Configuration a scan was taken with. Travels with the samples (and the scan file header).
struct ScanConfig {
    AxisRange x{0.0, 1.0};
    AxisRange y{0.0, 1.0};
    int x_steps = 10;
    int y_steps = 10;
    ScheduleOrdering ordering = ScheduleOrdering::Raster;
    int repeats_per_point = 1;
    std::string timestamp;
    std::string label;

    double xStep_V() const { return x.span() / static_cast<double>(x_steps); }
    double yStep_V() const { return y.span() / static_cast<double>(y_steps); }

    // Ranges, resolved grid and ordering of a generated schedule.
    static ScanConfig fromSchedule(const VoltageSchedule& schedule, const std::string& timestamp = {});
};

// Samples of one scan in acquisition order.
//
// Open while the hardware layer reports, read-only after seal(). add() enforces:
//   - voltage inside the configured range (OutOfRangeError)
//   - power finite and >= 0 (OutOfRangeError)
//   - a voltage pair recorded at most repeats_per_point times (DuplicateSampleError)
//   - nothing added after seal() (SealedRecordError)
class ScanRecord {
public:
    // Throws InvalidRangeError / InfeasibleResolutionError for an unusable config.
    explicit ScanRecord(const ScanConfig& config);

    void add(const Sample& sample);

    void seal() { sealed_ = true; }

    // Scan was aborted before the schedule completed. Must precede seal().
    void markPartial(const std::string& reason);

    bool isSealed() const { return sealed_; }
    bool isPartial() const { return partial_; }
    const std::string& abortReason() const { return abort_reason_; }

    const std::vector<Sample>& samples() const { return samples_; }
    const ScanConfig& config() const { return config_; }
    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    bool inRange(const VoltagePair& v) const;

private:
    ScanConfig config_{};
    std::vector<Sample> samples_{};
    std::map<VoltagePair, int> visits_{};
    bool sealed_ = false;
    bool partial_ = false;
    std::string abort_reason_{};
};

} // namespace tipalign
