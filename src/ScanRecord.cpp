#include "ScanRecord.h"

#include "AlignErrors.h"
#include "VoltageSchedule.h"

#include <cmath>
#include <sstream>

namespace tipalign {

namespace {
// Range check tolerance, relative to the axis span.
constexpr double kRangeTolerance = 1e-9;

bool axisContains(const AxisRange& r, double v) {
    const double tol = kRangeTolerance * r.span();
    return std::isfinite(v) && v >= r.min_V - tol && v <= r.max_V + tol;
}
} // namespace

ScanConfig ScanConfig::fromSchedule(const VoltageSchedule& schedule, const std::string& timestamp) {
    const ScheduleConfig& sc = schedule.config();
    ScanConfig c;
    c.x = sc.x;
    c.y = sc.y;
    c.x_steps = schedule.xSteps();
    c.y_steps = schedule.ySteps();
    c.ordering = sc.ordering;
    c.repeats_per_point = sc.repeats_per_point;
    c.timestamp = timestamp;
    return c;
}

ScanRecord::ScanRecord(const ScanConfig& config) : config_(config) {
    if (!config_.x.isValid() || !config_.y.isValid()) {
        throw InvalidRangeError("scan range must be finite with min < max on both axes");
    }
    if (config_.x_steps < 1 || config_.y_steps < 1 || config_.repeats_per_point < 1) {
        throw InfeasibleResolutionError("scan steps and repeats_per_point must be >= 1");
    }
    const double nodes = (static_cast<double>(config_.x_steps) + 1.0) * (static_cast<double>(config_.y_steps) + 1.0);
    if (nodes > static_cast<double>(ScheduleGenerator::kMaxScheduleNodes)) {
        std::ostringstream os;
        os << "scan grid of " << config_.x_steps << " x " << config_.y_steps
           << " steps exceeds the schedule node limit of " << ScheduleGenerator::kMaxScheduleNodes;
        throw InfeasibleResolutionError(os.str());
    }
}

bool ScanRecord::inRange(const VoltagePair& v) const {
    return axisContains(config_.x, v.x_V) && axisContains(config_.y, v.y_V);
}

void ScanRecord::add(const Sample& sample) {
    if (sealed_) {
        throw SealedRecordError("scan record is sealed; no further samples accepted");
    }
    if (!inRange(sample.v)) {
        std::ostringstream os;
        os << "sample (" << sample.v.x_V << ", " << sample.v.y_V << ") V lies outside the scan range";
        throw OutOfRangeError(os.str());
    }
    if (!std::isfinite(sample.power_mW) || sample.power_mW < 0.0) {
        std::ostringstream os;
        os << "sample power " << sample.power_mW << " mW is not a valid reading";
        throw OutOfRangeError(os.str());
    }

    int& visits = visits_[sample.v];
    if (visits >= config_.repeats_per_point) {
        std::ostringstream os;
        os << "voltage pair (" << sample.v.x_V << ", " << sample.v.y_V << ") V already recorded "
           << visits << " time(s)";
        throw DuplicateSampleError(os.str());
    }
    ++visits;
    samples_.push_back(sample);
}

void ScanRecord::markPartial(const std::string& reason) {
    if (sealed_) {
        throw SealedRecordError("cannot mark a sealed scan record partial");
    }
    partial_ = true;
    abort_reason_ = reason;
}

} // namespace tipalign
