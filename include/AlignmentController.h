#pragma once

#include "ScanAnalyzer.h"
#include "ScanRecord.h"
#include "VoltageSchedule.h"

#include <iosfwd>
#include <memory>
#include <vector>

namespace tipalign {

class MirrorDevice;

enum class ControllerState : int {
    Idle       = 0,
    Scanning   = 1,
    Analyzing  = 2,
    Moving     = 3,
    Confirming = 4,
};

const char* controllerStateName(ControllerState s);

struct ControllerConfig {
    // First scan window and resolution.
    ScheduleConfig scan{};
    AnalyzerConfig analyzer{};

    // Rescan centered on the result after moving.
    bool confirm = true;
    // Confirmation window span as a fraction of the current window. Its step count is
    // reduced as needed to stay at or above the device minimum step.
    double confirm_span_fraction_0_1 = 0.25;

    // Window growth after a low-confidence or edge result.
    double widen_factor = 2.0;
    // Scans of the primary window before giving up.
    int max_attempts = 3;

    // Acceptance threshold for the confirmation scan. The small window sits on the
    // shoulder of the peak, so its contrast is lower than the primary scan's.
    // Negative = use analyzer.min_confidence.
    double confirm_min_confidence = -1.0;

    std::ostream* log = nullptr;
};

struct ControllerOutcome {
    bool converged = false;
    int attempts = 0;
    AlignmentResult result{};       // last primary-window result
    AlignmentResult confirmation{}; // last confirmation result (if any)
    VoltagePair final_voltage{};    // where the mirror was left
    bool moved = false;
    std::vector<ControllerState> history{};
};

// Closed loop over one device: Idle -> Scanning -> Analyzing -> Moving -> Confirming -> Idle.
//
// A low-confidence (or edge) primary result widens the window and scans again.
// A low-confidence confirmation widens the window and goes back to Scanning.
// The controller is the only user of the device while run() executes. An error
// thrown out of run() leaves the controller Idle.
class AlignmentController {
public:
    // Throws InvalidConfigError (analyzer or controller settings) and the schedule
    // errors for an unusable first window or confirmation window.
    AlignmentController(MirrorDevice& device, const ControllerConfig& cfg);

    AlignmentController(const AlignmentController&) = delete;
    AlignmentController& operator=(const AlignmentController&) = delete;

    ControllerOutcome run();

    ControllerState state() const { return state_; }
    const std::vector<ControllerState>& history() const { return history_; }

    // Record of the most recent scan (primary or confirmation).
    const ScanRecord* lastRecord() const { return last_record_.get(); }

private:
    void transition(ControllerState next);
    ScanRecord scanWindow(const ScheduleConfig& window);
    ScheduleConfig widened(const ScheduleConfig& window) const;
    ScheduleConfig confirmWindow(const ScheduleConfig& window, const VoltagePair& center) const;
    AxisRange clampedAxis(double center, double span) const;
    // Same span moved inside the device limits.
    AxisRange shiftedAxis(double center, double span) const;
    int confirmSteps(const AxisRange& r, int steps) const;

    MirrorDevice& device_;
    ControllerConfig cfg_;
    ScheduleGenerator generator_;
    ScanAnalyzer analyzer_;
    ScanAnalyzer confirm_analyzer_;
    ControllerState state_ = ControllerState::Idle;
    std::vector<ControllerState> history_{};
    std::unique_ptr<ScanRecord> last_record_{};
};

} // namespace tipalign
