#include "AlignmentController.h"

#include "AlignErrors.h"
#include "MirrorDevice.h"
#include "ScanRunner.h"

#include <algorithm>
#include <cmath>
#include <ostream>

namespace tipalign {

namespace {

// Relative tolerance matching the schedule generator's step check.
constexpr double kStepSlack = 1e-9;

AnalyzerConfig confirmAnalyzerConfig(const ControllerConfig& cfg) {
    AnalyzerConfig a = cfg.analyzer;
    if (cfg.confirm_min_confidence >= 0.0) {
        a.min_confidence = cfg.confirm_min_confidence;
    }
    return a;
}

const ControllerConfig& checked(const ControllerConfig& cfg) {
    if (!std::isfinite(cfg.widen_factor) || cfg.widen_factor <= 1.0) {
        throw InvalidConfigError("widen_factor must be > 1");
    }
    if (!(cfg.confirm_span_fraction_0_1 > 0.0 && cfg.confirm_span_fraction_0_1 <= 1.0)) {
        throw InvalidConfigError("confirm_span_fraction_0_1 must lie in (0, 1]");
    }
    if (cfg.max_attempts < 1) {
        throw InvalidConfigError("max_attempts must be >= 1");
    }
    return cfg;
}

} // namespace

const char* controllerStateName(ControllerState s) {
    switch (s) {
        case ControllerState::Idle:       return "Idle";
        case ControllerState::Scanning:   return "Scanning";
        case ControllerState::Analyzing:  return "Analyzing";
        case ControllerState::Moving:     return "Moving";
        case ControllerState::Confirming: return "Confirming";
    }
    return "Unknown";
}

AlignmentController::AlignmentController(MirrorDevice& device, const ControllerConfig& cfg)
    : device_(device),
      cfg_(checked(cfg)),
      generator_(device),
      analyzer_(cfg.analyzer),
      confirm_analyzer_(confirmAnalyzerConfig(cfg)) {
    generator_.validate(cfg_.scan);
    if (cfg_.confirm) {
        // Widening only grows the window, so the first confirmation is the narrowest one.
        generator_.validate(confirmWindow(cfg_.scan, VoltagePair{cfg_.scan.x.center(), cfg_.scan.y.center()}));
    }
}

void AlignmentController::transition(ControllerState next) {
    state_ = next;
    history_.push_back(next);
    if (cfg_.log) {
        *cfg_.log << "[align] -> " << controllerStateName(next) << "\n";
    }
}

ScanRecord AlignmentController::scanWindow(const ScheduleConfig& window) {
    VoltageSchedule schedule = generator_.generate(window);
    ScanRecord record = runScan(device_, schedule, ScanConfig::fromSchedule(schedule), cfg_.log);
    if (record.isPartial() && record.empty()) {
        throw HardwareFaultError("scan aborted before the first sample: " + record.abortReason());
    }
    last_record_.reset(new ScanRecord(record));
    return record;
}

AxisRange AlignmentController::clampedAxis(double center, double span) const {
    const DeviceLimits lim = generator_.limits();
    AxisRange r{center - 0.5 * span, center + 0.5 * span};
    r.min_V = std::max(r.min_V, lim.v_min_V);
    r.max_V = std::min(r.max_V, lim.v_max_V);
    return r;
}

ScheduleConfig AlignmentController::widened(const ScheduleConfig& window) const {
    ScheduleConfig w = window;
    w.x = clampedAxis(window.x.center(), window.x.span() * cfg_.widen_factor);
    w.y = clampedAxis(window.y.center(), window.y.span() * cfg_.widen_factor);
    return w;
}

AxisRange AlignmentController::shiftedAxis(double center, double span) const {
    const DeviceLimits lim = generator_.limits();
    AxisRange r{center - 0.5 * span, center + 0.5 * span};
    if (r.min_V < lim.v_min_V) {
        r.max_V += lim.v_min_V - r.min_V;
        r.min_V = lim.v_min_V;
    }
    if (r.max_V > lim.v_max_V) {
        r.min_V -= r.max_V - lim.v_max_V;
        r.max_V = lim.v_max_V;
    }
    r.min_V = std::max(r.min_V, lim.v_min_V);
    return r;
}

int AlignmentController::confirmSteps(const AxisRange& r, int steps) const {
    const double fit = std::floor(r.span() / generator_.limits().min_step_V * (1.0 + kStepSlack));
    return std::max(1, static_cast<int>(std::min(fit, static_cast<double>(steps))));
}

ScheduleConfig AlignmentController::confirmWindow(const ScheduleConfig& window,
                                                  const VoltagePair& center) const {
    ScheduleConfig w = window;
    w.x = shiftedAxis(center.x_V, window.x.span() * cfg_.confirm_span_fraction_0_1);
    w.y = shiftedAxis(center.y_V, window.y.span() * cfg_.confirm_span_fraction_0_1);

    // Always a full grid, never finer than the device step.
    int x_steps = window.x_steps;
    int y_steps = window.y_steps;
    if (window.sample_count > 0) {
        const int side = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(window.sample_count))));
        x_steps = std::max(1, side - 1);
        y_steps = x_steps;
    }
    w.sample_count = 0;
    w.x_steps = confirmSteps(w.x, x_steps);
    w.y_steps = confirmSteps(w.y, y_steps);
    return w;
}

ControllerOutcome AlignmentController::run() {
    history_.clear();
    state_ = ControllerState::Idle;
    history_.push_back(state_);

    ControllerOutcome out;
    ScheduleConfig window = cfg_.scan;

    try {
        while (out.attempts < cfg_.max_attempts) {
            ++out.attempts;

            transition(ControllerState::Scanning);
            const ScanRecord record = scanWindow(window);

            transition(ControllerState::Analyzing);
            out.result = analyzer_.analyze(record);
            if (cfg_.log) {
                *cfg_.log << "[align] attempt " << out.attempts << ": peak (" << out.result.voltage.x_V
                          << ", " << out.result.voltage.y_V << ") V, confidence " << out.result.confidence
                          << ", flags " << describeFlags(out.result.flags) << "\n";
            }
            if (out.result.isLowConfidence() || out.result.hasFlag(Result_PeakOnEdge)) {
                window = widened(window);
                continue;
            }

            transition(ControllerState::Moving);
            device_.moveTo(out.result.voltage);
            out.moved = true;
            out.final_voltage = out.result.voltage;
            if (!cfg_.confirm) {
                out.converged = true;
                break;
            }

            transition(ControllerState::Confirming);
            const ScanRecord check = scanWindow(confirmWindow(window, out.result.voltage));
            out.confirmation = confirm_analyzer_.analyze(check);
            if (cfg_.log) {
                *cfg_.log << "[align] confirmation: peak (" << out.confirmation.voltage.x_V << ", "
                          << out.confirmation.voltage.y_V << ") V, confidence "
                          << out.confirmation.confidence << ", flags "
                          << describeFlags(out.confirmation.flags) << "\n";
            }
            if (out.confirmation.isLowConfidence() || out.confirmation.hasFlag(Result_PeakOnEdge)) {
                window = widened(window);
                continue;
            }

            device_.moveTo(out.confirmation.voltage);
            out.final_voltage = out.confirmation.voltage;
            out.converged = true;
            break;
        }
    } catch (const AlignError&) {
        // A failed scan or move ends the run in Idle.
        transition(ControllerState::Idle);
        throw;
    }

    transition(ControllerState::Idle);
    if (cfg_.log && !out.converged) {
        *cfg_.log << "[align] no confident alignment after " << out.attempts << " scan(s)\n";
    }
    out.history = history_;
    return out;
}

} // namespace tipalign
