#include "AlignErrors.h"
#include "AlignmentController.h"
#include "ScanAnalyzer.h"
#include "ScanFile.h"
#include "SimulatedMirror.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

// Exit code for a result the operator should not accept as-is.
constexpr int kExitLowConfidence = 2;

void printUsage() {
    std::cout << "AlignTool usage:\n"
              << "  AlignTool --scan <file.csv> --smooth r --min-confidence c [options]\n"
              << "  AlignTool --lvm <file.lvm> --x-min v --x-max v --y-min v --y-max v\n"
              << "            --x-steps n --y-steps n [--repeats n] --smooth r --min-confidence c [options]\n"
              << "  AlignTool --simulate --smooth r --min-confidence c [--tip-x v] [--tip-y v] [--noise mW]\n"
              << "options:\n"
              << "  --policy argmax|centroid|fit   --interp nearest|weighted\n"
              << "  --export-grid <file.csv>   --save-scan <file.csv> (simulate)\n";
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

void printResult(const tipalign::AlignmentResult& r) {
    std::cout << std::fixed << std::setprecision(2)
              << "Tip X voltage: " << round2(r.voltage.x_V) << " V\n"
              << "Tip Y voltage: " << round2(r.voltage.y_V) << " V\n"
              << std::setprecision(4)
              << "Peak power:    " << r.power_mW << " mW\n"
              << "Noise floor:   " << r.noise_floor_mW << " mW (sigma " << r.noise_sigma_mW << ")\n"
              << std::setprecision(2)
              << "Confidence:    " << r.confidence << "\n"
              << "Lobes:         " << r.lobe_count << "\n"
              << "Samples:       " << r.samples_used << "\n"
              << "Flags:         " << tipalign::describeFlags(r.flags) << "\n";
    if (r.isLowConfidence()) {
        std::cout << "WARNING: low-confidence result; rescan or widen the range before moving the mirror.\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string scan_path;
    std::string lvm_path;
    std::string grid_path;
    std::string save_path;
    bool simulate = false;
    double tip_x = 0.4;
    double tip_y = 0.6;
    double noise_mW = 0.01;

    tipalign::ScanConfig lvm_cfg;
    tipalign::AnalyzerConfig acfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--scan" && i + 1 < argc) {
                scan_path = argv[++i];
            } else if (arg == "--lvm" && i + 1 < argc) {
                lvm_path = argv[++i];
            } else if (arg == "--simulate") {
                simulate = true;
            } else if (arg == "--x-min" && i + 1 < argc) {
                lvm_cfg.x.min_V = std::stod(argv[++i]);
            } else if (arg == "--x-max" && i + 1 < argc) {
                lvm_cfg.x.max_V = std::stod(argv[++i]);
            } else if (arg == "--y-min" && i + 1 < argc) {
                lvm_cfg.y.min_V = std::stod(argv[++i]);
            } else if (arg == "--y-max" && i + 1 < argc) {
                lvm_cfg.y.max_V = std::stod(argv[++i]);
            } else if (arg == "--x-steps" && i + 1 < argc) {
                lvm_cfg.x_steps = std::stoi(argv[++i]);
            } else if (arg == "--y-steps" && i + 1 < argc) {
                lvm_cfg.y_steps = std::stoi(argv[++i]);
            } else if (arg == "--repeats" && i + 1 < argc) {
                lvm_cfg.repeats_per_point = std::stoi(argv[++i]);
            } else if (arg == "--smooth" && i + 1 < argc) {
                acfg.smoothing_radius_steps = std::stod(argv[++i]);
            } else if (arg == "--min-confidence" && i + 1 < argc) {
                acfg.min_confidence = std::stod(argv[++i]);
            } else if (arg == "--policy" && i + 1 < argc) {
                const std::string p = argv[++i];
                if (p == "argmax") {
                    acfg.policy = tipalign::PeakPolicy::Argmax;
                } else if (p == "centroid") {
                    acfg.policy = tipalign::PeakPolicy::Centroid;
                } else if (p == "fit") {
                    acfg.policy = tipalign::PeakPolicy::ModelFit;
                } else {
                    std::cout << "Unsupported policy: " << p << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--interp" && i + 1 < argc) {
                const std::string m = argv[++i];
                if (m == "nearest") {
                    acfg.interpolation = tipalign::Interpolation::NearestNeighbor;
                } else if (m == "weighted") {
                    acfg.interpolation = tipalign::Interpolation::LocalWeighted;
                } else {
                    std::cout << "Unsupported interpolation: " << m << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--tip-x" && i + 1 < argc) {
                tip_x = std::stod(argv[++i]);
            } else if (arg == "--tip-y" && i + 1 < argc) {
                tip_y = std::stod(argv[++i]);
            } else if (arg == "--noise" && i + 1 < argc) {
                noise_mW = std::stod(argv[++i]);
            } else if (arg == "--export-grid" && i + 1 < argc) {
                grid_path = argv[++i];
            } else if (arg == "--save-scan" && i + 1 < argc) {
                save_path = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        printUsage();
        return 1;
    }

    const int sources = (scan_path.empty() ? 0 : 1) + (lvm_path.empty() ? 0 : 1) + (simulate ? 1 : 0);
    if (sources != 1) {
        printUsage();
        return 1;
    }

    try {
        if (simulate) {
            tipalign::SimulatedMirror::Config mcfg;
            mcfg.noise_sigma_mW = noise_mW;
            mcfg.lobes.push_back({tipalign::VoltagePair{tip_x, tip_y}, 1.0, 0.15});
            tipalign::SimulatedMirror mirror(mcfg);

            tipalign::ControllerConfig ccfg;
            ccfg.analyzer = acfg;
            ccfg.confirm_min_confidence = 1.0;
            ccfg.log = &std::cerr;

            tipalign::AlignmentController controller(mirror, ccfg);
            const tipalign::ControllerOutcome outcome = controller.run();

            std::cout << "Converged:     " << (outcome.converged ? "yes" : "no")
                      << " after " << outcome.attempts << " scan(s)\n";
            printResult(outcome.converged && ccfg.confirm ? outcome.confirmation : outcome.result);
            if (!save_path.empty() && controller.lastRecord()) {
                tipalign::writeScanFile(save_path, *controller.lastRecord());
                std::cout << "Wrote scan to: " << save_path << "\n";
            }
            return outcome.converged ? 0 : kExitLowConfidence;
        }

        const tipalign::ScanRecord record = scan_path.empty()
            ? tipalign::readLvmScan(lvm_path, lvm_cfg)
            : tipalign::readScanFile(scan_path);
        if (record.isPartial()) {
            std::cerr << "Scan is partial: " << record.abortReason() << "\n";
        }

        const tipalign::ScanAnalyzer analyzer(acfg);
        const tipalign::ScanAnalysis analysis = analyzer.analyzeDetailed(record);
        printResult(analysis.result);

        if (!grid_path.empty()) {
            std::ofstream out(grid_path);
            if (!out.is_open()) {
                std::cerr << "Cannot open " << grid_path << " for writing\n";
                return 1;
            }
            tipalign::writeGridCSV(out, analysis.smoothed);
            std::cout << "Wrote smoothed grid to: " << grid_path << "\n";
        }
        return analysis.result.isLowConfidence() ? kExitLowConfidence : 0;
    } catch (const tipalign::AlignError& e) {
        std::cerr << "[" << tipalign::errorCodeName(e.code()) << "] " << e.what() << "\n";
        return 1;
    }
}
