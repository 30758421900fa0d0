#include "AlignErrors.h"
#include "VoltageSchedule.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
void printUsage() {
    std::cout << "ScheduleTool usage:\n"
              << "  ScheduleTool [--x-min v] [--x-max v] [--y-min v] [--y-max v]\n"
              << "               [--x-steps n] [--y-steps n] [--samples n]\n"
              << "               [--order raster|serpentine|shuffled|space-filling]\n"
              << "               [--repeats n] [--seed n] [--v-min v] [--v-max v] [--min-step v]\n"
              << "               [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    tipalign::ScheduleConfig cfg;
    tipalign::DeviceLimits limits;
    std::string out_path;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--x-min" && i + 1 < argc) {
                cfg.x.min_V = std::stod(argv[++i]);
            } else if (arg == "--x-max" && i + 1 < argc) {
                cfg.x.max_V = std::stod(argv[++i]);
            } else if (arg == "--y-min" && i + 1 < argc) {
                cfg.y.min_V = std::stod(argv[++i]);
            } else if (arg == "--y-max" && i + 1 < argc) {
                cfg.y.max_V = std::stod(argv[++i]);
            } else if (arg == "--x-steps" && i + 1 < argc) {
                cfg.x_steps = std::stoi(argv[++i]);
            } else if (arg == "--y-steps" && i + 1 < argc) {
                cfg.y_steps = std::stoi(argv[++i]);
            } else if (arg == "--samples" && i + 1 < argc) {
                cfg.sample_count = std::stoi(argv[++i]);
            } else if (arg == "--order" && i + 1 < argc) {
                if (!tipalign::parseOrdering(argv[++i], &cfg.ordering)) {
                    std::cout << "Unknown ordering: " << argv[i] << "\n";
                    printUsage();
                    return 1;
                }
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats_per_point = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
                cfg.seeded = true;
            } else if (arg == "--v-min" && i + 1 < argc) {
                limits.v_min_V = std::stod(argv[++i]);
            } else if (arg == "--v-max" && i + 1 < argc) {
                limits.v_max_V = std::stod(argv[++i]);
            } else if (arg == "--min-step" && i + 1 < argc) {
                limits.min_step_V = std::stod(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out_path = argv[++i];
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

    try {
        tipalign::ScheduleGenerator generator(limits);
        tipalign::VoltageSchedule schedule = generator.generate(cfg);

        std::ofstream file;
        if (!out_path.empty()) {
            file.open(out_path);
            if (!file.is_open()) {
                std::cerr << "Cannot open " << out_path << " for writing\n";
                return 1;
            }
        }
        std::ostream& out = out_path.empty() ? std::cout : file;

        out << "index,x_V,y_V\n";
        out << std::fixed << std::setprecision(6);
        tipalign::VoltagePair v;
        std::size_t index = 0;
        while (schedule.next(v)) {
            out << index++ << ',' << v.x_V << ',' << v.y_V << '\n';
        }

        std::cerr << "Schedule: " << schedule.size() << " pairs on a "
                  << (schedule.xSteps() + 1) << " x " << (schedule.ySteps() + 1) << " grid, order "
                  << tipalign::orderingName(cfg.ordering);
        if (cfg.ordering == tipalign::ScheduleOrdering::Shuffled) {
            std::cerr << ", seed " << schedule.seedUsed();
        }
        std::cerr << "\n";
        if (!out_path.empty()) {
            std::cout << "Wrote schedule to: " << out_path << "\n";
        }
    } catch (const tipalign::AlignError& e) {
        std::cerr << "[" << tipalign::errorCodeName(e.code()) << "] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
