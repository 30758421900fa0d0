// scan_viewer.cpp
// - Raw and smoothed power heatmaps of one raster scan, with the estimated tip
//   voltage and competing lobes overlaid
// - Loads a scan file (--scan path) or acquires one from the simulated mirror
// - Analyzer settings are live: every change re-runs the analysis on the same record

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include "AlignErrors.h"
#include "AlignmentController.h"
#include "ScanAnalyzer.h"
#include "ScanFile.h"
#include "ScanRunner.h"
#include "SimulatedMirror.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define TIPALIGN_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    return EXIT_FAILURE;
}

struct ViewerState {
    // Analyzer
    float smoothing_steps = 1.0f;
    float min_confidence = 3.0f;
    int policy = 0;        // 0 argmax, 1 centroid, 2 model fit
    int interpolation = 0; // 0 nearest, 1 weighted
    float centroid_threshold = 0.5f;

    // Simulated mirror
    float tip_x_V = 0.4f;
    float tip_y_V = 0.6f;
    float lobe_sigma_V = 0.15f;
    float noise_mW = 0.01f;
    bool second_lobe = false;
    int steps = 10;
    int order = 0;
    int seed = 1337;

    bool show_smoothed = true;
    bool show_lobes = true;
};

// ImPlot heatmaps draw row 0 at the top; grid rows run upward in y.
static std::vector<double> heatmap_rows(const tipalign::GridSurface& g) {
    std::vector<double> out(g.power_mW.size());
    for (int j = 0; j < g.ny; ++j) {
        const int row = g.ny - 1 - j;
        for (int i = 0; i < g.nx; ++i) {
            out[static_cast<std::size_t>(row) * g.nx + i] = g.at(i, j);
        }
    }
    return out;
}

static tipalign::AnalyzerConfig analyzer_config(const ViewerState& ui) {
    tipalign::AnalyzerConfig a;
    a.smoothing_radius_steps = ui.smoothing_steps;
    a.min_confidence = ui.min_confidence;
    a.policy = static_cast<tipalign::PeakPolicy>(ui.policy);
    a.interpolation = ui.interpolation == 1 ? tipalign::Interpolation::LocalWeighted
                                            : tipalign::Interpolation::NearestNeighbor;
    a.centroid_threshold_0_1 = ui.centroid_threshold;
    return a;
}

static tipalign::SimulatedMirror::Config mirror_config(const ViewerState& ui) {
    tipalign::SimulatedMirror::Config m;
    m.noise_sigma_mW = ui.noise_mW;
    m.seed = static_cast<std::uint32_t>(ui.seed);
    m.lobes.push_back({tipalign::VoltagePair{ui.tip_x_V, ui.tip_y_V}, 1.0, ui.lobe_sigma_V});
    if (ui.second_lobe) {
        m.lobes.push_back({tipalign::VoltagePair{1.0 - ui.tip_x_V, 1.0 - ui.tip_y_V}, 0.98, ui.lobe_sigma_V});
    }
    return m;
}

static tipalign::ScanRecord simulate_scan(const ViewerState& ui) {
    tipalign::SimulatedMirror mirror(mirror_config(ui));
    tipalign::ScheduleGenerator gen(mirror);
    tipalign::ScheduleConfig sc;
    sc.x_steps = ui.steps;
    sc.y_steps = ui.steps;
    sc.ordering = static_cast<tipalign::ScheduleOrdering>(ui.order);
    tipalign::VoltageSchedule s = gen.generate(sc);
    return tipalign::runScan(mirror, s, tipalign::ScanConfig::fromSchedule(s));
}

static void plot_surface(const char* title,
                         const tipalign::GridSurface& g,
                         const tipalign::ScanAnalysis& a,
                         bool show_lobes) {
    if (g.empty()) return;
    const std::vector<double> values = heatmap_rows(g);
    const auto mm = std::minmax_element(values.begin(), values.end());
    const double half_dx = 0.5 * g.dx_V;
    const double half_dy = 0.5 * g.dy_V;
    const ImPlotPoint lo(g.x0_V - half_dx, g.y0_V - half_dy);
    const ImPlotPoint hi(g.x0_V + g.dx_V * (g.nx - 1) + half_dx, g.y0_V + g.dy_V * (g.ny - 1) + half_dy);

    if (ImPlot::BeginPlot(title, ImVec2(-1, 420), ImPlotFlags_Equal)) {
        ImPlot::SetupAxes("X voltage (V)", "Y voltage (V)");
        ImPlot::PlotHeatmap("power_mW", values.data(), g.ny, g.nx, *mm.first, *mm.second, nullptr, lo, hi);

        const double tx = a.result.voltage.x_V;
        const double ty = a.result.voltage.y_V;
        ImPlot::SetNextMarkerStyle(ImPlotMarker_Cross, 10.0f);
        ImPlot::PlotScatter("tip", &tx, &ty, 1);

        if (show_lobes && a.lobe_peaks.size() > 1) {
            std::vector<double> lx, ly;
            for (std::size_t k = 1; k < a.lobe_peaks.size(); ++k) {
                lx.push_back(a.lobe_peaks[k].x_V);
                ly.push_back(a.lobe_peaks[k].y_V);
            }
            ImPlot::SetNextMarkerStyle(ImPlotMarker_Circle, 6.0f);
            ImPlot::PlotScatter("competing lobes", lx.data(), ly.data(), static_cast<int>(lx.size()));
        }
        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    std::string scan_path;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] && std::string(argv[i]) == "--scan" && i + 1 < argc) {
            scan_path = argv[++i];
        }
    }

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 900, "Tip Alignment Scan Viewer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
#ifndef TIPALIGN_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;
    ImPlot::CreateContext();
    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        ImGui_ImplGlfw_Shutdown();
        ImPlot::DestroyContext();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }

    ViewerState ui;
    std::unique_ptr<tipalign::ScanRecord> record;
    tipalign::ScanAnalysis analysis;
    std::string status;
    bool dirty = true;

    try {
        record.reset(new tipalign::ScanRecord(scan_path.empty() ? simulate_scan(ui)
                                                                : tipalign::readScanFile(scan_path)));
    } catch (const tipalign::AlignError& e) {
        status = std::string("[") + tipalign::errorCodeName(e.code()) + "] " + e.what();
        std::fprintf(stderr, "%s\n", status.c_str());
    }

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        if (dirty && record) {
            dirty = false;
            try {
                const tipalign::ScanAnalyzer analyzer(analyzer_config(ui));
                analysis = analyzer.analyzeDetailed(*record);
                status.clear();
            } catch (const tipalign::AlignError& e) {
                analysis = tipalign::ScanAnalysis{};
                status = std::string("[") + tipalign::errorCodeName(e.code()) + "] " + e.what();
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef TIPALIGN_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        ImGui::Begin("Analysis");
        dirty |= ImGui::SliderFloat("Smoothing radius (steps)", &ui.smoothing_steps, 0.0f, 4.0f, "%.2f");
        dirty |= ImGui::SliderFloat("Min confidence", &ui.min_confidence, 0.0f, 20.0f, "%.1f");
        dirty |= ImGui::Combo("Peak policy", &ui.policy, "Argmax\0Centroid\0Model fit\0");
        dirty |= ImGui::SliderFloat("Centroid threshold", &ui.centroid_threshold, 0.0f, 0.95f, "%.2f");
        dirty |= ImGui::Combo("Interpolation", &ui.interpolation, "Nearest\0Weighted\0");
        ImGui::Checkbox("Smoothed surface", &ui.show_smoothed);
        ImGui::SameLine();
        ImGui::Checkbox("Competing lobes", &ui.show_lobes);

        if (record) {
            const tipalign::AlignmentResult& r = analysis.result;
            ImGui::Separator();
            ImGui::Text("Samples: %zu%s", record->size(), record->isPartial() ? " (partial)" : "");
            ImGui::Text("Tip voltage: (%.2f, %.2f) V", r.voltage.x_V, r.voltage.y_V);
            ImGui::Text("Peak %.4f mW  floor %.4f mW  sigma %.4f mW", r.power_mW, r.noise_floor_mW, r.noise_sigma_mW);
            ImGui::Text("Confidence: %.2f  lobes: %d", r.confidence, r.lobe_count);
            if (ui.policy == 2 && analysis.fit.iterations > 0) {
                ImGui::Text("Fit: sigma %.4f V  amplitude %.4f mW  rms %.4f mW  (%d iterations)",
                            analysis.fit.sigma_V, analysis.fit.amplitude_mW, analysis.fit.rms_residual_mW,
                            analysis.fit.iterations);
            }
            const std::string flags = tipalign::describeFlags(r.flags);
            if (r.isLowConfidence()) {
                ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.3f, 1.0f), "Flags: %s", flags.c_str());
            } else {
                ImGui::Text("Flags: %s", flags.c_str());
            }
        }
        if (!status.empty()) {
            ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", status.c_str());
        }
        ImGui::End();

        ImGui::Begin("Simulated mirror");
        ImGui::SliderFloat("Tip X (V)", &ui.tip_x_V, 0.0f, 1.0f, "%.2f");
        ImGui::SliderFloat("Tip Y (V)", &ui.tip_y_V, 0.0f, 1.0f, "%.2f");
        ImGui::SliderFloat("Lobe sigma (V)", &ui.lobe_sigma_V, 0.02f, 0.5f, "%.2f");
        ImGui::SliderFloat("Noise (mW)", &ui.noise_mW, 0.0f, 0.2f, "%.3f");
        ImGui::Checkbox("Second lobe", &ui.second_lobe);
        ImGui::SliderInt("Steps per axis", &ui.steps, 2, 60);
        ImGui::Combo("Order", &ui.order, "Raster\0Serpentine\0Shuffled\0Space-filling\0");
        ImGui::InputInt("Seed", &ui.seed);

        if (ImGui::Button("Scan")) {
            try {
                record.reset(new tipalign::ScanRecord(simulate_scan(ui)));
                dirty = true;
            } catch (const tipalign::AlignError& e) {
                status = std::string("[") + tipalign::errorCodeName(e.code()) + "] " + e.what();
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Align")) {
            try {
                tipalign::SimulatedMirror mirror(mirror_config(ui));
                tipalign::ControllerConfig ccfg;
                ccfg.scan.x_steps = ui.steps;
                ccfg.scan.y_steps = ui.steps;
                ccfg.scan.ordering = static_cast<tipalign::ScheduleOrdering>(ui.order);
                ccfg.analyzer = analyzer_config(ui);
                ccfg.confirm_min_confidence = 1.0;
                tipalign::AlignmentController controller(mirror, ccfg);
                const tipalign::ControllerOutcome out = controller.run();
                if (controller.lastRecord()) {
                    record.reset(new tipalign::ScanRecord(*controller.lastRecord()));
                    dirty = true;
                }
                char buf[160];
                std::snprintf(buf, sizeof(buf), "%s after %d scan(s), mirror at (%.2f, %.2f) V",
                              out.converged ? "Converged" : "Not converged", out.attempts,
                              out.final_voltage.x_V, out.final_voltage.y_V);
                std::fprintf(stderr, "%s\n", buf);
            } catch (const tipalign::AlignError& e) {
                status = std::string("[") + tipalign::errorCodeName(e.code()) + "] " + e.what();
            }
        }
        ImGui::End();

        ImGui::Begin("Surface");
        if (record && !analysis.raw.empty()) {
            plot_surface(ui.show_smoothed ? "Smoothed power" : "Raw power",
                         ui.show_smoothed ? analysis.smoothed : analysis.raw,
                         analysis, ui.show_lobes);
        } else {
            ImGui::TextUnformatted("No scan loaded.");
        }
        ImGui::End();

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);
        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }
        glfwSwapBuffers(window);
    }

    ImPlot::DestroyContext();
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
