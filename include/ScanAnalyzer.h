#pragma once

#include "AlignTypes.h"
#include "GridSurface.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace tipalign {

class ScanRecord;

enum class Interpolation : int {
    NearestNeighbor = 0,
    LocalWeighted   = 1, // inverse-distance weighted, nearest as fallback
};

enum class PeakPolicy : int {
    Argmax   = 0,
    Centroid = 1,
    ModelFit = 2, // least-squares 2-D Gaussian + baseline over the raw samples
};

// Result flags. Callers decide whether to accept, rescan or widen.
enum ResultFlagBits : std::uint32_t {
    Result_None             = 0u,
    Result_LowConfidence    = 1u << 0, // below min_confidence, or ambiguous peak
    Result_MultiLobe        = 1u << 1, // near-equal maxima in disjoint regions
    Result_NoSignal         = 1u << 2, // peak not above one noise sigma
    Result_PartialScan      = 1u << 3,
    Result_SingleSample     = 1u << 4,
    Result_PeakOnEdge       = 1u << 5, // maximum on the scan boundary
    Result_CentroidFallback = 1u << 6, // centroid region was a single node
    Result_FitFallback      = 1u << 7, // model fit diverged or left the scan window
};

// Every threshold is explicit. smoothing_radius_steps and min_confidence have
// no usable default: they depend on aperture size and sensor noise and must be set.
struct AnalyzerConfig {
    Interpolation interpolation = Interpolation::NearestNeighbor;
    double interpolation_radius_steps = 1.5;

    // Gaussian local average, sigma = radius / 2. 0 disables smoothing.
    double smoothing_radius_steps = std::numeric_limits<double>::quiet_NaN();

    PeakPolicy policy = PeakPolicy::Argmax;
    double centroid_threshold_0_1 = 0.5;
    int fit_max_iterations = 100;

    // Dimensionless (peak - floor) / noise sigma.
    double min_confidence = std::numeric_limits<double>::quiet_NaN();

    // Regions within this fraction of the peak contrast count as competing lobes
    // when at least lobe_min_separation_steps away from the primary peak.
    double lobe_tie_tolerance_0_1 = 0.1;
    double lobe_min_separation_steps = 2.0;

    // Noise floor uses samples farther than this from the peak.
    double noise_exclusion_radius_steps = 3.0;
    // Noise sigma multiplier for aborted (partial) scans.
    double partial_noise_inflation = 1.5;
    // Lower bound for the noise sigma (sensor quantization).
    double sensor_resolution_mW = 1e-6;
};

struct AlignmentResult {
    VoltagePair voltage{};
    double confidence = 0.0;
    double power_mW = 0.0;       // smoothed power at the peak
    double noise_floor_mW = 0.0;
    double noise_sigma_mW = 0.0;
    int lobe_count = 0;
    std::uint32_t flags = Result_None;
    std::size_t samples_used = 0;

    bool hasFlag(ResultFlagBits f) const { return (flags & f) != 0u; }
    bool isLowConfidence() const { return hasFlag(Result_LowConfidence); }
};

bool operator==(const AlignmentResult& a, const AlignmentResult& b);

// p(x, y) = baseline + amplitude * exp(-((x - x0)^2 + (y - y0)^2) / (2 sigma^2))
struct GaussianFit {
    bool converged = false;
    VoltagePair center{};
    double amplitude_mW = 0.0;
    double sigma_V = 0.0;
    double baseline_mW = 0.0;
    double rms_residual_mW = 0.0;
    int iterations = 0;

    double evaluate(const VoltagePair& v) const;
};

// Everything the visualization layer plots for one analysis.
struct ScanAnalysis {
    GridSurface raw{};
    GridSurface smoothed{};
    AlignmentResult result{};
    std::vector<VoltagePair> lobe_peaks{}; // best node of each lobe, primary first
    GaussianFit fit{};                     // ModelFit policy only
};

// Pure stages, exposed for tools and tests.
GridSurface reconstructSurface(const ScanRecord& record, const AnalyzerConfig& cfg);
GridSurface smoothSurface(const GridSurface& grid, double radius_steps);

// Levenberg-Marquardt fit of a GaussianFit to the raw samples, started from `guess`.
// converged is false when the solve runs out of iterations or the parameters become unphysical.
GaussianFit fitGaussian(const ScanRecord& record, const GaussianFit& guess, int max_iterations);

// Reduces a sealed scan to an alignment voltage. Stateless across calls:
// analyzing the same record with the same config yields the same result.
class ScanAnalyzer {
public:
    // Throws InvalidConfigError.
    explicit ScanAnalyzer(const AnalyzerConfig& cfg);

    // Throws EmptyScanError, RecordNotSealedError.
    AlignmentResult analyze(const ScanRecord& record) const;
    ScanAnalysis analyzeDetailed(const ScanRecord& record) const;

    const AnalyzerConfig& config() const { return cfg_; }

    static void validate(const AnalyzerConfig& cfg);

private:
    AnalyzerConfig cfg_{};
};

// "LowConfidence|MultiLobe", or "None".
std::string describeFlags(std::uint32_t flags);

} // namespace tipalign
