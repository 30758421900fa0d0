#include "ScanAnalyzer.h"

#include "AlignErrors.h"
#include "ScanRecord.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <deque>
#include <limits>
#include <string>

namespace tipalign {

namespace {

// Normal-consistency factor for the median absolute deviation.
constexpr double kMadToSigma = 1.4826;
// Fewer far samples than this and the noise floor uses the whole scan.
constexpr std::size_t kMinNoiseSamples = 3;
constexpr double kPi = 3.14159265358979323846;

struct NodeIndex {
    int i = 0;
    int j = 0;
};

double median(std::vector<double> v) {
    if (v.empty()) return 0.0;
    const std::size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double hi = v[mid];
    if (v.size() % 2 == 1) return hi;
    const double lo = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lo + hi);
}

// Sample position in grid-step units.
struct StepPos {
    double u = 0.0;
    double w = 0.0;
};

StepPos toSteps(const GridSurface& g, const VoltagePair& v) {
    return StepPos{(v.x_V - g.x0_V) / g.dx_V, (v.y_V - g.y0_V) / g.dy_V};
}

NodeIndex argmaxNode(const GridSurface& g) {
    NodeIndex best{};
    double best_v = -std::numeric_limits<double>::infinity();
    for (int j = 0; j < g.ny; ++j) {
        for (int i = 0; i < g.nx; ++i) {
            const double v = g.at(i, j);
            if (v > best_v) {
                best_v = v;
                best = NodeIndex{i, j};
            }
        }
    }
    return best;
}

// 8-connected labelling of nodes with power >= level. Returns one label per node
// (-1 = below level) and the number of regions.
int labelRegions(const GridSurface& g, double level, std::vector<int>& labels) {
    labels.assign(g.power_mW.size(), -1);
    int count = 0;
    std::deque<NodeIndex> queue;

    for (int j = 0; j < g.ny; ++j) {
        for (int i = 0; i < g.nx; ++i) {
            if (labels[g.index(i, j)] >= 0 || g.at(i, j) < level) continue;

            labels[g.index(i, j)] = count;
            queue.push_back(NodeIndex{i, j});
            while (!queue.empty()) {
                const NodeIndex n = queue.front();
                queue.pop_front();
                for (int dj = -1; dj <= 1; ++dj) {
                    for (int di = -1; di <= 1; ++di) {
                        const int a = n.i + di;
                        const int b = n.j + dj;
                        if (a < 0 || b < 0 || a >= g.nx || b >= g.ny) continue;
                        const std::size_t k = g.index(a, b);
                        if (labels[k] >= 0 || g.at(a, b) < level) continue;
                        labels[k] = count;
                        queue.push_back(NodeIndex{a, b});
                    }
                }
            }
            ++count;
        }
    }
    return count;
}

struct NoiseEstimate {
    double floor_mW = 0.0;
    double sigma_mW = 0.0;
};

NoiseEstimate estimateNoise(const ScanRecord& record,
                            const GridSurface& g,
                            const VoltagePair& peak,
                            const AnalyzerConfig& cfg) {
    const StepPos p = toSteps(g, peak);
    const double r2 = cfg.noise_exclusion_radius_steps * cfg.noise_exclusion_radius_steps;

    std::vector<double> far;
    std::vector<double> all;
    far.reserve(record.size());
    all.reserve(record.size());
    for (const auto& s : record.samples()) {
        const StepPos q = toSteps(g, s.v);
        const double du = q.u - p.u;
        const double dw = q.w - p.w;
        all.push_back(s.power_mW);
        if (du * du + dw * dw > r2) {
            far.push_back(s.power_mW);
        }
    }
    const std::vector<double>& pool = (far.size() >= kMinNoiseSamples) ? far : all;

    NoiseEstimate n{};
    n.floor_mW = median(pool);
    std::vector<double> dev;
    dev.reserve(pool.size());
    for (double v : pool) {
        dev.push_back(std::fabs(v - n.floor_mW));
    }
    n.sigma_mW = kMadToSigma * median(dev);
    if (record.isPartial()) {
        n.sigma_mW *= cfg.partial_noise_inflation;
    }
    n.sigma_mW = std::max(n.sigma_mW, cfg.sensor_resolution_mW);
    return n;
}

// Power-above-floor weighted centroid of the connected region around the peak.
// Returns false when the region is the peak node alone.
bool regionCentroid(const GridSurface& g,
                    NodeIndex peak,
                    double floor_mW,
                    double level,
                    VoltagePair& out) {
    std::vector<int> labels;
    labelRegions(g, level, labels);
    const int region = labels[g.index(peak.i, peak.j)];

    double sw = 0.0;
    double sx = 0.0;
    double sy = 0.0;
    int nodes = 0;
    for (int j = 0; j < g.ny; ++j) {
        for (int i = 0; i < g.nx; ++i) {
            if (labels[g.index(i, j)] != region) continue;
            const double w = g.at(i, j) - floor_mW;
            const VoltagePair v = g.node(i, j);
            sw += w;
            sx += w * v.x_V;
            sy += w * v.y_V;
            ++nodes;
        }
    }
    if (nodes <= 1 || !(sw > 0.0)) {
        return false;
    }
    out = VoltagePair{sx / sw, sy / sw};
    return true;
}

// Gaussian sigma from the area of the region at half contrast.
double halfMaxSigma(const GridSurface& g, double half_level) {
    int above = 0;
    for (double p : g.power_mW) {
        if (p >= half_level) ++above;
    }
    const double area = static_cast<double>(std::max(above, 1)) * g.dx_V * g.dy_V;
    const double s = std::sqrt(area / (2.0 * kPi * std::log(2.0)));
    return std::max(s, 0.5 * std::min(g.dx_V, g.dy_V));
}

// Fitted center within the scan rectangle, half a step of slack.
bool insideWindow(const ScanConfig& c, const GridSurface& g, const VoltagePair& v) {
    return std::isfinite(v.x_V) && std::isfinite(v.y_V) &&
           v.x_V >= c.x.min_V - 0.5 * g.dx_V && v.x_V <= c.x.max_V + 0.5 * g.dx_V &&
           v.y_V >= c.y.min_V - 0.5 * g.dy_V && v.y_V <= c.y.max_V + 0.5 * g.dy_V;
}

constexpr int kFitParams = 5; // baseline, amplitude, x0, y0, sigma
using FitVector = std::array<double, kFitParams>;
using FitMatrix = std::array<FitVector, kFitParams>;

// Gaussian elimination with partial pivoting. Returns false for a singular system.
bool solveLinear(FitMatrix a, FitVector b, FitVector& x) {
    for (int col = 0; col < kFitParams; ++col) {
        int pivot = col;
        for (int row = col + 1; row < kFitParams; ++row) {
            if (std::fabs(a[row][col]) > std::fabs(a[pivot][col])) pivot = row;
        }
        if (!(std::fabs(a[pivot][col]) > 1e-300)) return false;
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);
        for (int row = col + 1; row < kFitParams; ++row) {
            const double f = a[row][col] / a[col][col];
            for (int k = col; k < kFitParams; ++k) a[row][k] -= f * a[col][k];
            b[row] -= f * b[col];
        }
    }
    for (int row = kFitParams - 1; row >= 0; --row) {
        double sum = b[row];
        for (int k = row + 1; k < kFitParams; ++k) sum -= a[row][k] * x[k];
        x[row] = sum / a[row][row];
    }
    return true;
}

FitVector toParams(const GaussianFit& f) {
    return FitVector{f.baseline_mW, f.amplitude_mW, f.center.x_V, f.center.y_V, f.sigma_V};
}

GaussianFit fromParams(const FitVector& p) {
    GaussianFit f;
    f.baseline_mW = p[0];
    f.amplitude_mW = p[1];
    f.center = VoltagePair{p[2], p[3]};
    f.sigma_V = p[4];
    return f;
}

double sumSquares(const ScanRecord& record, const GaussianFit& f) {
    double ss = 0.0;
    for (const auto& s : record.samples()) {
        const double d = s.power_mW - f.evaluate(s.v);
        ss += d * d;
    }
    return ss;
}

} // namespace

double GaussianFit::evaluate(const VoltagePair& v) const {
    const double dx = v.x_V - center.x_V;
    const double dy = v.y_V - center.y_V;
    return baseline_mW + amplitude_mW * std::exp(-(dx * dx + dy * dy) / (2.0 * sigma_V * sigma_V));
}

GaussianFit fitGaussian(const ScanRecord& record, const GaussianFit& guess, int max_iterations) {
    constexpr double kLambdaMax = 1e12;
    constexpr double kRelTolerance = 1e-12;

    FitVector p = toParams(guess);
    GaussianFit best = fromParams(p);
    double cost = sumSquares(record, best);
    double lambda = 1e-3;
    int it = 0;
    bool settled = false;

    for (; it < max_iterations && !settled; ++it) {
        // Normal equations J^T J and J^T r for the current parameters.
        FitMatrix jtj{};
        FitVector jtr{};
        for (const auto& s : record.samples()) {
            const double dx = s.v.x_V - p[2];
            const double dy = s.v.y_V - p[3];
            const double r2 = dx * dx + dy * dy;
            const double s2 = p[4] * p[4];
            const double e = std::exp(-r2 / (2.0 * s2));
            const double ae = p[1] * e;
            const FitVector j{1.0, e, ae * dx / s2, ae * dy / s2, ae * r2 / (s2 * p[4])};
            const double res = s.power_mW - (p[0] + ae);
            for (int a = 0; a < kFitParams; ++a) {
                jtr[a] += j[a] * res;
                for (int b = 0; b < kFitParams; ++b) jtj[a][b] += j[a] * j[b];
            }
        }

        // Marquardt damping: retry with larger lambda until the cost drops.
        bool improved = false;
        while (!improved && lambda < kLambdaMax) {
            FitMatrix damped = jtj;
            for (int a = 0; a < kFitParams; ++a) damped[a][a] += lambda * std::max(jtj[a][a], 1e-300);
            FitVector step{};
            if (!solveLinear(damped, jtr, step)) {
                lambda *= 10.0;
                continue;
            }
            FitVector trial = p;
            for (int a = 0; a < kFitParams; ++a) trial[a] += step[a];
            trial[4] = std::fabs(trial[4]);

            const GaussianFit candidate = fromParams(trial);
            const double trial_cost = sumSquares(record, candidate);
            if (std::isfinite(trial_cost) && trial_cost < cost && trial[4] > 0.0) {
                settled = (cost - trial_cost) <= kRelTolerance * cost;
                p = trial;
                best = candidate;
                cost = trial_cost;
                lambda = std::max(lambda * 0.1, 1e-12);
                improved = true;
            } else {
                lambda *= 10.0;
            }
        }
        if (!improved) {
            settled = true; // no descent direction left: at a minimum
        }
    }

    best.iterations = it;
    best.rms_residual_mW = std::sqrt(cost / static_cast<double>(std::max<std::size_t>(record.size(), 1)));
    best.converged = settled && std::isfinite(cost) && best.amplitude_mW > 0.0 && best.sigma_V > 0.0 &&
                     std::isfinite(best.center.x_V) && std::isfinite(best.center.y_V);
    return best;
}

// --------------------
// Surface stages
// --------------------

GridSurface reconstructSurface(const ScanRecord& record, const AnalyzerConfig& cfg) {
    if (record.empty()) {
        throw EmptyScanError("cannot reconstruct a surface from an empty scan");
    }
    const ScanConfig& c = record.config();

    GridSurface g;
    g.nx = c.x_steps + 1;
    g.ny = c.y_steps + 1;
    g.x0_V = c.x.min_V;
    g.y0_V = c.y.min_V;
    g.dx_V = c.xStep_V();
    g.dy_V = c.yStep_V();
    g.power_mW.assign(static_cast<std::size_t>(g.nx) * static_cast<std::size_t>(g.ny), 0.0);
    g.hits.assign(g.power_mW.size(), 0);

    // Bin every sample to its nearest node; repeated bins average.
    std::vector<StepPos> pos;
    pos.reserve(record.size());
    for (const auto& s : record.samples()) {
        const StepPos p = toSteps(g, s.v);
        pos.push_back(p);
        const int i = std::clamp(static_cast<int>(std::lround(p.u)), 0, g.nx - 1);
        const int j = std::clamp(static_cast<int>(std::lround(p.w)), 0, g.ny - 1);
        const std::size_t k = g.index(i, j);
        g.power_mW[k] += s.power_mW;
        g.hits[k] += 1;
    }

    const auto& samples = record.samples();
    const double r2 = cfg.interpolation_radius_steps * cfg.interpolation_radius_steps;
    for (int j = 0; j < g.ny; ++j) {
        for (int i = 0; i < g.nx; ++i) {
            const std::size_t k = g.index(i, j);
            if (g.hits[k] > 0) {
                g.power_mW[k] /= static_cast<double>(g.hits[k]);
                continue;
            }

            std::size_t nearest = 0;
            double nearest_d2 = std::numeric_limits<double>::infinity();
            double sw = 0.0;
            double swp = 0.0;
            for (std::size_t n = 0; n < samples.size(); ++n) {
                const double du = pos[n].u - static_cast<double>(i);
                const double dw = pos[n].w - static_cast<double>(j);
                const double d2 = du * du + dw * dw;
                if (d2 < nearest_d2) {
                    nearest_d2 = d2;
                    nearest = n;
                }
                if (cfg.interpolation == Interpolation::LocalWeighted && d2 <= r2 && d2 > 0.0) {
                    sw += 1.0 / d2;
                    swp += samples[n].power_mW / d2;
                }
            }
            g.power_mW[k] = (sw > 0.0) ? (swp / sw) : samples[nearest].power_mW;
        }
    }
    return g;
}

GridSurface smoothSurface(const GridSurface& grid, double radius_steps) {
    if (!(radius_steps > 0.0)) {
        return grid;
    }
    const int reach = static_cast<int>(std::floor(radius_steps));
    const double sigma = 0.5 * radius_steps;
    const double inv_two_sigma2 = 1.0 / (2.0 * sigma * sigma);
    const double r2 = radius_steps * radius_steps;

    GridSurface out = grid;
    for (int j = 0; j < grid.ny; ++j) {
        for (int i = 0; i < grid.nx; ++i) {
            double sw = 0.0;
            double swp = 0.0;
            for (int dj = -reach; dj <= reach; ++dj) {
                for (int di = -reach; di <= reach; ++di) {
                    const int a = i + di;
                    const int b = j + dj;
                    if (a < 0 || b < 0 || a >= grid.nx || b >= grid.ny) continue;
                    const double d2 = static_cast<double>(di * di + dj * dj);
                    if (d2 > r2) continue;
                    const double w = std::exp(-d2 * inv_two_sigma2);
                    sw += w;
                    swp += w * grid.at(a, b);
                }
            }
            out.power_mW[out.index(i, j)] = swp / sw;
        }
    }
    return out;
}

// --------------------
// ScanAnalyzer
// --------------------

void ScanAnalyzer::validate(const AnalyzerConfig& cfg) {
    if (!std::isfinite(cfg.smoothing_radius_steps) || cfg.smoothing_radius_steps < 0.0) {
        throw InvalidConfigError("smoothing_radius_steps must be set to a finite value >= 0");
    }
    if (!std::isfinite(cfg.min_confidence) || cfg.min_confidence < 0.0) {
        throw InvalidConfigError("min_confidence must be set to a finite value >= 0");
    }
    if (!std::isfinite(cfg.interpolation_radius_steps) || cfg.interpolation_radius_steps <= 0.0) {
        throw InvalidConfigError("interpolation_radius_steps must be > 0");
    }
    if (!(cfg.centroid_threshold_0_1 >= 0.0 && cfg.centroid_threshold_0_1 < 1.0)) {
        throw InvalidConfigError("centroid_threshold_0_1 must lie in [0, 1)");
    }
    if (cfg.fit_max_iterations < 1) {
        throw InvalidConfigError("fit_max_iterations must be >= 1");
    }
    if (!(cfg.lobe_tie_tolerance_0_1 >= 0.0 && cfg.lobe_tie_tolerance_0_1 < 1.0)) {
        throw InvalidConfigError("lobe_tie_tolerance_0_1 must lie in [0, 1)");
    }
    if (!std::isfinite(cfg.lobe_min_separation_steps) || cfg.lobe_min_separation_steps < 0.0) {
        throw InvalidConfigError("lobe_min_separation_steps must be >= 0");
    }
    if (!std::isfinite(cfg.noise_exclusion_radius_steps) || cfg.noise_exclusion_radius_steps < 0.0) {
        throw InvalidConfigError("noise_exclusion_radius_steps must be >= 0");
    }
    if (!std::isfinite(cfg.partial_noise_inflation) || cfg.partial_noise_inflation < 1.0) {
        throw InvalidConfigError("partial_noise_inflation must be >= 1");
    }
    if (!std::isfinite(cfg.sensor_resolution_mW) || cfg.sensor_resolution_mW <= 0.0) {
        throw InvalidConfigError("sensor_resolution_mW must be > 0");
    }
}

ScanAnalyzer::ScanAnalyzer(const AnalyzerConfig& cfg) : cfg_(cfg) {
    validate(cfg_);
}

AlignmentResult ScanAnalyzer::analyze(const ScanRecord& record) const {
    return analyzeDetailed(record).result;
}

ScanAnalysis ScanAnalyzer::analyzeDetailed(const ScanRecord& record) const {
    if (record.empty()) {
        throw EmptyScanError("scan record holds no samples");
    }
    if (!record.isSealed()) {
        throw RecordNotSealedError("scan record must be sealed before analysis");
    }

    ScanAnalysis a;
    AlignmentResult& r = a.result;
    r.samples_used = record.size();
    if (record.isPartial()) {
        r.flags |= Result_PartialScan;
    }

    a.raw = reconstructSurface(record, cfg_);
    a.smoothed = smoothSurface(a.raw, cfg_.smoothing_radius_steps);

    if (record.size() == 1) {
        const Sample& s = record.samples().front();
        r.voltage = s.v;
        r.power_mW = s.power_mW;
        r.noise_floor_mW = s.power_mW;
        r.noise_sigma_mW = cfg_.sensor_resolution_mW;
        r.confidence = 0.0;
        r.flags |= Result_SingleSample | Result_LowConfidence;
        a.lobe_peaks.push_back(s.v);
        return a;
    }

    const GridSurface& g = a.smoothed;
    const NodeIndex peak = argmaxNode(g);
    const double peak_mW = g.at(peak.i, peak.j);
    const VoltagePair peak_v = g.node(peak.i, peak.j);

    const NoiseEstimate noise = estimateNoise(record, g, peak_v, cfg_);
    const double contrast = peak_mW - noise.floor_mW;

    r.voltage = peak_v;
    r.power_mW = peak_mW;
    r.noise_floor_mW = noise.floor_mW;
    r.noise_sigma_mW = noise.sigma_mW;
    r.confidence = (contrast > 0.0) ? (contrast / noise.sigma_mW) : 0.0;
    if (contrast <= noise.sigma_mW) {
        r.flags |= Result_NoSignal | Result_LowConfidence;
    }

    if (contrast > 0.0) {
        // Competing lobes: near-peak regions away from the primary one.
        std::vector<int> labels;
        const double tie_level = noise.floor_mW + (1.0 - cfg_.lobe_tie_tolerance_0_1) * contrast;
        const int regions = labelRegions(g, tie_level, labels);
        const int primary = labels[g.index(peak.i, peak.j)];

        std::vector<NodeIndex> best(static_cast<std::size_t>(regions), NodeIndex{-1, -1});
        for (int j = 0; j < g.ny; ++j) {
            for (int i = 0; i < g.nx; ++i) {
                const int l = labels[g.index(i, j)];
                if (l < 0) continue;
                NodeIndex& b = best[static_cast<std::size_t>(l)];
                if (b.i < 0 || g.at(i, j) > g.at(b.i, b.j)) {
                    b = NodeIndex{i, j};
                }
            }
        }

        r.lobe_count = 1;
        a.lobe_peaks.push_back(peak_v);
        const double sep2 = cfg_.lobe_min_separation_steps * cfg_.lobe_min_separation_steps;
        for (int l = 0; l < regions; ++l) {
            if (l == primary) continue;
            const NodeIndex& b = best[static_cast<std::size_t>(l)];
            const double di = static_cast<double>(b.i - peak.i);
            const double dj = static_cast<double>(b.j - peak.j);
            if (di * di + dj * dj < sep2) continue;
            ++r.lobe_count;
            a.lobe_peaks.push_back(g.node(b.i, b.j));
        }
        if (r.lobe_count > 1) {
            r.flags |= Result_MultiLobe;
            r.confidence /= static_cast<double>(r.lobe_count);
        }

        if (peak.i == 0 || peak.j == 0 || peak.i == g.nx - 1 || peak.j == g.ny - 1) {
            r.flags |= Result_PeakOnEdge;
        }

        if (cfg_.policy == PeakPolicy::Centroid) {
            const double level = noise.floor_mW + cfg_.centroid_threshold_0_1 * contrast;
            VoltagePair c{};
            if (regionCentroid(g, peak, noise.floor_mW, level, c)) {
                r.voltage = c;
            } else {
                r.flags |= Result_CentroidFallback;
            }
        } else if (cfg_.policy == PeakPolicy::ModelFit) {
            GaussianFit guess;
            guess.center = peak_v;
            guess.baseline_mW = noise.floor_mW;
            guess.amplitude_mW = contrast;
            guess.sigma_V = halfMaxSigma(g, noise.floor_mW + 0.5 * contrast);
            a.fit = fitGaussian(record, guess, cfg_.fit_max_iterations);
            if (a.fit.converged && insideWindow(record.config(), g, a.fit.center)) {
                r.voltage = a.fit.center;
            } else {
                r.flags |= Result_FitFallback;
            }
        }
    }

    if (r.confidence < cfg_.min_confidence || r.hasFlag(Result_MultiLobe)) {
        r.flags |= Result_LowConfidence;
    }
    return a;
}

bool operator==(const AlignmentResult& a, const AlignmentResult& b) {
    return a.voltage == b.voltage &&
           a.confidence == b.confidence &&
           a.power_mW == b.power_mW &&
           a.noise_floor_mW == b.noise_floor_mW &&
           a.noise_sigma_mW == b.noise_sigma_mW &&
           a.lobe_count == b.lobe_count &&
           a.flags == b.flags &&
           a.samples_used == b.samples_used;
}

std::string describeFlags(std::uint32_t flags) {
    static const struct {
        ResultFlagBits bit;
        const char* name;
    } kNames[] = {
        {Result_LowConfidence, "LowConfidence"},
        {Result_MultiLobe, "MultiLobe"},
        {Result_NoSignal, "NoSignal"},
        {Result_PartialScan, "PartialScan"},
        {Result_SingleSample, "SingleSample"},
        {Result_PeakOnEdge, "PeakOnEdge"},
        {Result_CentroidFallback, "CentroidFallback"},
        {Result_FitFallback, "FitFallback"},
    };

    std::string out;
    for (const auto& n : kNames) {
        if ((flags & n.bit) == 0u) continue;
        if (!out.empty()) out += '|';
        out += n.name;
    }
    return out.empty() ? std::string("None") : out;
}

} // namespace tipalign
