#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "AlignErrors.h"
#include "ScanFile.h"
#include "ScanRecord.h"
#include "ScanRunner.h"
#include "SimulatedMirror.h"
#include "VoltageSchedule.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

template <typename E, typename Fn>
static bool throwsAs(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  unexpected exception: " << e.what() << "\n";
        return false;
    }
    return false;
}

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

static std::vector<tipalign::VoltagePair> drain(tipalign::VoltageSchedule& s) {
    std::vector<tipalign::VoltagePair> out;
    tipalign::VoltagePair v;
    while (s.next(v)) {
        out.push_back(v);
    }
    return out;
}

static tipalign::ScheduleConfig unitSquare(int steps, tipalign::ScheduleOrdering order) {
    tipalign::ScheduleConfig cfg;
    cfg.x = {0.0, 1.0};
    cfg.y = {0.0, 1.0};
    cfg.x_steps = steps;
    cfg.y_steps = steps;
    cfg.ordering = order;
    return cfg;
}

static void requireDistinctAndBounded(const std::vector<tipalign::VoltagePair>& pairs,
                                      const tipalign::ScheduleConfig& cfg,
                                      const char* context) {
    std::set<tipalign::VoltagePair> seen;
    for (const auto& v : pairs) {
        REQUIRE(v.x_V >= cfg.x.min_V && v.x_V <= cfg.x.max_V, context << ": x outside range");
        REQUIRE(v.y_V >= cfg.y.min_V && v.y_V <= cfg.y.max_V, context << ": y outside range");
        REQUIRE(seen.insert(v).second, context << ": repeated pair (" << v.x_V << ", " << v.y_V << ")");
    }
}

static tipalign::SimulatedMirror::Config gaussianMirror(double noise_mW) {
    tipalign::SimulatedMirror::Config m;
    m.noise_sigma_mW = noise_mW;
    m.lobes.push_back({tipalign::VoltagePair{0.4, 0.6}, 1.0, 0.15});
    return m;
}

/* =======================
 * Schedule generation
 * ======================= */

static void runRasterScheduleCoverage() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    const auto cfg = unitSquare(10, tipalign::ScheduleOrdering::Raster);
    tipalign::VoltageSchedule s = gen.generate(cfg);

    REQUIRE(s.size() == 121, "raster: expected 121 pairs, got " << s.size());
    const auto pairs = drain(s);
    REQUIRE(pairs.size() == 121, "raster: drained " << pairs.size());
    requireDistinctAndBounded(pairs, cfg, "raster");

    // Row-major, x fastest.
    REQUIRE(pairs[0].x_V == 0.0 && pairs[0].y_V == 0.0, "raster: first pair not at origin");
    REQUIRE(near(pairs[1].x_V, 0.1, 1e-12) && pairs[1].y_V == 0.0, "raster: second pair not one x step");
    REQUIRE(pairs[10].x_V == 1.0 && pairs[10].y_V == 0.0, "raster: row end not at x_max");
    REQUIRE(near(pairs[11].y_V, 0.1, 1e-12) && pairs[11].x_V == 0.0, "raster: second row start");
    REQUIRE(pairs[120].x_V == 1.0 && pairs[120].y_V == 1.0, "raster: last pair not at far corner");

    std::cout << "[PASS] raster schedule covers 11x11 grid once, row-major\n";
}

static void runEveryOrderingCoversSameGrid() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    const auto raster_cfg = unitSquare(10, tipalign::ScheduleOrdering::Raster);
    tipalign::VoltageSchedule raster = gen.generate(raster_cfg);
    const auto ref = drain(raster);
    const std::set<tipalign::VoltagePair> ref_set(ref.begin(), ref.end());

    const tipalign::ScheduleOrdering orders[] = {
        tipalign::ScheduleOrdering::Serpentine,
        tipalign::ScheduleOrdering::Shuffled,
        tipalign::ScheduleOrdering::SpaceFilling,
    };
    for (auto order : orders) {
        const auto cfg = unitSquare(10, order);
        tipalign::VoltageSchedule s = gen.generate(cfg);
        const auto pairs = drain(s);
        REQUIRE(pairs.size() == 121, tipalign::orderingName(order) << ": count " << pairs.size());
        requireDistinctAndBounded(pairs, cfg, tipalign::orderingName(order));
        const std::set<tipalign::VoltagePair> got(pairs.begin(), pairs.end());
        REQUIRE(got == ref_set, tipalign::orderingName(order) << ": node set differs from raster grid");
    }

    // Non-square, non power-of-two grid for the blocked Hilbert traversal.
    tipalign::ScheduleConfig wide = unitSquare(10, tipalign::ScheduleOrdering::SpaceFilling);
    wide.x = {-5.0, 5.0};
    wide.x_steps = 37;
    wide.y_steps = 4;
    tipalign::VoltageSchedule sw = gen.generate(wide);
    const auto wide_pairs = drain(sw);
    REQUIRE(wide_pairs.size() == 38u * 5u, "space-filling wide: count " << wide_pairs.size());
    requireDistinctAndBounded(wide_pairs, wide, "space-filling wide");

    std::cout << "[PASS] serpentine/shuffled/space-filling visit exactly the raster node set\n";
}

static void runSerpentineMatchesLabSweep() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    auto cfg = unitSquare(4, tipalign::ScheduleOrdering::Serpentine);
    tipalign::VoltageSchedule s = gen.generate(cfg);
    const auto p = drain(s);

    // Column 0 sweeps y upward, column 1 downward.
    for (int k = 0; k < 5; ++k) {
        REQUIRE(p[k].x_V == 0.0, "serpentine: column 0 x");
        REQUIRE(near(p[k].y_V, 0.25 * k, 1e-12), "serpentine: column 0 ascending y");
        REQUIRE(near(p[5 + k].x_V, 0.25, 1e-12), "serpentine: column 1 x");
        REQUIRE(near(p[5 + k].y_V, 1.0 - 0.25 * k, 1e-12), "serpentine: column 1 descending y");
    }
    // No fly-back: consecutive pairs are one grid step apart.
    for (std::size_t k = 1; k < p.size(); ++k) {
        const double d = std::fabs(p[k].x_V - p[k - 1].x_V) + std::fabs(p[k].y_V - p[k - 1].y_V);
        REQUIRE(near(d, 0.25, 1e-9), "serpentine: jump between consecutive pairs " << k);
    }
    std::cout << "[PASS] serpentine order sweeps columns up/down with unit steps\n";
}

static void runHilbertLocality() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    auto cfg = unitSquare(7, tipalign::ScheduleOrdering::SpaceFilling); // 8x8 nodes
    tipalign::VoltageSchedule s = gen.generate(cfg);
    const auto p = drain(s);
    REQUIRE(p.size() == 64, "hilbert: count");
    const double step = 1.0 / 7.0;
    for (std::size_t k = 1; k < p.size(); ++k) {
        const double d = std::fabs(p[k].x_V - p[k - 1].x_V) + std::fabs(p[k].y_V - p[k - 1].y_V);
        REQUIRE(near(d, step, 1e-9), "hilbert: consecutive pairs not adjacent at " << k);
    }
    std::cout << "[PASS] space-filling order moves one grid step at a time on a 8x8 grid\n";
}

static void runShuffledSeeding() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    auto cfg = unitSquare(10, tipalign::ScheduleOrdering::Shuffled);
    cfg.seeded = true;
    cfg.seed = 42u;

    tipalign::VoltageSchedule a = gen.generate(cfg);
    tipalign::VoltageSchedule b = gen.generate(cfg);
    const auto pa = drain(a);
    const auto pb = drain(b);
    REQUIRE(pa.size() == pb.size(), "shuffled: seeded sizes differ");
    bool same = true;
    for (std::size_t k = 0; k < pa.size(); ++k) same = same && (pa[k] == pb[k]);
    REQUIRE(same, "shuffled: same seed must reproduce the schedule");
    REQUIRE(a.seedUsed() == 42u, "shuffled: seedUsed");

    cfg.seed = 43u;
    tipalign::VoltageSchedule c = gen.generate(cfg);
    const auto pc = drain(c);
    bool differs = false;
    for (std::size_t k = 0; k < pa.size(); ++k) differs = differs || (pa[k] != pc[k]);
    REQUIRE(differs, "shuffled: different seeds gave identical schedules");

    // Unseeded: every generate() is a fresh permutation.
    cfg.seeded = false;
    tipalign::VoltageSchedule d = gen.generate(cfg);
    tipalign::VoltageSchedule e = gen.generate(cfg);
    const auto pd = drain(d);
    const auto pe = drain(e);
    bool fresh = false;
    for (std::size_t k = 0; k < pd.size(); ++k) fresh = fresh || (pd[k] != pe[k]);
    REQUIRE(fresh, "shuffled: unseeded schedules repeated the same permutation");

    tipalign::VoltageSchedule r = gen.generate(unitSquare(10, tipalign::ScheduleOrdering::Raster));
    const auto pr = drain(r);
    bool reordered = false;
    for (std::size_t k = 0; k < pr.size(); ++k) reordered = reordered || (pr[k] != pa[k]);
    REQUIRE(reordered, "shuffled: permutation equals raster order");

    std::cout << "[PASS] shuffled order: seed reproduces, unseeded is fresh per schedule\n";
}

static void runSampleCountMode() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    const int counts[] = {1, 7, 50, 121, 200};
    const tipalign::ScheduleOrdering orders[] = {
        tipalign::ScheduleOrdering::Raster,
        tipalign::ScheduleOrdering::Serpentine,
        tipalign::ScheduleOrdering::Shuffled,
        tipalign::ScheduleOrdering::SpaceFilling,
    };
    for (int n : counts) {
        for (auto order : orders) {
            auto cfg = unitSquare(10, order);
            cfg.x = {-2.0, 4.0};
            cfg.sample_count = n;
            tipalign::VoltageSchedule s = gen.generate(cfg);
            const auto pairs = drain(s);
            REQUIRE(pairs.size() == static_cast<std::size_t>(n),
                    "sample-count " << n << " " << tipalign::orderingName(order) << ": got " << pairs.size());
            requireDistinctAndBounded(pairs, cfg, "sample-count");
            REQUIRE((s.xSteps() + 1) * (s.ySteps() + 1) >= n, "sample-count: grid smaller than N");
        }
    }

    // The resolved grid travels into the scan configuration.
    auto cfg = unitSquare(10, tipalign::ScheduleOrdering::Raster);
    cfg.sample_count = 50;
    tipalign::VoltageSchedule s = gen.generate(cfg);
    const auto sc = tipalign::ScanConfig::fromSchedule(s, "2023-03-04T10:00:00");
    REQUIRE(sc.x_steps == s.xSteps() && sc.y_steps == s.ySteps(), "fromSchedule: grid steps");
    REQUIRE(sc.timestamp == "2023-03-04T10:00:00", "fromSchedule: timestamp");

    std::cout << "[PASS] sample-count mode emits exactly N distinct in-range pairs\n";
}

static void runRepeatsAndLaziness() {
    tipalign::ScheduleGenerator gen(tipalign::DeviceLimits{});
    auto cfg = unitSquare(10, tipalign::ScheduleOrdering::Raster);
    cfg.repeats_per_point = 3;
    tipalign::VoltageSchedule s = gen.generate(cfg);
    REQUIRE(s.size() == 363, "repeats: size " << s.size());

    tipalign::VoltagePair a, b, c;
    REQUIRE(s.next(a) && s.next(b) && s.next(c), "repeats: first triple");
    REQUIRE(a == b && b == c, "repeats: a pair is measured consecutively");
    REQUIRE(s.remaining() == 360, "repeats: remaining after three");

    const auto rest = drain(s);
    REQUIRE(rest.size() == 360, "repeats: drained remainder");
    REQUIRE(s.done(), "schedule: done after draining");
    tipalign::VoltagePair v;
    REQUIRE(!s.next(v), "schedule: exhausted schedule must not restart");

    std::map<tipalign::VoltagePair, int> visits;
    visits[a] += 3;
    for (const auto& p : rest) visits[p] += 1;
    REQUIRE(visits.size() == 121, "repeats: distinct pairs");
    for (const auto& kv : visits) REQUIRE(kv.second == 3, "repeats: each pair exactly three times");

    std::cout << "[PASS] repeats emit each pair consecutively; schedules are single-pass\n";
}

static void runScheduleErrors() {
    tipalign::DeviceLimits limits;
    limits.v_min_V = -10.0;
    limits.v_max_V = 10.0;
    limits.min_step_V = 0.01;
    tipalign::ScheduleGenerator gen(limits);

    auto cfg = unitSquare(10, tipalign::ScheduleOrdering::Raster);

    auto bad = cfg;
    bad.x = {1.0, 1.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { gen.generate(bad); }), "x min == max");
    bad = cfg;
    bad.y = {2.0, -2.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { gen.generate(bad); }), "y min > max");
    bad = cfg;
    bad.x = {std::nan(""), 1.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { gen.generate(bad); }), "NaN bound");
    bad = cfg;
    bad.y = {-20.0, 0.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { gen.generate(bad); }), "outside device window");

    bad = cfg;
    bad.x_steps = 0;
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { gen.generate(bad); }), "zero steps");
    bad = cfg;
    bad.x_steps = 1000; // 0.001 V step < 0.01 V device step
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { gen.generate(bad); }), "step below device minimum");
    bad = cfg;
    bad.sample_count = 20000; // needs ~0.007 V steps
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { gen.generate(bad); }), "N too dense");
    bad = cfg;
    bad.sample_count = -3;
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { gen.generate(bad); }), "negative N");
    bad = cfg;
    bad.repeats_per_point = 0;
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { gen.generate(bad); }), "zero repeats");

    // Fail fast: a generator built from a device never touches it while validating.
    tipalign::SimulatedMirror::Config mcfg;
    mcfg.limits = limits;
    tipalign::SimulatedMirror mirror(mcfg);
    tipalign::ScheduleGenerator from_device(mirror);
    bad = cfg;
    bad.x = {0.0, 50.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { from_device.validate(bad); }), "device-derived limits");
    REQUIRE(mirror.samplesTaken() == 0, "validation must not drive the mirror");

    std::cout << "[PASS] schedule configuration errors raised before any sample\n";
}

/* =======================
 * Scan record
 * ======================= */

static tipalign::ScanConfig unitScan(int repeats = 1) {
    tipalign::ScanConfig c;
    c.x = {0.0, 1.0};
    c.y = {0.0, 1.0};
    c.x_steps = 10;
    c.y_steps = 10;
    c.repeats_per_point = repeats;
    return c;
}

static void runRecordIngestionRules() {
    tipalign::ScanRecord rec(unitScan());
    rec.add({tipalign::VoltagePair{0.0, 0.0}, 1.5, 0.0});
    rec.add({tipalign::VoltagePair{1.0, 1.0}, 0.0, 5.0});
    REQUIRE(rec.size() == 2, "record: two samples");
    REQUIRE(rec.samples()[1].t_ms == 5.0, "record: submission order");

    REQUIRE(throwsAs<tipalign::OutOfRangeError>([&] {
        rec.add({tipalign::VoltagePair{1.2, 0.5}, 1.0, 0.0});
    }), "record: x outside range");
    REQUIRE(throwsAs<tipalign::OutOfRangeError>([&] {
        rec.add({tipalign::VoltagePair{0.5, -0.01}, 1.0, 0.0});
    }), "record: y outside range");
    REQUIRE(throwsAs<tipalign::OutOfRangeError>([&] {
        rec.add({tipalign::VoltagePair{0.5, 0.5}, -0.2, 0.0});
    }), "record: negative power");
    REQUIRE(throwsAs<tipalign::OutOfRangeError>([&] {
        rec.add({tipalign::VoltagePair{0.5, 0.5}, std::nan(""), 0.0});
    }), "record: NaN power");
    REQUIRE(throwsAs<tipalign::DuplicateSampleError>([&] {
        rec.add({tipalign::VoltagePair{0.0, 0.0}, 1.4, 10.0});
    }), "record: duplicate voltage pair");
    REQUIRE(rec.size() == 2, "record: rejected samples must not be stored");

    tipalign::ScanRecord avg(unitScan(2));
    avg.add({tipalign::VoltagePair{0.5, 0.5}, 1.0, 0.0});
    avg.add({tipalign::VoltagePair{0.5, 0.5}, 1.2, 1.0});
    REQUIRE(throwsAs<tipalign::DuplicateSampleError>([&] {
        avg.add({tipalign::VoltagePair{0.5, 0.5}, 1.1, 2.0});
    }), "record: third repeat with repeats_per_point = 2");

    rec.seal();
    REQUIRE(rec.isSealed(), "record: sealed");
    REQUIRE(throwsAs<tipalign::SealedRecordError>([&] {
        rec.add({tipalign::VoltagePair{0.5, 0.5}, 1.0, 0.0});
    }), "record: add after seal");
    REQUIRE(throwsAs<tipalign::SealedRecordError>([&] { rec.markPartial("late"); }),
            "record: markPartial after seal");

    tipalign::ScanConfig bad = unitScan();
    bad.x = {1.0, 0.0};
    REQUIRE(throwsAs<tipalign::InvalidRangeError>([&] { tipalign::ScanRecord r(bad); }), "record: bad range");
    bad = unitScan();
    bad.y_steps = 0;
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { tipalign::ScanRecord r(bad); }),
            "record: zero steps");
    bad = unitScan();
    bad.x_steps = 2147483647;
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { tipalign::ScanRecord r(bad); }),
            "record: grid beyond the node limit");
    bad = unitScan();
    bad.x_steps = 4095;
    bad.y_steps = 1023;
    tipalign::ScanRecord at_limit(bad);
    REQUIRE(at_limit.empty(), "record: grid exactly at the node limit");

    std::cout << "[PASS] scan record enforces range, power, distinctness and sealing\n";
}

/* =======================
 * Persistence
 * ======================= */

static void runScanFileRoundTrip() {
    tipalign::ScanConfig c = unitScan();
    c.ordering = tipalign::ScheduleOrdering::Shuffled;
    c.timestamp = "2023-03-04 14:02:11";
    c.label = "HighResScan X(-25,0) Y(-5,20)";

    tipalign::ScanRecord rec(c);
    rec.add({tipalign::VoltagePair{0.1 + 0.2, 1.0 / 3.0}, 5.812345678901234, 0.0});
    rec.add({tipalign::VoltagePair{0.7, 0.9}, 1e-9, 4.999999999});
    rec.add({tipalign::VoltagePair{1.0, 0.0}, 6.25, 10.0});
    rec.markPartial("sensor timeout\nat step 3");
    rec.seal();

    std::stringstream buf;
    tipalign::writeScanCSV(buf, rec);
    const tipalign::ScanRecord back = tipalign::readScanCSV(buf);

    REQUIRE(back.isSealed(), "round-trip: reloaded record must be sealed");
    REQUIRE(back.isPartial(), "round-trip: partial flag");
    REQUIRE(back.abortReason() == "sensor timeout at step 3", "round-trip: abort reason");
    REQUIRE(back.size() == rec.size(), "round-trip: sample count");
    for (std::size_t k = 0; k < rec.size(); ++k) {
        REQUIRE(back.samples()[k] == rec.samples()[k], "round-trip: sample " << k << " differs");
    }
    const auto& bc = back.config();
    REQUIRE(bc.x.min_V == c.x.min_V && bc.x.max_V == c.x.max_V, "round-trip: x range");
    REQUIRE(bc.y.min_V == c.y.min_V && bc.y.max_V == c.y.max_V, "round-trip: y range");
    REQUIRE(bc.x_steps == c.x_steps && bc.y_steps == c.y_steps, "round-trip: steps");
    REQUIRE(bc.ordering == c.ordering, "round-trip: ordering");
    REQUIRE(bc.timestamp == c.timestamp, "round-trip: timestamp");
    REQUIRE(bc.label == c.label, "round-trip: label");

    // Full simulated scan through a file on disk.
    tipalign::SimulatedMirror mirror(gaussianMirror(0.01));
    tipalign::ScheduleGenerator gen(mirror);
    tipalign::VoltageSchedule s = gen.generate(unitSquare(10, tipalign::ScheduleOrdering::Serpentine));
    const tipalign::ScanRecord scan = tipalign::runScan(mirror, s, tipalign::ScanConfig::fromSchedule(s));
    const std::string path = "tipalign_roundtrip_scan.csv";
    tipalign::writeScanFile(path, scan);
    const tipalign::ScanRecord reloaded = tipalign::readScanFile(path);
    std::remove(path.c_str());
    REQUIRE(reloaded.size() == scan.size(), "file round-trip: count");
    for (std::size_t k = 0; k < scan.size(); ++k) {
        REQUIRE(reloaded.samples()[k] == scan.samples()[k], "file round-trip: sample " << k);
    }
    REQUIRE(!reloaded.isPartial(), "file round-trip: complete scan reloaded as partial");

    std::cout << "[PASS] tabular scan format reproduces samples exactly\n";
}

static void runScanFileErrors() {
    std::stringstream no_tag("index,x_V,y_V,t_ms,power_mW\n0,0,0,0,1\n");
    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::readScanCSV(no_tag); }), "missing format tag");

    std::stringstream bad_number(
        "# tipalign-scan v1\n# x_min_V=0\n# x_max_V=1\n# y_min_V=0\n# y_max_V=1\n"
        "# x_steps=10\n# y_steps=10\n# ordering=raster\n"
        "index,x_V,y_V,t_ms,power_mW\n0,0.5,abc,0,1\n");
    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::readScanCSV(bad_number); }), "bad number");

    std::stringstream missing_key(
        "# tipalign-scan v1\n# x_min_V=0\n# x_max_V=1\nindex,x_V,y_V,t_ms,power_mW\n");
    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::readScanCSV(missing_key); }), "missing header key");

    std::stringstream out_of_range(
        "# tipalign-scan v1\n# x_min_V=0\n# x_max_V=1\n# y_min_V=0\n# y_max_V=1\n"
        "# x_steps=10\n# y_steps=10\n# ordering=raster\n"
        "index,x_V,y_V,t_ms,power_mW\n0,3.0,0.5,0,1\n");
    REQUIRE(throwsAs<tipalign::OutOfRangeError>([&] { tipalign::readScanCSV(out_of_range); }),
            "out-of-range row must be rejected at ingestion");

    std::stringstream huge_grid(
        "# tipalign-scan v1\n# x_min_V=0\n# x_max_V=1\n# y_min_V=0\n# y_max_V=1\n"
        "# x_steps=2147483647\n# y_steps=10\n# ordering=raster\n"
        "index,x_V,y_V,t_ms,power_mW\n0,0.5,0.5,0,1\n");
    REQUIRE(throwsAs<tipalign::InfeasibleResolutionError>([&] { tipalign::readScanCSV(huge_grid); }),
            "header grid beyond the node limit");

    std::stringstream int_overflow(
        "# tipalign-scan v1\n# x_min_V=0\n# x_max_V=1\n# y_min_V=0\n# y_max_V=1\n"
        "# x_steps=1e12\n# y_steps=10\n# ordering=raster\n"
        "index,x_V,y_V,t_ms,power_mW\n");
    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::readScanCSV(int_overflow); }),
            "step count outside int range");

    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::readScanFile("no/such/dir/scan.csv"); }),
            "missing file");
    tipalign::ScanRecord rec(unitScan());
    rec.seal();
    REQUIRE(throwsAs<tipalign::ScanFileError>([&] { tipalign::writeScanFile("no/such/dir/scan.csv", rec); }),
            "unwritable path");

    std::cout << "[PASS] scan file errors are reported, not ignored\n";
}

static void runLvmImport() {
    const std::string path = "tipalign_import_test.lvm";
    {
        std::ofstream f(path);
        REQUIRE(f.is_open(), "lvm: cannot create fixture");
        f << "LabVIEW Measurement\n";
        for (int k = 1; k < 22; ++k) f << "Header line " << k << "\n";
        f << "0\t-25.0\t0.0\t1000.0\t0.0058\t12.5\t-3.0\n";
        f << "1\t-25.0\t2.0\t1004.5\t0.0057\t12.0\t-3.5\n";
        f << "2\t-23.0\t2.0\t1009.0\t0.0041\t11.0\t-4.0\n";
        f << "\n";
    }

    tipalign::ScanConfig c;
    c.x = {-25.0, 10.0};
    c.y = {0.0, 30.0};
    c.x_steps = 35;
    c.y_steps = 30;
    const tipalign::ScanRecord rec = tipalign::readLvmScan(path, c);
    std::remove(path.c_str());

    REQUIRE(rec.isSealed(), "lvm: record sealed");
    REQUIRE(rec.size() == 3, "lvm: three rows, got " << rec.size());
    REQUIRE(near(rec.samples()[0].power_mW, 5.8, 1e-9), "lvm: W -> mW");
    REQUIRE(rec.samples()[0].t_ms == 0.0, "lvm: time relative to first row");
    REQUIRE(near(rec.samples()[2].t_ms, 9.0, 1e-9), "lvm: time offset");
    REQUIRE(rec.samples()[2].v.x_V == -23.0 && rec.samples()[2].v.y_V == 2.0, "lvm: voltages");

    std::cout << "[PASS] LabVIEW measurement files import with unit conversion\n";
}

/* =======================
 * Scan acquisition
 * ======================= */

static void runScanRunnerCompleteAndFault() {
    tipalign::SimulatedMirror mirror(gaussianMirror(0.0));
    tipalign::ScheduleGenerator gen(mirror);

    tipalign::VoltageSchedule s = gen.generate(unitSquare(10, tipalign::ScheduleOrdering::Raster));
    std::ostringstream log;
    const tipalign::ScanRecord full = tipalign::runScan(mirror, s, tipalign::ScanConfig::fromSchedule(s), &log);
    REQUIRE(full.isSealed() && !full.isPartial(), "runner: complete scan sealed, not partial");
    REQUIRE(full.size() == 121, "runner: 121 samples");
    REQUIRE(near(full.samples()[0].power_mW, mirror.truePower({0.0, 0.0}), 1e-12), "runner: noise-free power");
    REQUIRE(log.str().find("[scan] complete") != std::string::npos, "runner: completion logged");

    mirror.injectFaultAfter(50);
    tipalign::VoltageSchedule s2 = gen.generate(unitSquare(10, tipalign::ScheduleOrdering::Raster));
    std::ostringstream log2;
    const tipalign::ScanRecord part = tipalign::runScan(mirror, s2, tipalign::ScanConfig::fromSchedule(s2), &log2);
    REQUIRE(part.isSealed(), "runner: faulted scan still sealed");
    REQUIRE(part.isPartial(), "runner: faulted scan marked partial");
    REQUIRE(part.size() == 50, "runner: samples before the fault kept, got " << part.size());
    REQUIRE(!part.abortReason().empty(), "runner: fault reason recorded");
    REQUIRE(log2.str().find("hardware fault") != std::string::npos, "runner: fault logged");

    std::cout << "[PASS] scan runner seals complete scans and keeps partial ones on fault\n";
}

} // namespace

int main() {
    runRasterScheduleCoverage();
    runEveryOrderingCoversSameGrid();
    runSerpentineMatchesLabSweep();
    runHilbertLocality();
    runShuffledSeeding();
    runSampleCountMode();
    runRepeatsAndLaziness();
    runScheduleErrors();

    runRecordIngestionRules();

    runScanFileRoundTrip();
    runScanFileErrors();
    runLvmImport();

    runScanRunnerCompleteAndFault();
    return 0;
}
