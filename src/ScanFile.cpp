#include "ScanFile.h"

#include "AlignErrors.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <vector>

namespace tipalign {

namespace {

constexpr const char* kFormatTag = "# tipalign-scan v1";
constexpr const char* kColumnHeader = "index,x_V,y_V,t_ms,power_mW";

std::string oneLine(std::string s) {
    for (char& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

void stripCR(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

double parseDouble(const std::string& text, const char* what, int line_no) {
    const char* begin = text.c_str();
    char* end = nullptr;
    const double v = std::strtod(begin, &end);
    while (end && (*end == ' ' || *end == '\t')) ++end;
    if (end == begin || (end && *end != '\0')) {
        std::ostringstream os;
        os << "line " << line_no << ": cannot parse " << what << " from '" << text << "'";
        throw ScanFileError(os.str());
    }
    return v;
}

int parseInt(const std::string& text, const char* what, int line_no) {
    const double v = parseDouble(text, what, line_no);
    if (!std::isfinite(v) || v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        std::ostringstream os;
        os << "line " << line_no << ": " << what << " '" << text << "' is out of range";
        throw ScanFileError(os.str());
    }
    if (v != static_cast<double>(static_cast<int>(v))) {
        std::ostringstream os;
        os << "line " << line_no << ": " << what << " must be an integer";
        throw ScanFileError(os.str());
    }
    return static_cast<int>(v);
}

std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> out;
    std::string field;
    std::istringstream is(line);
    while (std::getline(is, field, sep)) {
        out.push_back(field);
    }
    return out;
}

const std::string& requireKey(const std::map<std::string, std::string>& kv, const char* key) {
    auto it = kv.find(key);
    if (it == kv.end()) {
        throw ScanFileError(std::string("scan header is missing '") + key + "'");
    }
    return it->second;
}

ScanConfig configFromHeader(const std::map<std::string, std::string>& kv) {
    ScanConfig c;
    c.x.min_V = parseDouble(requireKey(kv, "x_min_V"), "x_min_V", 0);
    c.x.max_V = parseDouble(requireKey(kv, "x_max_V"), "x_max_V", 0);
    c.y.min_V = parseDouble(requireKey(kv, "y_min_V"), "y_min_V", 0);
    c.y.max_V = parseDouble(requireKey(kv, "y_max_V"), "y_max_V", 0);
    c.x_steps = parseInt(requireKey(kv, "x_steps"), "x_steps", 0);
    c.y_steps = parseInt(requireKey(kv, "y_steps"), "y_steps", 0);
    if (!parseOrdering(requireKey(kv, "ordering").c_str(), &c.ordering)) {
        throw ScanFileError("scan header has an unknown ordering '" + kv.at("ordering") + "'");
    }
    auto rep = kv.find("repeats");
    if (rep != kv.end()) {
        c.repeats_per_point = parseInt(rep->second, "repeats", 0);
    }
    auto ts = kv.find("timestamp");
    if (ts != kv.end()) c.timestamp = ts->second;
    auto label = kv.find("label");
    if (label != kv.end()) c.label = label->second;
    return c;
}

} // namespace

void writeScanCSV(std::ostream& out, const ScanRecord& record) {
    const ScanConfig& c = record.config();
    out << std::setprecision(std::numeric_limits<double>::max_digits10);

    out << kFormatTag << '\n';
    out << "# x_min_V=" << c.x.min_V << '\n';
    out << "# x_max_V=" << c.x.max_V << '\n';
    out << "# y_min_V=" << c.y.min_V << '\n';
    out << "# y_max_V=" << c.y.max_V << '\n';
    out << "# x_steps=" << c.x_steps << '\n';
    out << "# y_steps=" << c.y_steps << '\n';
    out << "# ordering=" << orderingName(c.ordering) << '\n';
    out << "# repeats=" << c.repeats_per_point << '\n';
    out << "# timestamp=" << oneLine(c.timestamp) << '\n';
    out << "# label=" << oneLine(c.label) << '\n';
    out << "# partial=" << (record.isPartial() ? 1 : 0) << '\n';
    out << "# abort_reason=" << oneLine(record.abortReason()) << '\n';
    out << kColumnHeader << '\n';

    std::size_t index = 0;
    for (const auto& s : record.samples()) {
        out << index++ << ','
            << s.v.x_V << ','
            << s.v.y_V << ','
            << s.t_ms << ','
            << s.power_mW << '\n';
    }
    if (!out) {
        throw ScanFileError("failed writing scan data");
    }
}

void writeScanFile(const std::string& path, const ScanRecord& record) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ScanFileError("cannot open '" + path + "' for writing");
    }
    writeScanCSV(out, record);
}

ScanRecord readScanCSV(std::istream& in) {
    std::map<std::string, std::string> header;
    std::unique_ptr<ScanRecord> record;
    std::string line;
    int line_no = 0;
    bool tagged = false;

    while (std::getline(in, line)) {
        ++line_no;
        stripCR(line);
        if (line.empty()) continue;

        if (!tagged) {
            if (line != kFormatTag) {
                throw ScanFileError("not a tipalign scan file (missing '" + std::string(kFormatTag) + "')");
            }
            tagged = true;
            continue;
        }

        if (!record) {
            if (line[0] == '#') {
                const std::string body = line.substr(1);
                const auto eq = body.find('=');
                if (eq == std::string::npos) continue;
                std::string key = body.substr(0, eq);
                while (!key.empty() && key.front() == ' ') key.erase(key.begin());
                header[key] = body.substr(eq + 1);
                continue;
            }
            if (line != kColumnHeader) {
                std::ostringstream os;
                os << "line " << line_no << ": expected column header '" << kColumnHeader << "'";
                throw ScanFileError(os.str());
            }
            record.reset(new ScanRecord(configFromHeader(header)));
            continue;
        }

        const auto fields = split(line, ',');
        if (fields.size() != 5) {
            std::ostringstream os;
            os << "line " << line_no << ": expected 5 fields, found " << fields.size();
            throw ScanFileError(os.str());
        }
        Sample s;
        s.v.x_V = parseDouble(fields[1], "x_V", line_no);
        s.v.y_V = parseDouble(fields[2], "y_V", line_no);
        s.t_ms = parseDouble(fields[3], "t_ms", line_no);
        s.power_mW = parseDouble(fields[4], "power_mW", line_no);
        record->add(s);
    }

    if (!record) {
        throw ScanFileError("scan file ended before the sample table");
    }
    auto partial = header.find("partial");
    if (partial != header.end() && partial->second == "1") {
        auto reason = header.find("abort_reason");
        record->markPartial(reason != header.end() ? reason->second : std::string());
    }
    record->seal();
    return *record;
}

ScanRecord readScanFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ScanFileError("cannot open '" + path + "'");
    }
    return readScanCSV(in);
}

ScanRecord readLvmScan(const std::string& path, const ScanConfig& config, int header_rows) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ScanFileError("cannot open '" + path + "'");
    }

    ScanRecord record(config);
    std::string line;
    int line_no = 0;
    bool have_t0 = false;
    double t0 = 0.0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line_no <= header_rows) continue;
        stripCR(line);

        std::istringstream is(line);
        std::vector<double> cols;
        std::string tok;
        while (is >> tok) {
            cols.push_back(parseDouble(tok, "lvm column", line_no));
        }
        if (cols.empty()) continue;
        if (cols.size() < 5) {
            std::ostringstream os;
            os << "line " << line_no << ": expected at least 5 columns, found " << cols.size();
            throw ScanFileError(os.str());
        }

        if (!have_t0) {
            t0 = cols[3];
            have_t0 = true;
        }
        Sample s;
        s.v.x_V = cols[1];
        s.v.y_V = cols[2];
        s.t_ms = cols[3] - t0;
        s.power_mW = cols[4] * 1.0e3;
        record.add(s);
    }

    record.seal();
    return record;
}

void writeGridCSV(std::ostream& out, const GridSurface& grid) {
    out << "x_V,y_V,power_mW,hits\n";
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (int j = 0; j < grid.ny; ++j) {
        for (int i = 0; i < grid.nx; ++i) {
            const VoltagePair v = grid.node(i, j);
            out << v.x_V << ',' << v.y_V << ',' << grid.at(i, j) << ','
                << grid.hits[grid.index(i, j)] << '\n';
        }
    }
    if (!out) {
        throw ScanFileError("failed writing grid data");
    }
}

} // namespace tipalign
