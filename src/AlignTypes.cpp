#include "AlignTypes.h"
#include "AlignErrors.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace tipalign {

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}
} // namespace

const char* orderingName(ScheduleOrdering o) {
    switch (o) {
        case ScheduleOrdering::Raster:       return "raster";
        case ScheduleOrdering::Serpentine:   return "serpentine";
        case ScheduleOrdering::Shuffled:     return "shuffled";
        case ScheduleOrdering::SpaceFilling: return "space-filling";
    }
    return "unknown";
}

bool parseOrdering(const char* name, ScheduleOrdering* out) {
    if (!name || !out) return false;
    const std::string n = toLower(name);
    if (n == "raster") {
        *out = ScheduleOrdering::Raster;
    } else if (n == "serpentine") {
        *out = ScheduleOrdering::Serpentine;
    } else if (n == "shuffled" || n == "shuffle") {
        *out = ScheduleOrdering::Shuffled;
    } else if (n == "space-filling" || n == "hilbert") {
        *out = ScheduleOrdering::SpaceFilling;
    } else {
        return false;
    }
    return true;
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::InvalidRange:         return "InvalidRange";
        case ErrorCode::InfeasibleResolution: return "InfeasibleResolution";
        case ErrorCode::OutOfRange:           return "OutOfRange";
        case ErrorCode::DuplicateSample:      return "DuplicateSample";
        case ErrorCode::SealedRecord:         return "SealedRecord";
        case ErrorCode::RecordNotSealed:      return "RecordNotSealed";
        case ErrorCode::EmptyScan:            return "EmptyScan";
        case ErrorCode::HardwareFault:        return "HardwareFault";
        case ErrorCode::InvalidConfig:        return "InvalidConfig";
        case ErrorCode::ScanFile:             return "ScanFile";
    }
    return "Unknown";
}

} // namespace tipalign
