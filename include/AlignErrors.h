#pragma once

#include <exception>
#include <string>

namespace tipalign {

enum class ErrorCode : int {
    None = 0,
    InvalidRange,
    InfeasibleResolution,
    OutOfRange,
    DuplicateSample,
    SealedRecord,
    RecordNotSealed,
    EmptyScan,
    HardwareFault,
    InvalidConfig,
    ScanFile,
};

const char* errorCodeName(ErrorCode code);

// Base of every error raised by the alignment core.
class AlignError : public std::exception {
public:
    AlignError(const std::string& msg, ErrorCode code) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }

private:
    std::string message_;
    ErrorCode code_;
};

// ---- Configuration errors (raised before any hardware interaction) ----

class InvalidRangeError : public AlignError {
public:
    explicit InvalidRangeError(const std::string& msg) : AlignError(msg, ErrorCode::InvalidRange) {}
};

class InfeasibleResolutionError : public AlignError {
public:
    explicit InfeasibleResolutionError(const std::string& msg)
        : AlignError(msg, ErrorCode::InfeasibleResolution) {}
};

class InvalidConfigError : public AlignError {
public:
    explicit InvalidConfigError(const std::string& msg) : AlignError(msg, ErrorCode::InvalidConfig) {}
};

// ---- Data-integrity errors (raised at ingestion) ----

class OutOfRangeError : public AlignError {
public:
    explicit OutOfRangeError(const std::string& msg) : AlignError(msg, ErrorCode::OutOfRange) {}
};

class DuplicateSampleError : public AlignError {
public:
    explicit DuplicateSampleError(const std::string& msg)
        : AlignError(msg, ErrorCode::DuplicateSample) {}
};

class SealedRecordError : public AlignError {
public:
    explicit SealedRecordError(const std::string& msg) : AlignError(msg, ErrorCode::SealedRecord) {}
};

// ---- Analysis / acquisition errors ----

class RecordNotSealedError : public AlignError {
public:
    explicit RecordNotSealedError(const std::string& msg)
        : AlignError(msg, ErrorCode::RecordNotSealed) {}
};

class EmptyScanError : public AlignError {
public:
    explicit EmptyScanError(const std::string& msg) : AlignError(msg, ErrorCode::EmptyScan) {}
};

class HardwareFaultError : public AlignError {
public:
    explicit HardwareFaultError(const std::string& msg) : AlignError(msg, ErrorCode::HardwareFault) {}
};

class ScanFileError : public AlignError {
public:
    explicit ScanFileError(const std::string& msg) : AlignError(msg, ErrorCode::ScanFile) {}
};

} // namespace tipalign
