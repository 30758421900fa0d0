#pragma once

#include "GridSurface.h"
#include "ScanRecord.h"

#include <iosfwd>
#include <string>

namespace tipalign {

// Scan persistence: "# key=value" header lines carrying the ScanConfig and the
// partial flag, then index,x_V,y_V,t_ms,power_mW rows. Values are written with
// max_digits10 so a reload reproduces the samples exactly.
//
// All functions throw ScanFileError on I/O or parse failures; sample validation
// errors (OutOfRangeError, DuplicateSampleError) propagate from ScanRecord::add.

void writeScanCSV(std::ostream& out, const ScanRecord& record);
void writeScanFile(const std::string& path, const ScanRecord& record);

// Returns a sealed record.
ScanRecord readScanCSV(std::istream& in);
ScanRecord readScanFile(const std::string& path);

// LabVIEW measurement file from the acquisition VI. Columns: index, Vx, Vy,
// time, power (W), beam X, beam Y. Power becomes mW and time is made relative
// to the first row. Returns a sealed record.
ScanRecord readLvmScan(const std::string& path, const ScanConfig& config, int header_rows = 22);

// Grid export for plotting: x_V,y_V,power_mW,hits rows.
void writeGridCSV(std::ostream& out, const GridSurface& grid);

} // namespace tipalign
