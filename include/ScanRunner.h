#pragma once

#include "ScanRecord.h"

#include <iosfwd>

namespace tipalign {

class MirrorDevice;
class VoltageSchedule;

// Drives one scan: every scheduled pair goes through the device and the returned
// sample is recorded. The record comes back sealed.
//
// A HardwareFaultError ends the scan early; the record is marked partial with the
// fault message and still returned. Validation errors from the record propagate.
ScanRecord runScan(MirrorDevice& device,
                   VoltageSchedule& schedule,
                   const ScanConfig& config,
                   std::ostream* log = nullptr);

} // namespace tipalign
