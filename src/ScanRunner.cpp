#include "ScanRunner.h"

#include "AlignErrors.h"
#include "MirrorDevice.h"
#include "VoltageSchedule.h"

#include <ostream>

namespace tipalign {

ScanRecord runScan(MirrorDevice& device,
                   VoltageSchedule& schedule,
                   const ScanConfig& config,
                   std::ostream* log) {
    ScanRecord record(config);
    const std::size_t planned = schedule.size();

    if (log) {
        *log << "[scan] start: " << planned << " samples, x [" << config.x.min_V << ", "
             << config.x.max_V << "] V, y [" << config.y.min_V << ", " << config.y.max_V
             << "] V, order " << orderingName(config.ordering) << "\n";
    }

    VoltagePair v{};
    while (schedule.next(v)) {
        Sample s{};
        try {
            s = device.measureAt(v);
        } catch (const HardwareFaultError& e) {
            record.markPartial(e.what());
            if (log) {
                *log << "[scan] hardware fault after " << record.size() << "/" << planned
                     << " samples: " << e.what() << "\n";
            }
            break;
        }
        record.add(s);
    }

    record.seal();
    if (log && !record.isPartial()) {
        *log << "[scan] complete: " << record.size() << " samples\n";
    }
    return record;
}

} // namespace tipalign
