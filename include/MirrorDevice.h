#pragma once

#include "AlignTypes.h"

namespace tipalign {

// Hardware-layer handle: the steering mirror plus the power sensor behind the tip.
//
// The core never owns or locates a device on its own. Whoever drives a scan
// passes the handle in explicitly; a device is used by one scan at a time.
class MirrorDevice {
public:
    virtual ~MirrorDevice() = default;

    virtual DeviceLimits limits() const = 0;

    // Apply v, wait for the mirror to settle, read the sensor.
    // Throws HardwareFaultError when the instrument fails.
    virtual Sample measureAt(const VoltagePair& v) = 0;

    // Park the mirror at v (alignment move). Throws HardwareFaultError.
    virtual void moveTo(const VoltagePair& v) = 0;
};

} // namespace tipalign
