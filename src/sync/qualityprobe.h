#ifndef QUALITYPROBE_H
#define QUALITYPROBE_H

#include "synctypes.h"

namespace FieldSync {

/**
 * @brief Source of network quality measurements
 *
 * A probe performs one reachability check and one small-payload throughput
 * check and reports the result as a sample. Implementations must not throw;
 * a failed probe returns a sample with reachable = false.
 */
class QualityProbe
{
public:
    virtual ~QualityProbe() = default;

    /**
     * @brief Take one measurement (may block up to the probe timeout)
     */
    virtual NetworkQualitySample probe() = 0;
};

} // namespace FieldSync

#endif // QUALITYPROBE_H
