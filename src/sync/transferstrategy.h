#ifndef TRANSFERSTRATEGY_H
#define TRANSFERSTRATEGY_H

#include "synctypes.h"

namespace FieldSync {

/**
 * @brief Derives transfer parameters from the current network quality
 *
 * Pure function of the tier. As the tier degrades from Excellent to Poor the
 * batch size strictly shrinks and the per-call timeout strictly grows, so a
 * bad link sends fewer records per round-trip and waits longer for each.
 * Offline yields a sentinel whose shouldAttempt() is false.
 */
class AdaptiveTransferStrategy
{
public:
    static TransferParameters parametersFor(QualityTier tier);

    /**
     * @brief Sentinel for "do not attempt"
     */
    static TransferParameters offline() { return TransferParameters(); }
};

} // namespace FieldSync

#endif // TRANSFERSTRATEGY_H
