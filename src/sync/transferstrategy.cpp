#include "transferstrategy.h"

namespace FieldSync {

TransferParameters AdaptiveTransferStrategy::parametersFor(QualityTier tier)
{
    TransferParameters params;

    switch (tier) {
        case QualityTier::Excellent:
            params.batchSize = 50;
            params.timeoutMs = 15000;
            params.baseBackoffMs = 1000;
            params.maxBackoffMs = 15000;
            break;
        case QualityTier::Good:
            params.batchSize = 30;
            params.timeoutMs = 30000;
            params.baseBackoffMs = 2000;
            params.maxBackoffMs = 30000;
            break;
        case QualityTier::Fair:
            params.batchSize = 15;
            params.timeoutMs = 45000;
            params.baseBackoffMs = 3000;
            params.maxBackoffMs = 60000;
            break;
        case QualityTier::Poor:
            params.batchSize = 5;
            params.timeoutMs = 90000;
            params.baseBackoffMs = 5000;
            params.maxBackoffMs = 120000;
            break;
        case QualityTier::Offline:
            return offline();
    }

    return params;
}

} // namespace FieldSync
