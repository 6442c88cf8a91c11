#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <atomic>

namespace FieldSync {

/**
 * @brief Cooperative cancellation flag
 *
 * Safe to set from any thread. The orchestrator checks it between phases
 * and between batches, never inside a batch.
 */
class CancellationToken
{
public:
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled; }
    void reset() { m_cancelled = false; }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace FieldSync

#endif // CANCELLATIONTOKEN_H
