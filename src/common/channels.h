#ifndef ROUNDWATCH_COMMON_CHANNELS_H_
#define ROUNDWATCH_COMMON_CHANNELS_H_

#include <chrono>
#include <memory>
#include <optional>
#include "folly/MPMCQueue.h"

#include "common/types.h"

namespace Roundwatch {

// std::nullopt is a wake-up sentinel written by the consumer's owner on stop.
using ActionQueue = folly::MPMCQueue<std::optional<ActionRequest>>;
using RecordQueue = folly::MPMCQueue<std::optional<RoundRecord>>;

/// Enqueue with a deadline. A zero timeout never blocks. Returns false when the
/// queue stayed full.
bool EnqueueAction(const std::shared_ptr<ActionQueue>& queue, ActionRequest req,
                   std::chrono::milliseconds timeout);
bool EnqueueRecord(const std::shared_ptr<RecordQueue>& queue, RoundRecord record,
                   std::chrono::milliseconds timeout);

/// Dequeue with a deadline. Returns false on timeout; on success *maybe_req may
/// still be the stop sentinel.
bool DequeueAction(const std::shared_ptr<ActionQueue>& queue, std::optional<ActionRequest>* maybe_req,
                   std::chrono::milliseconds timeout);
bool DequeueRecordUntil(const std::shared_ptr<RecordQueue>& queue, std::optional<RoundRecord>* maybe_record,
                        std::chrono::steady_clock::time_point deadline);

/// Best effort: does nothing if the queue is full, consumers also poll a stop flag.
template <typename Queue>
void WakeConsumer(const std::shared_ptr<Queue>& queue) {
    queue->write(std::nullopt);
}

template <typename Queue>
size_t QueueDepth(const std::shared_ptr<Queue>& queue) {
    auto depth = queue->sizeGuess();
    return depth > 0 ? static_cast<size_t>(depth) : 0;
}

} // End of namespace Roundwatch
#endif // ROUNDWATCH_COMMON_CHANNELS_H_
