#include "channels.h"

#include <utility>

namespace Roundwatch {

bool EnqueueAction(const std::shared_ptr<ActionQueue>& queue, ActionRequest req,
                   std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return queue->write(std::move(req));
    }
    return queue->tryWriteUntil(std::chrono::steady_clock::now() + timeout, std::move(req));
}

bool EnqueueRecord(const std::shared_ptr<RecordQueue>& queue, RoundRecord record,
                   std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return queue->write(std::move(record));
    }
    return queue->tryWriteUntil(std::chrono::steady_clock::now() + timeout, std::move(record));
}

bool DequeueAction(const std::shared_ptr<ActionQueue>& queue, std::optional<ActionRequest>* maybe_req,
                   std::chrono::milliseconds timeout) {
    return queue->tryReadUntil(std::chrono::steady_clock::now() + timeout, *maybe_req);
}

bool DequeueRecordUntil(const std::shared_ptr<RecordQueue>& queue, std::optional<RoundRecord>* maybe_record,
                        std::chrono::steady_clock::time_point deadline) {
    return queue->tryReadUntil(deadline, *maybe_record);
}

} // end namespace Roundwatch
