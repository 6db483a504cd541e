#ifndef ROUNDWATCH_PERSISTENCE_ROUND_STORE_H_
#define ROUNDWATCH_PERSISTENCE_ROUND_STORE_H_

#include <string>
#include <vector>

#include "common/types.h"

namespace Roundwatch {

/**
 * Durable store for finished rounds. Used from the persistence worker thread
 * only. Every call may throw PersistenceError.
 *
 * A flush is BeginBatch, any number of WriteGroup/WriteOne, then CommitBatch.
 * WriteGroup and WriteOne are atomic on their own: when they throw, nothing of
 * that call is left in the open batch.
 */
class RoundStore {
public:
	virtual ~RoundStore() = default;

	virtual void BeginBatch() = 0;
	virtual void CommitBatch() = 0;
	/// Rolls back an open batch. Never throws.
	virtual void AbortBatch() = 0;

	/// Bulk insert of records that share one source.
	virtual void WriteGroup(const std::string& source_id, const std::vector<RoundRecord>& records) = 0;
	virtual void WriteOne(const RoundRecord& record) = 0;

	/// Stored rounds, for one source or for all when source_id is empty.
	virtual int64_t CountRounds(const std::string& source_id = "") = 0;

	/// Releases the handle. Further calls throw.
	virtual void Close() = 0;
};

} // namespace Roundwatch

#endif // ROUNDWATCH_PERSISTENCE_ROUND_STORE_H_
