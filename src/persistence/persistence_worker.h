#ifndef ROUNDWATCH_PERSISTENCE_PERSISTENCE_WORKER_H_
#define ROUNDWATCH_PERSISTENCE_PERSISTENCE_WORKER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "common/channels.h"
#include "persistence/round_store.h"

namespace Roundwatch {

struct PersistenceOptions {
	size_t batch_size = 50;
	std::chrono::milliseconds batch_timeout{1000};
	size_t queue_warning_depth = 5000;
	size_t queue_critical_depth = 8000;
	std::chrono::seconds stats_interval{30};
};

struct PersistenceStats {
	uint64_t total_processed = 0;
	uint64_t total_batches = 0;
	uint64_t total_errors = 0;
	uint64_t queue_warnings = 0;
	size_t max_queue_size_seen = 0;
	double total_processing_time = 0;  // seconds spent flushing
	size_t last_batch_size = 0;
	double last_batch_time = 0;

	double average_batch_size() const {
		return total_batches ? static_cast<double>(total_processed) / total_batches : 0;
	}
	double items_per_second() const {
		return total_processing_time > 0 ? total_processed / total_processing_time : 0;
	}
};

/**
 * Drains the record channel into the round store in batches.
 *
 * A batch is flushed when it reaches batch_size or when batch_timeout has
 * passed since its first record arrived. Each flush is one store transaction
 * with one grouped write per source; a group that fails is retried record by
 * record and records that still fail are dropped and counted.
 */
class PersistenceWorker {
public:
	PersistenceWorker(std::shared_ptr<RecordQueue> queue,
			std::unique_ptr<RoundStore> store,
			PersistenceOptions options = PersistenceOptions());
	~PersistenceWorker();

	PersistenceWorker(const PersistenceWorker&) = delete;
	PersistenceWorker& operator=(const PersistenceWorker&) = delete;

	void Start();
	/// Drains the channel, flushes everything pending, then closes the store.
	void Stop();

	PersistenceStats stats() const;

private:
	void Run();
	void Flush(std::vector<RoundRecord>& pending);
	void CheckQueueDepth();
	void LogStats(const char* label) const;

	std::shared_ptr<RecordQueue> queue_;
	std::unique_ptr<RoundStore> store_;
	PersistenceOptions options_;

	std::thread thread_;
	std::atomic<bool> stop_threads_{false};
	bool stopped_ = false;

	mutable absl::Mutex stats_mu_;
	PersistenceStats stats_ ABSL_GUARDED_BY(stats_mu_);
};

} // namespace Roundwatch

#endif // ROUNDWATCH_PERSISTENCE_PERSISTENCE_WORKER_H_
