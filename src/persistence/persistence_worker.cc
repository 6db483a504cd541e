#include "persistence_worker.h"

#include <map>
#include <utility>
#include <glog/logging.h>

#include "common/errors.h"

namespace Roundwatch {

PersistenceWorker::PersistenceWorker(std::shared_ptr<RecordQueue> queue,
		std::unique_ptr<RoundStore> store,
		PersistenceOptions options):
	queue_(std::move(queue)),
	store_(std::move(store)),
	options_(options){
	if (!queue_ || !store_) {
		throw PersistenceError("Persistence worker needs a queue and a store");
	}
	if (options_.batch_size == 0) {
		options_.batch_size = 1;
	}
}

PersistenceWorker::~PersistenceWorker() {
	Stop();
}

void PersistenceWorker::Start() {
	thread_ = std::thread(&PersistenceWorker::Run, this);
	LOG(INFO) << "[PersistenceWorker]: Started, batch " << options_.batch_size << " / "
		<< options_.batch_timeout.count() << "ms";
}

void PersistenceWorker::Stop() {
	if (stopped_) {
		return;
	}
	stopped_ = true;
	stop_threads_ = true;
	WakeConsumer(queue_);
	if (thread_.joinable()) {
		thread_.join();
	}

	// Anything written after the worker saw the stop flag.
	std::vector<RoundRecord> pending;
	std::optional<RoundRecord> maybe_record;
	while (queue_->read(maybe_record)) {
		if (maybe_record.has_value()) {
			pending.push_back(std::move(*maybe_record));
			if (pending.size() >= options_.batch_size) {
				Flush(pending);
			}
		}
	}
	if (!pending.empty()) {
		Flush(pending);
	}

	try {
		store_->Close();
	} catch (const PersistenceError& e) {
		LOG(ERROR) << "[PersistenceWorker]: Closing store failed: " << e.what();
	}
	store_.reset();
	LogStats("Final");
}

PersistenceStats PersistenceWorker::stats() const {
	absl::MutexLock lock(&stats_mu_);
	return stats_;
}

void PersistenceWorker::Run() {
	using clock = std::chrono::steady_clock;
	std::vector<RoundRecord> pending;
	pending.reserve(options_.batch_size);
	clock::time_point window_start = clock::now();
	clock::time_point last_stats = window_start;

	while (!stop_threads_) {
		clock::time_point now = clock::now();
		clock::time_point deadline = pending.empty() ? now + options_.batch_timeout
			: window_start + options_.batch_timeout;

		std::optional<RoundRecord> maybe_record;
		if (DequeueRecordUntil(queue_, &maybe_record, deadline) && maybe_record.has_value()) {
			if (pending.empty()) {
				window_start = clock::now();
			}
			pending.push_back(std::move(*maybe_record));
			CheckQueueDepth();
		}

		now = clock::now();
		if (pending.size() >= options_.batch_size ||
				(!pending.empty() && now - window_start >= options_.batch_timeout)) {
			Flush(pending);
		}
		if (now - last_stats >= options_.stats_interval) {
			LogStats("Periodic");
			last_stats = now;
		}
	}

	if (!pending.empty()) {
		Flush(pending);
	}
}

void PersistenceWorker::Flush(std::vector<RoundRecord>& pending) {
	auto start = std::chrono::steady_clock::now();
	size_t batch_size = pending.size();
	uint64_t written = 0;
	uint64_t errors = 0;

	std::map<std::string, std::vector<RoundRecord>> groups;
	for (auto& record : pending) {
		groups[record.source_id].push_back(std::move(record));
	}
	pending.clear();

	try {
		store_->BeginBatch();
		for (const auto& [source_id, records] : groups) {
			try {
				store_->WriteGroup(source_id, records);
				written += records.size();
			} catch (const PersistenceError& e) {
				LOG(WARNING) << "[PersistenceWorker]: Group write for " << source_id << " ("
					<< records.size() << " records) failed, retrying one by one: " << e.what();
				for (const auto& record : records) {
					try {
						store_->WriteOne(record);
						written++;
					} catch (const PersistenceError& single) {
						errors++;
						LOG(ERROR) << "[PersistenceWorker]: Dropping record of " << record.source_id
							<< " (score " << record.final_score << "): " << single.what();
					}
				}
			}
		}
		store_->CommitBatch();
	} catch (const PersistenceError& e) {
		store_->AbortBatch();
		errors = batch_size;
		written = 0;
		LOG(ERROR) << "[PersistenceWorker]: Batch of " << batch_size << " lost: " << e.what();
	}

	double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
	{
		absl::MutexLock lock(&stats_mu_);
		stats_.total_processed += written;
		stats_.total_errors += errors;
		stats_.total_batches++;
		stats_.total_processing_time += elapsed;
		stats_.last_batch_size = batch_size;
		stats_.last_batch_time = elapsed;
	}
	VLOG(1) << "[PersistenceWorker]: Flushed " << written << "/" << batch_size << " records in "
		<< elapsed * 1000 << "ms";
}

void PersistenceWorker::CheckQueueDepth() {
	size_t depth = QueueDepth(queue_);
	bool warn = false;
	{
		absl::MutexLock lock(&stats_mu_);
		if (depth > stats_.max_queue_size_seen) {
			stats_.max_queue_size_seen = depth;
		}
		if (depth >= options_.queue_warning_depth) {
			stats_.queue_warnings++;
			warn = true;
		}
	}
	if (!warn) {
		return;
	}
	if (depth >= options_.queue_critical_depth) {
		LOG_EVERY_N(ERROR, 100) << "[PersistenceWorker]: Record queue critical, depth " << depth;
	} else {
		LOG_EVERY_N(WARNING, 100) << "[PersistenceWorker]: Record queue backing up, depth " << depth;
	}
}

void PersistenceWorker::LogStats(const char* label) const {
	PersistenceStats s = stats();
	LOG(INFO) << "[PersistenceWorker]: " << label << " stats: processed=" << s.total_processed
		<< " batches=" << s.total_batches
		<< " errors=" << s.total_errors
		<< " avg_batch=" << s.average_batch_size()
		<< " items/s=" << s.items_per_second()
		<< " max_queue=" << s.max_queue_size_seen
		<< " queue_warnings=" << s.queue_warnings;
}

} // namespace Roundwatch
