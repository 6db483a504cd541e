#ifndef ROUNDWATCH_WORKER_SOURCE_WORKER_H_
#define ROUNDWATCH_WORKER_SOURCE_WORKER_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/notification.h"

#include "common/channels.h"
#include "common/types.h"
#include "vision/phase_classifier.h"
#include "vision/screen_reader.h"

namespace Roundwatch {

/// Static per-source settings, read-only once the worker exists.
struct SourceConfig {
	std::string id;
	RegionMap regions;
	std::vector<int64_t> bet_sequence;
	double auto_stop = 2.35;
	// Profit goal on top of the starting balance. <= 0 disables it.
	double target_money = 0;
};

/// Mutable state of one worker. Touched only by the worker's own thread.
struct WorkerRuntimeState {
	Phase current_phase = Phase::kUnknown;
	Phase previous_phase = Phase::kUnknown;
	size_t bet_index = 0;
	bool bet_placed_for_round = false;
	double current_money = 0;
	double target = 0;
	std::vector<RoundSnapshot> round_snapshots;
	int64_t rounds_played = 0;
	// Ended was entered but the final score has not been read yet
	bool round_end_pending = false;
};

struct SourceWorkerOptions {
	std::chrono::milliseconds poll_interval{50};
	std::chrono::milliseconds error_backoff{500};
	std::chrono::milliseconds action_enqueue_timeout{1000};
	std::chrono::milliseconds record_enqueue_timeout{0};
	int balance_read_attempts = 3;
	std::chrono::milliseconds balance_retry_delay{500};
};

struct SourceWorkerStats {
	uint64_t polls = 0;
	uint64_t read_errors = 0;
	uint64_t unknown_phases = 0;
	uint64_t actions_enqueued = 0;
	uint64_t actions_dropped = 0;
	uint64_t records_enqueued = 0;
	uint64_t records_dropped = 0;
	uint64_t rounds_played = 0;
};

/// Stake index after a round: back to the start on a win, one step further on a loss.
size_t AdvanceBetIndex(size_t bet_index, size_t sequence_length, bool won);

/// Low [1,2), Mid [2,10), High [10,inf). Non-active phases accept nothing.
bool ScoreMatchesPhase(double score, Phase phase);

/**
 * Watches one game instance: polls its phase, places one bet per round through
 * the action channel and hands finished rounds to the record channel.
 *
 * Must be owned by a shared_ptr. The worker thread keeps its own reference, so
 * a worker that is detached on shutdown stays valid until its thread returns.
 */
class SourceWorker : public std::enable_shared_from_this<SourceWorker> {
public:
	/// Throws ConfigError if the source has no stakes or misses a region role.
	SourceWorker(SourceConfig config,
			std::unique_ptr<ScreenReader> reader,
			std::shared_ptr<const PhaseClassifier> classifier,
			std::shared_ptr<ActionQueue> action_queue,
			std::shared_ptr<RecordQueue> record_queue,
			SourceWorkerOptions options = SourceWorkerOptions());
	~SourceWorker();

	SourceWorker(const SourceWorker&) = delete;
	SourceWorker& operator=(const SourceWorker&) = delete;

	void Start();
	/// Stops polling after the current cycle. Wakes a sleeping worker.
	void RequestStop();
	/// Returns false if the thread did not finish within the timeout.
	bool Join(std::chrono::milliseconds timeout);
	/// Abandons a thread that did not finish in time.
	void Detach();
	bool finished() const { return done_.HasBeenNotified(); }

	/// Initial balance read with retries. Sets the target money.
	void InitializeBalance();
	/// One poll cycle. Throws ReadError when the phase sample fails.
	void PollOnce();
	bool TargetReached() const;

	const std::string& id() const { return config_.id; }
	const SourceConfig& config() const { return config_; }
	/// Only consistent while the worker thread is not running.
	const WorkerRuntimeState& state() const { return state_; }
	SourceWorkerStats stats() const;

private:
	void Run();
	void OnEnter(Phase phase, Phase from);
	void PlaceBet();
	void RecordSnapshot();
	void FinishRound();
	std::string ReadRole(const char* role);
	void Sleep(std::chrono::milliseconds duration);
	std::string NextRequestId();

	SourceConfig config_;
	std::unique_ptr<ScreenReader> reader_;
	std::shared_ptr<const PhaseClassifier> classifier_;
	std::shared_ptr<ActionQueue> action_queue_;
	std::shared_ptr<RecordQueue> record_queue_;
	SourceWorkerOptions options_;

	WorkerRuntimeState state_;
	uint64_t request_seq_ = 0;

	std::thread thread_;
	std::atomic<bool> stop_requested_{false};
	absl::Notification stop_;
	absl::Notification done_;

	std::atomic<uint64_t> polls_{0};
	std::atomic<uint64_t> read_errors_{0};
	std::atomic<uint64_t> unknown_phases_{0};
	std::atomic<uint64_t> actions_enqueued_{0};
	std::atomic<uint64_t> actions_dropped_{0};
	std::atomic<uint64_t> records_enqueued_{0};
	std::atomic<uint64_t> records_dropped_{0};
	std::atomic<uint64_t> rounds_played_{0};
};

} // namespace Roundwatch

#endif // ROUNDWATCH_WORKER_SOURCE_WORKER_H_
