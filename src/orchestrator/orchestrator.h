#ifndef ROUNDWATCH_ORCHESTRATOR_ORCHESTRATOR_H_
#define ROUNDWATCH_ORCHESTRATOR_ORCHESTRATOR_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "absl/synchronization/notification.h"

#include "actuator/input_actuator.h"
#include "actuator/input_device.h"
#include "common/channels.h"
#include "common/configuration.h"
#include "persistence/persistence_worker.h"
#include "persistence/round_store.h"
#include "vision/phase_classifier.h"
#include "vision/screen_reader.h"
#include "worker/source_worker.h"

namespace Roundwatch {

struct OrchestratorOptions {
	SourceWorkerOptions worker;
	ActuatorOptions actuator;
	PersistenceOptions persistence;
	size_t action_queue_capacity = 100;
	size_t record_queue_capacity = 10000;
	std::chrono::milliseconds worker_join_timeout{5000};
	std::chrono::seconds stats_interval{60};
};

OrchestratorOptions OptionsFromConfig(const RoundwatchConfig& config);

/// Resolves regions and stake sequences of every configured source. Throws ConfigError.
std::vector<SourceConfig> BuildSourceConfigs(const Configuration& configuration);

/**
 * Owns the channels, the input actuator, the persistence worker and one
 * source worker per source.
 *
 * Start order: persistence, actuator, sources.
 * Stop order: signal sources, stop actuator, join sources (detaching those
 * that overrun the timeout), stop persistence, release channels.
 */
class Orchestrator {
public:
	/// Loads the phase model and resolves every source. Throws ConfigError or ModelLoadError.
	Orchestrator(const Configuration& configuration,
			ScreenReaderFactory reader_factory,
			std::unique_ptr<InputDevice> device,
			std::unique_ptr<RoundStore> store);
	Orchestrator(std::vector<SourceConfig> sources,
			std::shared_ptr<const PhaseClassifier> classifier,
			ScreenReaderFactory reader_factory,
			std::unique_ptr<InputDevice> device,
			std::unique_ptr<RoundStore> store,
			OrchestratorOptions options);
	~Orchestrator();

	Orchestrator(const Orchestrator&) = delete;
	Orchestrator& operator=(const Orchestrator&) = delete;

	void Start();
	/// Thread safe. Makes Wait() return.
	void RequestShutdown();
	/// Blocks until RequestShutdown() or until every source worker finished on its own.
	void Wait();
	void Stop();
	/// Forwards the safety interrupt to the input actuator. Thread safe.
	void Interrupt();

	const std::vector<std::shared_ptr<SourceWorker>>& workers() const { return workers_; }
	const InputActuator& actuator() const { return *actuator_; }
	PersistenceStats persistence_stats() const { return persistence_->stats(); }

private:
	bool AllWorkersFinished() const;
	void LogStats(const char* label) const;

	OrchestratorOptions options_;
	std::shared_ptr<ActionQueue> action_queue_;
	std::shared_ptr<RecordQueue> record_queue_;
	std::shared_ptr<const PhaseClassifier> classifier_;

	std::unique_ptr<PersistenceWorker> persistence_;
	std::unique_ptr<InputActuator> actuator_;
	std::vector<std::shared_ptr<SourceWorker>> workers_;

	absl::Notification shutdown_;
	std::atomic<bool> shutdown_requested_{false};
	bool started_ = false;
	bool stopped_ = false;
	std::chrono::steady_clock::time_point start_time_;
};

} // namespace Roundwatch

#endif // ROUNDWATCH_ORCHESTRATOR_ORCHESTRATOR_H_
