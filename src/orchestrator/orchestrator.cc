#include "orchestrator.h"

#include <utility>
#include <glog/logging.h>

#include "absl/time/time.h"
#include "common/errors.h"
#include "vision/region_resolver.h"

namespace Roundwatch {

OrchestratorOptions OptionsFromConfig(const RoundwatchConfig& config) {
	using std::chrono::milliseconds;
	OrchestratorOptions options;

	options.worker.poll_interval = milliseconds(config.runtime.poll_interval_ms.get());
	options.worker.error_backoff = milliseconds(config.runtime.error_backoff_ms.get());
	options.worker.action_enqueue_timeout = milliseconds(config.runtime.action_enqueue_timeout_ms.get());
	options.worker.record_enqueue_timeout = milliseconds(config.runtime.record_enqueue_timeout_ms.get());
	options.worker.balance_read_attempts = config.runtime.balance_read_attempts.get();
	options.worker.balance_retry_delay = milliseconds(config.runtime.balance_retry_delay_ms.get());

	options.actuator.cooldown = milliseconds(config.actuator.cooldown_ms.get());
	options.actuator.receive_poll = milliseconds(config.actuator.receive_poll_ms.get());
	options.actuator.click_settle = milliseconds(config.actuator.click_settle_ms.get());
	options.actuator.select_settle = milliseconds(config.actuator.select_settle_ms.get());
	options.actuator.keystroke_interval = milliseconds(config.actuator.keystroke_interval_ms.get());
	options.actuator.type_settle = milliseconds(config.actuator.type_settle_ms.get());
	options.actuator.post_click = milliseconds(config.actuator.post_click_ms.get());

	options.persistence.batch_size = config.persistence.batch_size.get();
	options.persistence.batch_timeout = milliseconds(config.persistence.batch_timeout_ms.get());
	options.persistence.queue_warning_depth = config.persistence.queue_warning_depth.get();
	options.persistence.queue_critical_depth = config.persistence.queue_critical_depth.get();
	options.persistence.stats_interval = std::chrono::seconds(config.persistence.stats_interval_s.get());

	options.action_queue_capacity = config.actuator.queue_capacity.get();
	options.record_queue_capacity = config.persistence.queue_capacity.get();
	options.worker_join_timeout = milliseconds(config.runtime.worker_join_timeout_ms.get());
	options.stats_interval = std::chrono::seconds(config.runtime.stats_interval_s.get());
	return options;
}

std::vector<SourceConfig> BuildSourceConfigs(const Configuration& configuration) {
	const RoundwatchConfig& config = configuration.config();
	RegionResolver resolver(config.layouts, config.positions);

	std::vector<SourceConfig> sources;
	for (const auto& entry : config.sources) {
		SourceConfig source;
		source.id = entry.id;
		source.regions = resolver.ResolveForSource(entry.id, entry.layout, entry.position);
		source.bet_sequence = configuration.resolveBetSequence(entry);
		source.auto_stop = entry.auto_stop;
		source.target_money = entry.target_money;
		sources.push_back(std::move(source));
	}
	if (sources.empty()) {
		throw ConfigError("No sources configured");
	}
	return sources;
}

Orchestrator::Orchestrator(const Configuration& configuration,
		ScreenReaderFactory reader_factory,
		std::unique_ptr<InputDevice> device,
		std::unique_ptr<RoundStore> store):
	Orchestrator(BuildSourceConfigs(configuration),
			PhaseClassifier::LoadFromFile(configuration.config().classifier.model_path.get()),
			std::move(reader_factory),
			std::move(device),
			std::move(store),
			OptionsFromConfig(configuration.config())){}

Orchestrator::Orchestrator(std::vector<SourceConfig> sources,
		std::shared_ptr<const PhaseClassifier> classifier,
		ScreenReaderFactory reader_factory,
		std::unique_ptr<InputDevice> device,
		std::unique_ptr<RoundStore> store,
		OrchestratorOptions options):
	options_(std::move(options)),
	action_queue_(std::make_shared<ActionQueue>(options_.action_queue_capacity)),
	record_queue_(std::make_shared<RecordQueue>(options_.record_queue_capacity)),
	classifier_(std::move(classifier)){
	if (!classifier_) {
		throw ModelLoadError("No phase classifier");
	}
	if (!reader_factory) {
		throw ConfigError("No screen reader factory");
	}

	persistence_ = std::make_unique<PersistenceWorker>(record_queue_, std::move(store), options_.persistence);
	actuator_ = std::make_unique<InputActuator>(action_queue_, std::move(device), options_.actuator);
	for (auto& source : sources) {
		std::unique_ptr<ScreenReader> reader = reader_factory(source.id, source.regions);
		workers_.push_back(std::make_shared<SourceWorker>(std::move(source), std::move(reader), classifier_,
					action_queue_, record_queue_, options_.worker));
	}
	LOG(INFO) << "[Orchestrator]: " << workers_.size() << " sources, action queue "
		<< options_.action_queue_capacity << ", record queue " << options_.record_queue_capacity;
}

Orchestrator::~Orchestrator() {
	Stop();
}

void Orchestrator::Start() {
	if (started_) {
		return;
	}
	started_ = true;
	start_time_ = std::chrono::steady_clock::now();

	persistence_->Start();
	actuator_->Start();
	for (auto& worker : workers_) {
		worker->Start();
	}
	LOG(INFO) << "[Orchestrator]: Started " << workers_.size() << " source workers";
}

void Orchestrator::RequestShutdown() {
	if (!shutdown_requested_.exchange(true)) {
		LOG(INFO) << "[Orchestrator]: Shutdown requested";
		shutdown_.Notify();
	}
}

void Orchestrator::Interrupt() {
	actuator_->Interrupt();
}

bool Orchestrator::AllWorkersFinished() const {
	for (const auto& worker : workers_) {
		if (!worker->finished()) {
			return false;
		}
	}
	return true;
}

void Orchestrator::Wait() {
	auto last_stats = std::chrono::steady_clock::now();
	while (!shutdown_.WaitForNotificationWithTimeout(absl::Milliseconds(200))) {
		if (started_ && AllWorkersFinished()) {
			LOG(INFO) << "[Orchestrator]: All source workers finished";
			return;
		}
		auto now = std::chrono::steady_clock::now();
		if (now - last_stats >= options_.stats_interval) {
			LogStats("Periodic");
			last_stats = now;
		}
	}
}

void Orchestrator::Stop() {
	if (stopped_) {
		return;
	}
	stopped_ = true;
	LOG(INFO) << "[Orchestrator]: Stopping";

	// 1. No new polls, bets or records from the sources.
	for (auto& worker : workers_) {
		worker->RequestStop();
	}

	// 2. Nothing more reaches the input device.
	actuator_->Stop();

	// 3. Wait for the sources, abandon the ones that hang in a read.
	for (auto& worker : workers_) {
		if (!worker->Join(options_.worker_join_timeout)) {
			worker->Detach();
		}
	}

	// 4. Persist what the sources produced.
	persistence_->Stop();

	LogStats("Final");

	// 5. Detached workers keep their own references.
	action_queue_.reset();
	record_queue_.reset();
}

void Orchestrator::LogStats(const char* label) const {
	double runtime = started_ ? std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count() : 0;
	LOG(INFO) << "[Orchestrator]: " << label << " stats after " << runtime << "s";
	for (const auto& worker : workers_) {
		SourceWorkerStats s = worker->stats();
		LOG(INFO) << "[Orchestrator]:   " << worker->id() << ": rounds=" << s.rounds_played
			<< " polls=" << s.polls
			<< " read_errors=" << s.read_errors
			<< " unknown=" << s.unknown_phases
			<< " bets=" << s.actions_enqueued << "/" << s.actions_dropped << " dropped"
			<< " records=" << s.records_enqueued << "/" << s.records_dropped << " dropped";
	}
	LOG(INFO) << "[Orchestrator]:   actuator(" << actuator_->device_name() << "): executed="
		<< actuator_->executed() << " failed=" << actuator_->failed();
	PersistenceStats p = persistence_->stats();
	LOG(INFO) << "[Orchestrator]:   persistence: processed=" << p.total_processed
		<< " batches=" << p.total_batches << " errors=" << p.total_errors;
}

} // namespace Roundwatch
