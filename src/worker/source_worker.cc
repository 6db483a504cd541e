#include "source_worker.h"

#include <algorithm>
#include <utility>
#include <glog/logging.h>

#include "absl/time/time.h"
#include "common/errors.h"

namespace Roundwatch {

size_t AdvanceBetIndex(size_t bet_index, size_t sequence_length, bool won) {
	if (won || sequence_length == 0) {
		return 0;
	}
	return (bet_index + 1) % sequence_length;
}

bool ScoreMatchesPhase(double score, Phase phase) {
	switch (phase) {
		case Phase::kActiveLow:
			return score >= 1.0 && score < 2.0;
		case Phase::kActiveMid:
			return score >= 2.0 && score < 10.0;
		case Phase::kActiveHigh:
			return score >= 10.0;
		default:
			return false;
	}
}

SourceWorker::SourceWorker(SourceConfig config,
		std::unique_ptr<ScreenReader> reader,
		std::shared_ptr<const PhaseClassifier> classifier,
		std::shared_ptr<ActionQueue> action_queue,
		std::shared_ptr<RecordQueue> record_queue,
		SourceWorkerOptions options):
	config_(std::move(config)),
	reader_(std::move(reader)),
	classifier_(std::move(classifier)),
	action_queue_(std::move(action_queue)),
	record_queue_(std::move(record_queue)),
	options_(options){
	if (config_.bet_sequence.empty()) {
		throw ConfigError("Source " + config_.id + " has an empty bet sequence");
	}
	for (const auto& role : RequiredRoles()) {
		if (config_.regions.find(role) == config_.regions.end()) {
			throw ConfigError("Source " + config_.id + " has no '" + role + "' region");
		}
	}
	if (!reader_ || !classifier_ || !action_queue_ || !record_queue_) {
		throw ConfigError("Source " + config_.id + " is missing a collaborator");
	}
	state_.target = config_.target_money;
}

SourceWorker::~SourceWorker() {
	if (thread_.joinable()) {
		RequestStop();
		// The last reference can be dropped by the worker thread itself.
		if (thread_.get_id() == std::this_thread::get_id()) {
			thread_.detach();
		} else {
			thread_.join();
		}
	}
}

void SourceWorker::Start() {
	thread_ = std::thread([self = shared_from_this()] { self->Run(); });
}

void SourceWorker::RequestStop() {
	if (!stop_requested_.exchange(true)) {
		stop_.Notify();
	}
}

bool SourceWorker::Join(std::chrono::milliseconds timeout) {
	if (!thread_.joinable()) {
		return true;
	}
	if (!done_.WaitForNotificationWithTimeout(absl::FromChrono(timeout))) {
		return false;
	}
	thread_.join();
	return true;
}

void SourceWorker::Detach() {
	if (thread_.joinable()) {
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Did not stop in time, detaching";
		thread_.detach();
	}
}

SourceWorkerStats SourceWorker::stats() const {
	SourceWorkerStats s;
	s.polls = polls_.load();
	s.read_errors = read_errors_.load();
	s.unknown_phases = unknown_phases_.load();
	s.actions_enqueued = actions_enqueued_.load();
	s.actions_dropped = actions_dropped_.load();
	s.records_enqueued = records_enqueued_.load();
	s.records_dropped = records_dropped_.load();
	s.rounds_played = rounds_played_.load();
	return s;
}

void SourceWorker::Run() {
	LOG(INFO) << "[SourceWorker " << config_.id << "]: Started with " << config_.bet_sequence.size()
		<< " stakes, auto stop " << config_.auto_stop;
	InitializeBalance();

	while (!stop_requested_.load()) {
		try {
			PollOnce();
		} catch (const ReadError& e) {
			read_errors_++;
			LOG(WARNING) << "[SourceWorker " << config_.id << "]: Read failed: " << e.what();
			Sleep(options_.error_backoff);
			continue;
		} catch (const std::exception& e) {
			read_errors_++;
			LOG(ERROR) << "[SourceWorker " << config_.id << "]: Poll failed: " << e.what();
			Sleep(options_.error_backoff);
			continue;
		}

		if (TargetReached()) {
			LOG(INFO) << "[SourceWorker " << config_.id << "]: Target reached, balance "
				<< state_.current_money << " >= " << state_.target;
			break;
		}
		Sleep(options_.poll_interval);
	}

	LOG(INFO) << "[SourceWorker " << config_.id << "]: Stopped after " << state_.rounds_played << " rounds";
	done_.Notify();
}

void SourceWorker::InitializeBalance() {
	int attempts = std::max(1, options_.balance_read_attempts);
	for (int attempt = 1; attempt <= attempts; attempt++) {
		try {
			double balance = ParseNumber(ReadRole(kMyMoneyRole));
			state_.current_money = balance;
			state_.target = config_.target_money + balance;
			LOG(INFO) << "[SourceWorker " << config_.id << "]: Initial balance " << balance
				<< ", target " << state_.target;
			return;
		} catch (const ReadError& e) {
			read_errors_++;
			LOG(WARNING) << "[SourceWorker " << config_.id << "]: Balance read attempt " << attempt
				<< "/" << attempts << " failed: " << e.what();
			if (attempt < attempts) {
				Sleep(options_.balance_retry_delay);
			}
		}
	}
	state_.current_money = 0;
	state_.target = config_.target_money;
	LOG(WARNING) << "[SourceWorker " << config_.id << "]: Starting with balance 0";
}

bool SourceWorker::TargetReached() const {
	return config_.target_money > 0 && state_.current_money >= state_.target;
}

void SourceWorker::PollOnce() {
	polls_++;
	Rgb color = reader_->SampleColor(config_.regions.at(kPhaseRole));
	Phase observed = classifier_->Classify(color);
	if (observed == Phase::kUnknown) {
		unknown_phases_++;
		VLOG(2) << "[SourceWorker " << config_.id << "]: Unknown phase for color ("
			<< color.r << "," << color.g << "," << color.b << ")";
		return;
	}

	if (observed != state_.current_phase) {
		Phase from = state_.current_phase;
		state_.previous_phase = from;
		state_.current_phase = observed;
		VLOG(1) << "[SourceWorker " << config_.id << "]: " << PhaseName(from) << " -> " << PhaseName(observed);
		OnEnter(observed, from);
	}

	if (IsActive(state_.current_phase)) {
		RecordSnapshot();
	} else if (state_.current_phase == Phase::kEnded && state_.round_end_pending) {
		FinishRound();
	}
}

void SourceWorker::OnEnter(Phase phase, Phase from) {
	if (from == Phase::kEnded && state_.round_end_pending) {
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Left ENDED before the final score was read, round abandoned";
		state_.round_end_pending = false;
	}

	switch (phase) {
		case Phase::kWaiting:
			if (from == Phase::kEnded) {
				state_.bet_placed_for_round = false;
				state_.round_snapshots.clear();
			}
			break;
		case Phase::kBettingReady:
			if (from == Phase::kWaiting && !state_.bet_placed_for_round) {
				PlaceBet();
			}
			break;
		case Phase::kEnded:
			// A worker that starts mid-round has no round to close.
			if (from != Phase::kUnknown) {
				state_.round_end_pending = true;
			}
			break;
		default:
			break;
	}
}

void SourceWorker::PlaceBet() {
	ActionRequest req;
	req.source_id = config_.id;
	req.stake_amount = config_.bet_sequence[state_.bet_index];
	req.amount_field = Center(config_.regions.at(kPlayAmountRole));
	req.play_button = Center(config_.regions.at(kPlayButtonRole));
	req.request_id = NextRequestId();
	req.timestamp = std::chrono::system_clock::now();

	int64_t stake = req.stake_amount;
	std::string request_id = req.request_id;
	if (EnqueueAction(action_queue_, std::move(req), options_.action_enqueue_timeout)) {
		state_.bet_placed_for_round = true;
		actions_enqueued_++;
		LOG(INFO) << "[SourceWorker " << config_.id << "]: Bet " << stake << " queued (index "
			<< state_.bet_index << ", " << request_id << ")";
	} else {
		actions_dropped_++;
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Action channel full, bet " << stake << " dropped";
	}
}

void SourceWorker::RecordSnapshot() {
	RoundSnapshot snapshot;
	snapshot.score = ParseNumber(ReadRole(kScoreRole));
	if (!ScoreMatchesPhase(snapshot.score, state_.current_phase)) {
		VLOG(1) << "[SourceWorker " << config_.id << "]: Discarding score " << snapshot.score
			<< " in " << PhaseName(state_.current_phase);
		return;
	}
	snapshot.players = ParsePlayerCounts(ReadRole(kOtherCountRole)).current;
	snapshot.players_win = ParseNumber(ReadRole(kOtherMoneyRole));
	snapshot.timestamp = EpochSeconds();

	if (!state_.round_snapshots.empty() && state_.round_snapshots.back().SameReading(snapshot)) {
		return;
	}
	state_.round_snapshots.push_back(snapshot);
}

void SourceWorker::FinishRound() {
	// Without a final score the round stays pending until the next poll.
	double final_score = ParseNumber(ReadRole(kScoreRole));

	double balance = state_.current_money;
	try {
		balance = ParseNumber(ReadRole(kMyMoneyRole));
	} catch (const ReadError& e) {
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Balance unreadable, keeping " << balance
			<< ": " << e.what();
	}
	int64_t players = 0;
	try {
		players = ParsePlayerCounts(ReadRole(kOtherCountRole)).total;
	} catch (const ReadError& e) {
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Player count unreadable: " << e.what();
	}
	double total_win = 0;
	try {
		total_win = ParseNumber(ReadRole(kOtherMoneyRole));
	} catch (const ReadError& e) {
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Total win unreadable: " << e.what();
	}

	int64_t stake = config_.bet_sequence[state_.bet_index];
	bool won = final_score > config_.auto_stop;
	state_.bet_index = AdvanceBetIndex(state_.bet_index, config_.bet_sequence.size(), won);
	state_.current_money = balance;
	state_.rounds_played++;
	state_.round_end_pending = false;
	rounds_played_++;

	RoundRecord record;
	record.source_id = config_.id;
	record.final_score = final_score;
	record.total_win = total_win;
	record.total_player_count = players;
	record.snapshots = std::move(state_.round_snapshots);
	record.earnings = Earnings{static_cast<double>(stake), config_.auto_stop, balance};
	record.timestamp = EpochSeconds();
	state_.round_snapshots.clear();

	LOG(INFO) << "[SourceWorker " << config_.id << "]: Round " << state_.rounds_played << " ended at "
		<< final_score << "x, " << (won ? "won" : "lost") << " stake " << stake << ", balance " << balance
		<< ", next index " << state_.bet_index;

	if (EnqueueRecord(record_queue_, std::move(record), options_.record_enqueue_timeout)) {
		records_enqueued_++;
	} else {
		records_dropped_++;
		LOG(WARNING) << "[SourceWorker " << config_.id << "]: Record channel full, round "
			<< state_.rounds_played << " dropped";
	}
}

std::string SourceWorker::ReadRole(const char* role) {
	return reader_->ReadText(config_.regions.at(role));
}

void SourceWorker::Sleep(std::chrono::milliseconds duration) {
	if (duration.count() <= 0) {
		return;
	}
	stop_.WaitForNotificationWithTimeout(absl::FromChrono(duration));
}

std::string SourceWorker::NextRequestId() {
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch()).count();
	return config_.id + "-" + std::to_string(++request_seq_) + "-" + std::to_string(millis);
}

} // namespace Roundwatch
