#include "input_actuator.h"

#include <string>
#include <utility>
#include <glog/logging.h>

#include "absl/time/time.h"
#include "common/errors.h"

namespace Roundwatch {

InputActuator::InputActuator(std::shared_ptr<ActionQueue> queue,
		std::unique_ptr<InputDevice> device,
		ActuatorOptions options):
	queue_(std::move(queue)),
	device_(std::move(device)),
	options_(options){
	if (!queue_ || !device_) {
		throw ActuatorError("Input actuator needs a queue and a device");
	}
	device_name_ = device_->name();
}

InputActuator::~InputActuator() {
	Stop();
}

void InputActuator::Start() {
	thread_ = std::thread(&InputActuator::Run, this);
	LOG(INFO) << "[InputActuator]: Started on " << device_name_ << " device, cooldown "
		<< options_.cooldown.count() << "ms";
}

void InputActuator::Stop() {
	{
		absl::MutexLock lock(&mu_);
		if (stop_requested_ && !thread_.joinable()) {
			return;
		}
		stop_requested_ = true;
	}
	WakeConsumer(queue_);
	if (thread_.joinable()) {
		thread_.join();
	}

	size_t discarded = 0;
	std::optional<ActionRequest> maybe_req;
	while (queue_->read(maybe_req)) {
		if (maybe_req.has_value()) {
			discarded++;
		}
	}
	LOG(INFO) << "[InputActuator]: Stopped. executed=" << executed_.load() << " failed=" << failed_.load()
		<< " discarded=" << discarded;
}

void InputActuator::Interrupt() {
	absl::MutexLock lock(&mu_);
	interrupted_ = true;
	LOG(WARNING) << "[InputActuator]: Safety interrupt raised";
}

bool InputActuator::ShouldAbort() const {
	return stop_requested_ || interrupted_;
}

void InputActuator::Run() {
	while (true) {
		{
			absl::MutexLock lock(&mu_);
			if (stop_requested_) {
				break;
			}
		}

		std::optional<ActionRequest> maybe_req;
		if (!DequeueAction(queue_, &maybe_req, options_.receive_poll)) {
			continue;
		}
		if (!maybe_req.has_value()) {
			// Stop sentinel, the flag is checked at the top of the loop.
			continue;
		}

		if (Execute(*maybe_req)) {
			executed_++;
		} else {
			failed_++;
		}
		Cooldown();
	}
}

bool InputActuator::Execute(const ActionRequest& req) {
	VLOG(1) << "[InputActuator]: Executing " << req.request_id << " for " << req.source_id
		<< " stake " << req.stake_amount;

	bool placed = true;
	try {
		Pause(std::chrono::milliseconds(0));
		device_->Click(req.amount_field);
		Pause(options_.click_settle);
		device_->SelectAll();
		Pause(options_.select_settle);
		for (char key : std::to_string(req.stake_amount)) {
			device_->TypeKey(key);
			Pause(options_.keystroke_interval);
		}
		Pause(options_.type_settle);
		device_->Click(req.play_button);
		Pause(options_.post_click);
	} catch (const ActuatorError& e) {
		LOG(ERROR) << "[InputActuator]: " << req.request_id << " for " << req.source_id
			<< " aborted: " << e.what();
		placed = false;
	}

	// An interrupt raised while idle aborts the next request, so clear only after one.
	{
		absl::MutexLock lock(&mu_);
		interrupted_ = false;
	}
	if (placed) {
		LOG(INFO) << "[InputActuator]: Placed " << req.stake_amount << " for " << req.source_id;
	}
	return placed;
}

void InputActuator::Pause(std::chrono::milliseconds delay) {
	absl::MutexLock lock(&mu_);
	if (delay.count() > 0) {
		mu_.AwaitWithTimeout(absl::Condition(this, &InputActuator::ShouldAbort), absl::FromChrono(delay));
	}
	if (interrupted_) {
		throw ActuatorError("safety interrupt");
	}
	if (stop_requested_) {
		throw ActuatorError("actuator stopping");
	}
}

void InputActuator::Cooldown() {
	absl::MutexLock lock(&mu_);
	mu_.AwaitWithTimeout(absl::Condition(&stop_requested_), absl::FromChrono(options_.cooldown));
}

} // namespace Roundwatch
