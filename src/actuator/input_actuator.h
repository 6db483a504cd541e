#ifndef ROUNDWATCH_ACTUATOR_INPUT_ACTUATOR_H_
#define ROUNDWATCH_ACTUATOR_INPUT_ACTUATOR_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "actuator/input_device.h"
#include "common/channels.h"

namespace Roundwatch {

struct ActuatorOptions {
	std::chrono::milliseconds cooldown{2000};
	std::chrono::milliseconds receive_poll{100};
	std::chrono::milliseconds click_settle{150};
	std::chrono::milliseconds select_settle{100};
	std::chrono::milliseconds keystroke_interval{50};
	std::chrono::milliseconds type_settle{200};
	std::chrono::milliseconds post_click{100};
};

/**
 * Sole writer of pointer and keyboard state.
 *
 * One thread drains the shared action channel and executes one request at a
 * time: click the stake field, select all, type the stake, click play. After
 * each request it cools down before taking the next. A failed or interrupted
 * request is counted and skipped, never retried.
 */
class InputActuator {
public:
	InputActuator(std::shared_ptr<ActionQueue> queue,
			std::unique_ptr<InputDevice> device,
			ActuatorOptions options = ActuatorOptions());
	~InputActuator();

	InputActuator(const InputActuator&) = delete;
	InputActuator& operator=(const InputActuator&) = delete;

	void Start();
	/// Wakes the cooldown, joins the thread and discards requests still queued.
	void Stop();
	/// Safety interrupt. Aborts the action in progress at its next sub-step,
	/// or the next action taken when the actuator is idle.
	void Interrupt();

	uint64_t executed() const { return executed_.load(); }
	uint64_t failed() const { return failed_.load(); }
	const std::string& device_name() const { return device_name_; }

private:
	void Run();
	bool Execute(const ActionRequest& req);
	// Waits for the sub-step delay, then throws ActuatorError on interrupt or stop.
	void Pause(std::chrono::milliseconds delay);
	void Cooldown();
	bool ShouldAbort() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

	std::shared_ptr<ActionQueue> queue_;
	std::unique_ptr<InputDevice> device_;
	std::string device_name_;
	ActuatorOptions options_;

	std::thread thread_;
	mutable absl::Mutex mu_;
	bool stop_requested_ ABSL_GUARDED_BY(mu_) = false;
	bool interrupted_ ABSL_GUARDED_BY(mu_) = false;

	std::atomic<uint64_t> executed_{0};
	std::atomic<uint64_t> failed_{0};
};

} // namespace Roundwatch

#endif // ROUNDWATCH_ACTUATOR_INPUT_ACTUATOR_H_
