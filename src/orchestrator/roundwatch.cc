#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// System includes
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "actuator/input_device.h"
#include "actuator/uinput_device.h"
#include "common/configuration.h"
#include "common/errors.h"
#include "orchestrator.h"
#include "persistence/sqlite_round_store.h"
#include "vision/replay_screen_reader.h"

namespace {

// Blocks the handled signals in every thread and consumes them on one thread.
class SignalWatcher {
	public:
		explicit SignalWatcher(Roundwatch::Orchestrator& orchestrator) : orchestrator_(orchestrator) {
			thread_ = std::thread(&SignalWatcher::Run, this);
		}
		~SignalWatcher() {
			stop_ = true;
			if (thread_.joinable()) {
				thread_.join();
			}
		}

		static void BlockSignals() {
			sigset_t set = HandledSignals();
			pthread_sigmask(SIG_BLOCK, &set, nullptr);
		}

	private:
		static sigset_t HandledSignals() {
			sigset_t set;
			sigemptyset(&set);
			sigaddset(&set, SIGINT);
			sigaddset(&set, SIGTERM);
			sigaddset(&set, SIGUSR1);
			return set;
		}

		void Run() {
			sigset_t set = HandledSignals();
			struct timespec timeout = {0, 200 * 1000 * 1000};
			while (!stop_) {
				int sig = sigtimedwait(&set, nullptr, &timeout);
				if (sig == SIGINT || sig == SIGTERM) {
					LOG(INFO) << "Received " << strsignal(sig);
					orchestrator_.RequestShutdown();
				} else if (sig == SIGUSR1) {
					orchestrator_.Interrupt();
				}
			}
		}

		Roundwatch::Orchestrator& orchestrator_;
		std::atomic<bool> stop_{false};
		std::thread thread_;
};

std::unique_ptr<Roundwatch::InputDevice> MakeInputDevice(const Roundwatch::RoundwatchConfig& config, bool dry_run) {
	if (dry_run || config.actuator.device.get() == "dry_run") {
		LOG(WARNING) << "Dry run: input actions are only logged";
		return std::make_unique<Roundwatch::DryRunInputDevice>();
	}
	return std::make_unique<Roundwatch::UinputDevice>(config.actuator.uinput_path.get(),
			config.actuator.screen_width.get(), config.actuator.screen_height.get());
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("roundwatch", "Watches round-based game instances and bets on them");
	options.add_options()
		("c,config", "Configuration file", cxxopts::value<std::string>()->default_value("config/roundwatch.yaml"))
		("replay", "Replay a recorded screen trace instead of capturing the screen", cxxopts::value<std::string>())
		("dry_run", "Log input actions instead of performing them")
		("db", "Override the database path", cxxopts::value<std::string>())
		("model", "Override the phase model path", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Roundwatch::Configuration& configuration = Roundwatch::Configuration::getInstance();
	std::string config_path = arguments["config"].as<std::string>();
	if (!configuration.loadFromFile(config_path)) {
		LOG(ERROR) << "Invalid configuration " << config_path;
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "  " << error;
		}
		return EXIT_FAILURE;
	}
	if (arguments.count("db")) {
		configuration.config().persistence.database_path.set(arguments["db"].as<std::string>());
	}
	if (arguments.count("model")) {
		configuration.config().classifier.model_path.set(arguments["model"].as<std::string>());
	}
	const Roundwatch::RoundwatchConfig& config = configuration.config();

	// Signals must be blocked before any thread starts so only the watcher sees them.
	SignalWatcher::BlockSignals();

	// *************** Initialize components **********************
	std::unique_ptr<Roundwatch::Orchestrator> orchestrator;
	try {
		if (!arguments.count("replay")) {
			throw Roundwatch::ConfigError("Live screen capture is not available, pass --replay <trace>");
		}
		Roundwatch::ScreenReaderFactory reader_factory =
			Roundwatch::MakeReplayReaderFactory(Roundwatch::LoadReplayTraces(arguments["replay"].as<std::string>()));
		auto store = std::make_unique<Roundwatch::SqliteRoundStore>(config.persistence.database_path.get());
		auto device = MakeInputDevice(config, arguments.count("dry_run") > 0);
		orchestrator = std::make_unique<Roundwatch::Orchestrator>(configuration, std::move(reader_factory),
				std::move(device), std::move(store));
	} catch (const Roundwatch::RoundwatchError& e) {
		LOG(ERROR) << "Startup failed: " << e.what();
		return EXIT_FAILURE;
	}

	LOG(INFO) << "Starting roundwatch with " << config.sources.size() << " sources";
	{
		SignalWatcher watcher(*orchestrator);
		orchestrator->Start();
		orchestrator->Wait();
		orchestrator->Stop();
	}

	LOG(INFO) << "roundwatch exited cleanly";
	return EXIT_SUCCESS;
}
