#ifndef ROUNDWATCH_CONFIGURATION_H_
#define ROUNDWATCH_CONFIGURATION_H_

#include <string>
#include <map>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/types.h"

namespace YAML {
class Node;
}

namespace Roundwatch {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * One monitored game instance as written in the config file.
 * The layout defaults to the source id; an explicit bet_sequence wins over bet_style.
 * auto_stop defaults to runtime.default_auto_stop.
 */
struct SourceEntry {
    std::string id;
    std::string layout;
    std::string position;
    std::string bet_style;
    std::vector<int64_t> bet_sequence;
    double auto_stop = 2.35;
    double target_money = 35000;
};

/// Named martingale-style stake sequences shipped as defaults.
std::map<std::string, std::vector<int64_t>> DefaultBetStyles();

/**
 * Main configuration structure
 */
struct RoundwatchConfig {
    // Source worker loop
    struct Runtime {
        ConfigValue<int> poll_interval_ms{50, "ROUNDWATCH_POLL_INTERVAL_MS"};
        // Pause after a failed poll before the next attempt
        ConfigValue<int> error_backoff_ms{500, "ROUNDWATCH_ERROR_BACKOFF_MS"};
        ConfigValue<int> action_enqueue_timeout_ms{1000, "ROUNDWATCH_ACTION_ENQUEUE_TIMEOUT_MS"};
        // 0 = never block the worker on a full record channel
        ConfigValue<int> record_enqueue_timeout_ms{0, "ROUNDWATCH_RECORD_ENQUEUE_TIMEOUT_MS"};
        ConfigValue<int> balance_read_attempts{3, "ROUNDWATCH_BALANCE_READ_ATTEMPTS"};
        ConfigValue<int> balance_retry_delay_ms{500, "ROUNDWATCH_BALANCE_RETRY_DELAY_MS"};
        ConfigValue<int> worker_join_timeout_ms{5000, "ROUNDWATCH_WORKER_JOIN_TIMEOUT_MS"};
        ConfigValue<int> stats_interval_s{60, "ROUNDWATCH_STATS_INTERVAL_S"};
        // Applies to sources that do not set auto_stop
        ConfigValue<double> default_auto_stop{2.35, "ROUNDWATCH_DEFAULT_AUTO_STOP"};
    } runtime;

    struct Actuator {
        ConfigValue<int> cooldown_ms{2000, "ROUNDWATCH_ACTUATOR_COOLDOWN_MS"};
        ConfigValue<size_t> queue_capacity{100, "ROUNDWATCH_ACTION_QUEUE_CAPACITY"};
        ConfigValue<int> receive_poll_ms{100, "ROUNDWATCH_ACTUATOR_RECEIVE_POLL_MS"};
        ConfigValue<int> click_settle_ms{150, "ROUNDWATCH_ACTUATOR_CLICK_SETTLE_MS"};
        ConfigValue<int> select_settle_ms{100, "ROUNDWATCH_ACTUATOR_SELECT_SETTLE_MS"};
        ConfigValue<int> keystroke_interval_ms{50, "ROUNDWATCH_ACTUATOR_KEYSTROKE_INTERVAL_MS"};
        ConfigValue<int> type_settle_ms{200, "ROUNDWATCH_ACTUATOR_TYPE_SETTLE_MS"};
        ConfigValue<int> post_click_ms{100, "ROUNDWATCH_ACTUATOR_POST_CLICK_MS"};
        // Supported devices: uinput, dry_run
        ConfigValue<std::string> device{"uinput", "ROUNDWATCH_INPUT_DEVICE"};
        ConfigValue<std::string> uinput_path{"/dev/uinput", "ROUNDWATCH_UINPUT_PATH"};
        ConfigValue<int> screen_width{1920, "ROUNDWATCH_SCREEN_WIDTH"};
        ConfigValue<int> screen_height{1080, "ROUNDWATCH_SCREEN_HEIGHT"};
    } actuator;

    struct Persistence {
        ConfigValue<std::string> database_path{"data/databases/roundwatch.db", "ROUNDWATCH_DATABASE_PATH"};
        ConfigValue<size_t> batch_size{50, "ROUNDWATCH_BATCH_SIZE"};
        ConfigValue<int> batch_timeout_ms{1000, "ROUNDWATCH_BATCH_TIMEOUT_MS"};
        // Four sources polling at 200ms produce ~20 records/s; leave room for store stalls.
        ConfigValue<size_t> queue_capacity{10000, "ROUNDWATCH_RECORD_QUEUE_CAPACITY"};
        ConfigValue<size_t> queue_warning_depth{5000, "ROUNDWATCH_QUEUE_WARNING_DEPTH"};
        ConfigValue<size_t> queue_critical_depth{8000, "ROUNDWATCH_QUEUE_CRITICAL_DEPTH"};
        ConfigValue<int> stats_interval_s{30, "ROUNDWATCH_PERSISTENCE_STATS_INTERVAL_S"};
    } persistence;

    struct Classifier {
        ConfigValue<std::string> model_path{"data/models/game_phase_kmeans.yaml", "ROUNDWATCH_MODEL_PATH"};
    } classifier;

    // layout name -> role -> base region
    std::map<std::string, RegionMap> layouts;
    // position name -> offset
    std::map<std::string, PositionOffset> positions;
    std::map<std::string, std::vector<int64_t>> bet_styles = DefaultBetStyles();
    std::vector<SourceEntry> sources;
};

/**
 * Configuration manager
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const RoundwatchConfig& config() const { return config_; }
    RoundwatchConfig& config() { return config_; }

    // Explicit bet_sequence, else the named style. Throws ConfigError.
    std::vector<int64_t> resolveBetSequence(const SourceEntry& source) const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    RoundwatchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Roundwatch

#endif // ROUNDWATCH_CONFIGURATION_H_
