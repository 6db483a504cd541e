#include "configuration.h"
#include <cstdlib>
#include <set>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace Roundwatch {

namespace {

template<typename T>
void SetIfPresent(const YAML::Node& node, const char* key, ConfigValue<T>& value) {
    if (node[key]) value.set(node[key].as<T>());
}

Region ParseRegion(const YAML::Node& node) {
    Region region;
    region.left = node["left"].as<int>();
    region.top = node["top"].as<int>();
    region.width = node["width"].as<int>();
    region.height = node["height"].as<int>();
    return region;
}

} // namespace

std::map<std::string, std::vector<int64_t>> DefaultBetStyles() {
    return {
        {"cautious", {10, 25, 50, 95, 170, 305, 540, 950, 1660, 2900}},
        {"balanced", {15, 30, 65, 125, 220, 395, 700, 1235, 2160, 3770}},
        {"risky",    {15, 40, 75, 140, 255, 460, 810, 1425, 2490, 4350}},
        {"crazy",    {20, 50, 100, 190, 340, 610, 1080, 1900, 3320, 5800}},
        {"addict",   {30, 75, 150, 285, 510, 915, 1620, 2850, 4980, 8700}},
        {"all-in",   {40, 95, 190, 360, 645, 1160, 2050, 3610, 6310, 11000}},
        {"uv",       {20, 40, 80, 150, 300, 600, 1200, 2100, 3700, 6600}},
    };
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    return validate();
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    return validate();
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["roundwatch"]) {
        LOG(WARNING) << "Configuration has no 'roundwatch' root, keeping defaults";
        return;
    }
    auto root = yaml["roundwatch"];

    // Runtime
    if (root["runtime"]) {
        auto runtime = root["runtime"];
        SetIfPresent(runtime, "poll_interval_ms", config_.runtime.poll_interval_ms);
        SetIfPresent(runtime, "error_backoff_ms", config_.runtime.error_backoff_ms);
        SetIfPresent(runtime, "action_enqueue_timeout_ms", config_.runtime.action_enqueue_timeout_ms);
        SetIfPresent(runtime, "record_enqueue_timeout_ms", config_.runtime.record_enqueue_timeout_ms);
        SetIfPresent(runtime, "balance_read_attempts", config_.runtime.balance_read_attempts);
        SetIfPresent(runtime, "balance_retry_delay_ms", config_.runtime.balance_retry_delay_ms);
        SetIfPresent(runtime, "worker_join_timeout_ms", config_.runtime.worker_join_timeout_ms);
        SetIfPresent(runtime, "stats_interval_s", config_.runtime.stats_interval_s);
        SetIfPresent(runtime, "default_auto_stop", config_.runtime.default_auto_stop);
    }

    // Actuator
    if (root["actuator"]) {
        auto actuator = root["actuator"];
        SetIfPresent(actuator, "cooldown_ms", config_.actuator.cooldown_ms);
        SetIfPresent(actuator, "queue_capacity", config_.actuator.queue_capacity);
        SetIfPresent(actuator, "receive_poll_ms", config_.actuator.receive_poll_ms);
        SetIfPresent(actuator, "click_settle_ms", config_.actuator.click_settle_ms);
        SetIfPresent(actuator, "select_settle_ms", config_.actuator.select_settle_ms);
        SetIfPresent(actuator, "keystroke_interval_ms", config_.actuator.keystroke_interval_ms);
        SetIfPresent(actuator, "type_settle_ms", config_.actuator.type_settle_ms);
        SetIfPresent(actuator, "post_click_ms", config_.actuator.post_click_ms);
        SetIfPresent(actuator, "device", config_.actuator.device);
        SetIfPresent(actuator, "uinput_path", config_.actuator.uinput_path);
        SetIfPresent(actuator, "screen_width", config_.actuator.screen_width);
        SetIfPresent(actuator, "screen_height", config_.actuator.screen_height);
    }

    // Persistence
    if (root["persistence"]) {
        auto persistence = root["persistence"];
        SetIfPresent(persistence, "database_path", config_.persistence.database_path);
        SetIfPresent(persistence, "batch_size", config_.persistence.batch_size);
        SetIfPresent(persistence, "batch_timeout_ms", config_.persistence.batch_timeout_ms);
        SetIfPresent(persistence, "queue_capacity", config_.persistence.queue_capacity);
        SetIfPresent(persistence, "queue_warning_depth", config_.persistence.queue_warning_depth);
        SetIfPresent(persistence, "queue_critical_depth", config_.persistence.queue_critical_depth);
        SetIfPresent(persistence, "stats_interval_s", config_.persistence.stats_interval_s);
    }

    // Classifier
    if (root["classifier"]) {
        SetIfPresent(root["classifier"], "model_path", config_.classifier.model_path);
    }

    // Layouts: base regions per screen setup
    if (root["layouts"]) {
        config_.layouts.clear();
        for (const auto& layout : root["layouts"]) {
            RegionMap regions;
            for (const auto& role : layout.second) {
                regions[role.first.as<std::string>()] = ParseRegion(role.second);
            }
            config_.layouts[layout.first.as<std::string>()] = regions;
        }
    }

    // Positions
    if (root["positions"]) {
        config_.positions.clear();
        for (const auto& position : root["positions"]) {
            PositionOffset offset;
            offset.left = position.second["left"].as<int>(0);
            offset.top = position.second["top"].as<int>(0);
            config_.positions[position.first.as<std::string>()] = offset;
        }
    }

    // Bet styles extend or replace the defaults by name
    if (root["bet_styles"]) {
        for (const auto& style : root["bet_styles"]) {
            config_.bet_styles[style.first.as<std::string>()] = style.second.as<std::vector<int64_t>>();
        }
    }

    // Sources
    if (root["sources"]) {
        config_.sources.clear();
        for (const auto& node : root["sources"]) {
            SourceEntry source;
            source.id = node["id"].as<std::string>();
            source.layout = node["layout"].as<std::string>(source.id);
            source.position = node["position"].as<std::string>("");
            source.bet_style = node["bet_style"].as<std::string>("balanced");
            if (node["bet_sequence"]) {
                source.bet_sequence = node["bet_sequence"].as<std::vector<int64_t>>();
            }
            source.auto_stop = node["auto_stop"].as<double>(config_.runtime.default_auto_stop.get());
            source.target_money = node["target_money"].as<double>(source.target_money);
            config_.sources.push_back(source);
        }
    }
}

std::vector<int64_t> Configuration::resolveBetSequence(const SourceEntry& source) const {
    if (!source.bet_sequence.empty()) {
        return source.bet_sequence;
    }
    auto it = config_.bet_styles.find(source.bet_style);
    if (it == config_.bet_styles.end()) {
        throw ConfigError("Unknown bet style '" + source.bet_style + "' for source " + source.id);
    }
    return it->second;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Timing
    if (config_.runtime.poll_interval_ms.get() < 1) {
        validation_errors_.push_back("Poll interval must be at least 1ms");
    }
    if (config_.runtime.balance_read_attempts.get() < 1) {
        validation_errors_.push_back("Balance read attempts must be at least 1");
    }
    if (config_.runtime.default_auto_stop.get() <= 1.0) {
        validation_errors_.push_back("Default auto_stop must be greater than 1.0");
    }
    if (config_.actuator.cooldown_ms.get() < 0) {
        validation_errors_.push_back("Actuator cooldown cannot be negative");
    }
    if (config_.actuator.receive_poll_ms.get() < 1) {
        validation_errors_.push_back("Actuator receive poll must be at least 1ms");
    }

    // Channels and batching
    if (config_.actuator.queue_capacity.get() < 1) {
        validation_errors_.push_back("Action queue capacity must be at least 1");
    }
    if (config_.persistence.queue_capacity.get() < 1) {
        validation_errors_.push_back("Record queue capacity must be at least 1");
    }
    if (config_.persistence.batch_size.get() < 1) {
        validation_errors_.push_back("Batch size must be at least 1");
    }
    if (config_.persistence.batch_timeout_ms.get() < 1) {
        validation_errors_.push_back("Batch timeout must be at least 1ms");
    }

    const std::string device = config_.actuator.device.get();
    if (device != "uinput" && device != "dry_run") {
        validation_errors_.push_back("Unknown input device '" + device + "' (expected uinput or dry_run)");
    }
    if (config_.actuator.screen_width.get() < 1 || config_.actuator.screen_height.get() < 1) {
        validation_errors_.push_back("Screen size must be positive");
    }

    // Sources
    if (config_.sources.empty()) {
        validation_errors_.push_back("At least one source must be configured");
    }
    std::set<std::string> ids;
    for (const auto& source : config_.sources) {
        if (source.id.empty()) {
            validation_errors_.push_back("Source id cannot be empty");
            continue;
        }
        if (!ids.insert(source.id).second) {
            validation_errors_.push_back("Duplicate source id " + source.id);
        }
        if (source.position.empty()) {
            validation_errors_.push_back("Source " + source.id + " has no position");
        }
        if (source.auto_stop <= 1.0) {
            validation_errors_.push_back("Source " + source.id + " auto_stop must be greater than 1.0");
        }
        std::vector<int64_t> sequence;
        try {
            sequence = resolveBetSequence(source);
        } catch (const ConfigError& e) {
            validation_errors_.push_back(e.what());
            continue;
        }
        if (sequence.empty()) {
            validation_errors_.push_back("Source " + source.id + " has an empty bet sequence");
        }
        for (int64_t stake : sequence) {
            if (stake <= 0) {
                validation_errors_.push_back("Source " + source.id + " has a non-positive stake");
                break;
            }
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Roundwatch
