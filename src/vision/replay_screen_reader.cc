#include "replay_screen_reader.h"

#include <memory>
#include <utility>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace Roundwatch {

namespace {

constexpr char kDefaultTrace[] = "default";

std::map<std::string, ReplayTrace> ParseTraces(const YAML::Node& root, const std::string& origin) {
    auto sources = root["sources"];
    if (!sources || !sources.IsMap()) {
        throw ConfigError("Replay trace " + origin + " has no 'sources' map");
    }

    std::map<std::string, ReplayTrace> traces;
    try {
        for (const auto& entry : sources) {
            std::string id = entry.first.as<std::string>();
            const YAML::Node& node = entry.second;

            ReplayTrace trace;
            trace.loop = node["loop"].as<bool>(false);
            if (!node["frames"] || !node["frames"].IsSequence()) {
                throw ConfigError("Replay trace " + origin + ": source " + id + " has no frames");
            }
            for (const auto& frame_node : node["frames"]) {
                ReplayFrame frame;
                auto rgb = frame_node["phase"].as<std::vector<double>>();
                if (rgb.size() != 3) {
                    throw ConfigError("Replay trace " + origin + ": phase color must have 3 components");
                }
                frame.phase = Rgb{rgb[0], rgb[1], rgb[2]};
                for (const auto& field : frame_node) {
                    std::string role = field.first.as<std::string>();
                    if (role == kPhaseRole) {
                        continue;
                    }
                    frame.text[role] = field.second.as<std::string>();
                }
                trace.frames.push_back(std::move(frame));
            }
            if (trace.frames.empty()) {
                throw ConfigError("Replay trace " + origin + ": source " + id + " has no frames");
            }
            traces[id] = std::move(trace);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed replay trace " + origin + ": " + e.what());
    }
    return traces;
}

} // namespace

std::map<std::string, ReplayTrace> LoadReplayTraces(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot load replay trace " + path + ": " + e.what());
    }
    return ParseTraces(root, path);
}

std::map<std::string, ReplayTrace> LoadReplayTracesFromString(const std::string& yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Cannot parse replay trace: ") + e.what());
    }
    return ParseTraces(root, "<string>");
}

ReplayScreenReader::ReplayScreenReader(std::string source_id, RegionMap regions, ReplayTrace trace)
    : source_id_(std::move(source_id)), regions_(std::move(regions)), trace_(std::move(trace)) {}

Rgb ReplayScreenReader::SampleColor(const Region&) {
    if (next_frame_ >= trace_.frames.size()) {
        if (!trace_.loop || trace_.frames.empty()) {
            throw ReadError("Replay trace for " + source_id_ + " is exhausted");
        }
        next_frame_ = 0;
    }
    current_frame_ = next_frame_++;
    frames_played_++;
    return trace_.frames[*current_frame_].phase;
}

std::string ReplayScreenReader::ReadText(const Region& region) {
    if (trace_.frames.empty()) {
        throw ReadError("Replay trace for " + source_id_ + " is empty");
    }
    std::string role = RoleOf(region);
    const ReplayFrame& frame = trace_.frames[current_frame_.value_or(0)];
    auto it = frame.text.find(role);
    if (it == frame.text.end()) {
        throw ReadError("Replay frame for " + source_id_ + " has no '" + role + "' text");
    }
    return it->second;
}

std::string ReplayScreenReader::RoleOf(const Region& region) const {
    for (const auto& [role, candidate] : regions_) {
        if (candidate == region) {
            return role;
        }
    }
    throw ReadError("Region (" + std::to_string(region.left) + "," + std::to_string(region.top) +
                    ") is not part of source " + source_id_);
}

ScreenReaderFactory MakeReplayReaderFactory(std::map<std::string, ReplayTrace> traces) {
    auto shared_traces = std::make_shared<const std::map<std::string, ReplayTrace>>(std::move(traces));
    return [shared_traces](const std::string& source_id, const RegionMap& regions) {
        auto it = shared_traces->find(source_id);
        if (it == shared_traces->end()) {
            it = shared_traces->find(kDefaultTrace);
        }
        if (it == shared_traces->end()) {
            throw ConfigError("No replay trace for source " + source_id);
        }
        VLOG(1) << "[ReplayScreenReader]: " << source_id << " replays " << it->second.frames.size()
                << " frames" << (it->second.loop ? " in a loop" : "");
        return std::unique_ptr<ScreenReader>(
            std::make_unique<ReplayScreenReader>(source_id, regions, it->second));
    };
}

} // namespace Roundwatch
