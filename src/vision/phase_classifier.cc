#include "phase_classifier.h"

#include <cmath>
#include <limits>
#include <utility>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace Roundwatch {

namespace {

bool IsValidPhaseId(int id) {
    return id >= 0 && id < kNumPhases;
}

std::vector<Phase> IdentityMapping() {
    std::vector<Phase> mapping;
    for (int i = 0; i < kNumPhases; i++) {
        mapping.push_back(static_cast<Phase>(i));
    }
    return mapping;
}

} // namespace

NearestCentroidModel::NearestCentroidModel(std::vector<Rgb> centroids)
    : centroids_(std::move(centroids)) {}

int NearestCentroidModel::Predict(const Rgb& sample) const {
    int best = -1;
    double best_distance = std::numeric_limits<double>::max();
    for (size_t i = 0; i < centroids_.size(); i++) {
        const Rgb& c = centroids_[i];
        double dr = sample.r - c.r;
        double dg = sample.g - c.g;
        double db = sample.b - c.b;
        double distance = dr * dr + dg * dg + db * db;
        if (distance < best_distance) {
            best_distance = distance;
            best = static_cast<int>(i);
        }
    }
    return best;
}

PhaseClassifier::PhaseClassifier(std::shared_ptr<const ClusterModel> model)
    : PhaseClassifier(std::move(model), IdentityMapping()) {}

PhaseClassifier::PhaseClassifier(std::shared_ptr<const ClusterModel> model,
                                 std::vector<Phase> cluster_to_phase)
    : model_(std::move(model)), cluster_to_phase_(std::move(cluster_to_phase)) {
    if (!model_) {
        throw ModelLoadError("Phase classifier requires a model");
    }
}

std::shared_ptr<const PhaseClassifier> PhaseClassifier::LoadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Cannot load phase model " + path + ": " + e.what());
    }

    auto model = root["model"];
    if (!model || !model["centroids"] || !model["centroids"].IsSequence()) {
        throw ModelLoadError("Phase model " + path + " has no centroids");
    }

    std::vector<Rgb> centroids;
    std::vector<Phase> mapping;
    try {
        std::string type = model["type"].as<std::string>("nearest_centroid");
        if (type != "nearest_centroid" && type != "kmeans") {
            throw ModelLoadError("Phase model " + path + " has unsupported type " + type);
        }
        for (const auto& node : model["centroids"]) {
            auto rgb = node.as<std::vector<double>>();
            if (rgb.size() != 3) {
                throw ModelLoadError("Phase model " + path + ": centroid must have 3 components");
            }
            centroids.push_back(Rgb{rgb[0], rgb[1], rgb[2]});
        }
        if (model["cluster_to_phase"]) {
            for (int id : model["cluster_to_phase"].as<std::vector<int>>()) {
                if (!IsValidPhaseId(id)) {
                    throw ModelLoadError("Phase model " + path + " maps a cluster to invalid phase " +
                                         std::to_string(id));
                }
                mapping.push_back(static_cast<Phase>(id));
            }
        } else {
            mapping = IdentityMapping();
        }
    } catch (const YAML::Exception& e) {
        throw ModelLoadError("Malformed phase model " + path + ": " + e.what());
    }

    if (centroids.empty()) {
        throw ModelLoadError("Phase model " + path + " has no centroids");
    }
    if (mapping.size() < centroids.size()) {
        LOG(WARNING) << "[PhaseClassifier]: " << path << " maps " << mapping.size() << " of "
                     << centroids.size() << " clusters, the rest classify as UNKNOWN";
    }

    LOG(INFO) << "[PhaseClassifier]: Loaded " << centroids.size() << " centroids from " << path;
    auto cluster_model = std::make_shared<const NearestCentroidModel>(std::move(centroids));
    return std::make_shared<const PhaseClassifier>(cluster_model, std::move(mapping));
}

Phase PhaseClassifier::Classify(const Rgb& sample) const {
    if (!std::isfinite(sample.r) || !std::isfinite(sample.g) || !std::isfinite(sample.b)) {
        return Phase::kUnknown;
    }
    int cluster = model_->Predict(sample);
    if (cluster < 0 || static_cast<size_t>(cluster) >= cluster_to_phase_.size()) {
        VLOG(2) << "[PhaseClassifier]: cluster " << cluster << " outside phase mapping";
        return Phase::kUnknown;
    }
    return cluster_to_phase_[cluster];
}

} // namespace Roundwatch
