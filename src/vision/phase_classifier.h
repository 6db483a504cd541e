#ifndef ROUNDWATCH_VISION_PHASE_CLASSIFIER_H_
#define ROUNDWATCH_VISION_PHASE_CLASSIFIER_H_

#include <memory>
#include <string>
#include <vector>

#include "common/types.h"

namespace Roundwatch {

/**
 * Pre-trained clustering model: color vector -> cluster id.
 * Implementations must be safe for concurrent Predict() calls.
 */
class ClusterModel {
public:
    virtual ~ClusterModel() = default;
    virtual int Predict(const Rgb& sample) const = 0;
};

/// K-means style model: assigns the index of the closest centroid (squared euclidean).
class NearestCentroidModel : public ClusterModel {
public:
    explicit NearestCentroidModel(std::vector<Rgb> centroids);

    int Predict(const Rgb& sample) const override;
    size_t num_clusters() const { return centroids_.size(); }

private:
    std::vector<Rgb> centroids_;
};

/**
 * Maps a sampled color to a round phase through an injected model.
 *
 * cluster_to_phase[i] is the phase for cluster id i. Trained models have
 * been seen to be off by one against the phase enumeration, so the mapping
 * lives in the model artifact rather than being assumed.
 */
class PhaseClassifier {
public:
    /// Identity mapping: cluster id i is Phase(i).
    explicit PhaseClassifier(std::shared_ptr<const ClusterModel> model);
    PhaseClassifier(std::shared_ptr<const ClusterModel> model, std::vector<Phase> cluster_to_phase);

    /**
     * Model artifact (YAML):
     *   model:
     *     type: nearest_centroid
     *     centroids: [[r, g, b], ...]
     *     cluster_to_phase: [0, 1, 2, 3, 4, 5]   # optional
     * Throws ModelLoadError.
     */
    static std::shared_ptr<const PhaseClassifier> LoadFromFile(const std::string& path);

    /// Returns Phase::kUnknown for non-finite input or an out-of-range cluster id.
    Phase Classify(const Rgb& sample) const;

private:
    std::shared_ptr<const ClusterModel> model_;
    std::vector<Phase> cluster_to_phase_;
};

} // namespace Roundwatch

#endif // ROUNDWATCH_VISION_PHASE_CLASSIFIER_H_
