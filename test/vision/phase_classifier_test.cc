#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cmath>
#include <fstream>
#include <limits>
#include "../../src/vision/phase_classifier.h"
#include "../../src/vision/screen_reader.h"
#include "../../src/common/errors.h"

using namespace Roundwatch;
using ::testing::_;
using ::testing::Return;

class MockClusterModel : public ClusterModel {
public:
    MOCK_METHOD(int, Predict, (const Rgb& sample), (const, override));
};

TEST(NearestCentroidModelTest, PicksClosestCentroid) {
    NearestCentroidModel model({Rgb{0, 0, 0}, Rgb{255, 0, 0}, Rgb{0, 0, 255}});
    EXPECT_EQ(model.Predict(Rgb{10, 5, 5}), 0);
    EXPECT_EQ(model.Predict(Rgb{240, 20, 10}), 1);
    EXPECT_EQ(model.Predict(Rgb{30, 30, 200}), 2);
}

TEST(PhaseClassifierTest, IdentityMappingByDefault) {
    auto model = std::make_shared<MockClusterModel>();
    EXPECT_CALL(*model, Predict(_)).WillOnce(Return(0)).WillOnce(Return(2)).WillOnce(Return(5));
    PhaseClassifier classifier(model);

    EXPECT_EQ(classifier.Classify(Rgb{}), Phase::kEnded);
    EXPECT_EQ(classifier.Classify(Rgb{}), Phase::kBettingReady);
    EXPECT_EQ(classifier.Classify(Rgb{}), Phase::kActiveHigh);
}

TEST(PhaseClassifierTest, OutOfRangeClusterIsUnknown) {
    auto model = std::make_shared<MockClusterModel>();
    EXPECT_CALL(*model, Predict(_)).WillOnce(Return(6)).WillOnce(Return(-1));
    PhaseClassifier classifier(model);

    EXPECT_EQ(classifier.Classify(Rgb{1, 2, 3}), Phase::kUnknown);
    EXPECT_EQ(classifier.Classify(Rgb{1, 2, 3}), Phase::kUnknown);
}

TEST(PhaseClassifierTest, NonFiniteSampleIsUnknownWithoutConsultingModel) {
    auto model = std::make_shared<MockClusterModel>();
    EXPECT_CALL(*model, Predict(_)).Times(0);
    PhaseClassifier classifier(model);

    EXPECT_EQ(classifier.Classify(Rgb{std::nan(""), 0, 0}), Phase::kUnknown);
    EXPECT_EQ(classifier.Classify(Rgb{0, std::numeric_limits<double>::infinity(), 0}), Phase::kUnknown);
}

TEST(PhaseClassifierTest, ExplicitMappingCorrectsShiftedClusters) {
    auto model = std::make_shared<MockClusterModel>();
    EXPECT_CALL(*model, Predict(_)).WillOnce(Return(0)).WillOnce(Return(1));
    PhaseClassifier classifier(model, {Phase::kWaiting, Phase::kBettingReady});

    EXPECT_EQ(classifier.Classify(Rgb{}), Phase::kWaiting);
    EXPECT_EQ(classifier.Classify(Rgb{}), Phase::kBettingReady);
}

class PhaseModelFileTest : public ::testing::Test {
protected:
    std::string WriteModel(const std::string& name, const std::string& content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(PhaseModelFileTest, LoadsCentroidsAndMapping) {
    std::string path = WriteModel("phase_model_ok.yaml", R"(
model:
  type: nearest_centroid
  centroids:
    - [200, 40, 40]
    - [90, 90, 90]
    - [40, 180, 70]
  cluster_to_phase: [0, 1, 2]
)");
    auto classifier = PhaseClassifier::LoadFromFile(path);
    ASSERT_NE(classifier, nullptr);
    EXPECT_EQ(classifier->Classify(Rgb{210, 35, 50}), Phase::kEnded);
    EXPECT_EQ(classifier->Classify(Rgb{85, 95, 92}), Phase::kWaiting);
    EXPECT_EQ(classifier->Classify(Rgb{45, 170, 60}), Phase::kBettingReady);
}

TEST_F(PhaseModelFileTest, UnmappedClusterClassifiesAsUnknown) {
    std::string path = WriteModel("phase_model_short.yaml", R"(
model:
  centroids: [[0, 0, 0], [255, 255, 255]]
  cluster_to_phase: [1]
)");
    auto classifier = PhaseClassifier::LoadFromFile(path);
    EXPECT_EQ(classifier->Classify(Rgb{0, 0, 0}), Phase::kWaiting);
    EXPECT_EQ(classifier->Classify(Rgb{250, 250, 250}), Phase::kUnknown);
}

TEST_F(PhaseModelFileTest, MissingOrMalformedArtifactIsModelLoadError) {
    EXPECT_THROW(PhaseClassifier::LoadFromFile(::testing::TempDir() + "does_not_exist.yaml"), ModelLoadError);
    EXPECT_THROW(PhaseClassifier::LoadFromFile(WriteModel("phase_model_empty.yaml", "model: {}\n")),
                 ModelLoadError);
    EXPECT_THROW(PhaseClassifier::LoadFromFile(WriteModel("phase_model_dims.yaml",
                                                          "model:\n  centroids: [[1, 2]]\n")),
                 ModelLoadError);
    EXPECT_THROW(PhaseClassifier::LoadFromFile(WriteModel("phase_model_badmap.yaml",
                                                          "model:\n  centroids: [[1, 2, 3]]\n  cluster_to_phase: [7]\n")),
                 ModelLoadError);
}

TEST(ParseNumberTest, StripsSeparatorsAndMultiplierSuffix) {
    EXPECT_DOUBLE_EQ(ParseNumber("1,234.50"), 1234.5);
    EXPECT_DOUBLE_EQ(ParseNumber(" 2.35x"), 2.35);
    EXPECT_DOUBLE_EQ(ParseNumber("35 000"), 35000);
    EXPECT_DOUBLE_EQ(ParseNumber("$ 12.5"), 12.5);
    EXPECT_EQ(ParseCount("1,204"), 1204);
}

TEST(ParsePlayerCountsTest, SplitsCurrentAndTotal) {
    PlayerCounts counts = ParsePlayerCounts("12/154");
    EXPECT_EQ(counts.current, 12);
    EXPECT_EQ(counts.total, 154);

    counts = ParsePlayerCounts(" 131/1,204 players");
    EXPECT_EQ(counts.current, 131);
    EXPECT_EQ(counts.total, 1204);
}

TEST(ParsePlayerCountsTest, BareCountIsBothValues) {
    PlayerCounts counts = ParsePlayerCounts("1,204");
    EXPECT_EQ(counts.current, 1204);
    EXPECT_EQ(counts.total, 1204);
}

TEST(ParsePlayerCountsTest, MalformedCountsAreReadErrors) {
    EXPECT_THROW(ParsePlayerCounts("-3/150"), ReadError);
    EXPECT_THROW(ParsePlayerCounts("12/-150"), ReadError);
    EXPECT_THROW(ParsePlayerCounts("1/2/3"), ReadError);
    EXPECT_THROW(ParsePlayerCounts("12/"), ReadError);
    EXPECT_THROW(ParsePlayerCounts("/154"), ReadError);
}

TEST(ParseNumberTest, TextWithoutNumberIsReadError) {
    EXPECT_THROW(ParseNumber(""), ReadError);
    EXPECT_THROW(ParseNumber("x"), ReadError);
    EXPECT_THROW(ParseNumber("1.2.3"), ReadError);
}
