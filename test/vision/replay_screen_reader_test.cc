#include <gtest/gtest.h>
#include "../../src/vision/replay_screen_reader.h"
#include "../../src/common/errors.h"

using namespace Roundwatch;

namespace {

const char kTrace[] = R"(
sources:
  default:
    frames:
      - {phase: [1, 2, 3], my_money: "1,000"}
      - {phase: [4, 5, 6], score: "1.50x", other_count: 12}
  looping:
    loop: true
    frames:
      - {phase: [7, 7, 7], score: "2.00x"}
)";

RegionMap Regions() {
    return {
        {kPhaseRole, Region{0, 0, 5, 5}},
        {kScoreRole, Region{10, 10, 50, 20}},
        {kMyMoneyRole, Region{70, 10, 50, 20}},
        {kOtherCountRole, Region{10, 40, 50, 20}},
    };
}

} // namespace

class ReplayScreenReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        traces_ = LoadReplayTracesFromString(kTrace);
    }

    std::map<std::string, ReplayTrace> traces_;
};

TEST_F(ReplayScreenReaderTest, ParsesFramesPerSource) {
    ASSERT_EQ(traces_.size(), 2u);
    EXPECT_EQ(traces_.at("default").frames.size(), 2u);
    EXPECT_FALSE(traces_.at("default").loop);
    EXPECT_TRUE(traces_.at("looping").loop);
    EXPECT_EQ(traces_.at("default").frames[1].text.at(kOtherCountRole), "12");
}

TEST_F(ReplayScreenReaderTest, EachColorSampleAdvancesOneFrame) {
    RegionMap regions = Regions();
    ReplayScreenReader reader("s1", regions, traces_.at("default"));

    // Text before the first sample comes from the first frame.
    EXPECT_EQ(reader.ReadText(regions.at(kMyMoneyRole)), "1,000");

    Rgb first = reader.SampleColor(regions.at(kPhaseRole));
    EXPECT_DOUBLE_EQ(first.r, 1);
    Rgb second = reader.SampleColor(regions.at(kPhaseRole));
    EXPECT_DOUBLE_EQ(second.b, 6);
    EXPECT_EQ(reader.ReadText(regions.at(kScoreRole)), "1.50x");
    EXPECT_EQ(reader.frames_played(), 2u);
    EXPECT_TRUE(reader.exhausted());
}

TEST_F(ReplayScreenReaderTest, ExhaustedTraceAndMissingTextAreReadErrors) {
    RegionMap regions = Regions();
    ReplayScreenReader reader("s1", regions, traces_.at("default"));
    reader.SampleColor(regions.at(kPhaseRole));
    EXPECT_THROW(reader.ReadText(regions.at(kScoreRole)), ReadError);
    EXPECT_THROW(reader.ReadText(Region{999, 999, 1, 1}), ReadError);

    reader.SampleColor(regions.at(kPhaseRole));
    EXPECT_THROW(reader.SampleColor(regions.at(kPhaseRole)), ReadError);
}

TEST_F(ReplayScreenReaderTest, LoopingTraceStartsOver) {
    RegionMap regions = Regions();
    ReplayScreenReader reader("s1", regions, traces_.at("looping"));
    for (int i = 0; i < 5; i++) {
        EXPECT_DOUBLE_EQ(reader.SampleColor(regions.at(kPhaseRole)).g, 7);
    }
    EXPECT_FALSE(reader.exhausted());
}

TEST_F(ReplayScreenReaderTest, FactoryFallsBackToDefaultTrace) {
    ScreenReaderFactory factory = MakeReplayReaderFactory(traces_);
    RegionMap regions = Regions();

    auto looping = factory("looping", regions);
    EXPECT_DOUBLE_EQ(looping->SampleColor(regions.at(kPhaseRole)).r, 7);
    auto other = factory("bookmaker9", regions);
    EXPECT_DOUBLE_EQ(other->SampleColor(regions.at(kPhaseRole)).r, 1);
}

TEST(ReplayTraceLoadTest, RejectsMalformedTraces) {
    EXPECT_THROW(LoadReplayTracesFromString("frames: []"), ConfigError);
    EXPECT_THROW(LoadReplayTracesFromString("sources:\n  a:\n    frames: []\n"), ConfigError);
    EXPECT_THROW(LoadReplayTracesFromString("sources:\n  a:\n    frames:\n      - {phase: [1, 2]}\n"), ConfigError);
    EXPECT_THROW(LoadReplayTraces(::testing::TempDir() + "missing_trace.yaml"), ConfigError);

    auto traces = LoadReplayTracesFromString("sources:\n  a:\n    frames:\n      - {phase: [1, 2, 3]}\n");
    ScreenReaderFactory factory = MakeReplayReaderFactory(traces);
    EXPECT_THROW(factory("b", RegionMap()), ConfigError);
}
