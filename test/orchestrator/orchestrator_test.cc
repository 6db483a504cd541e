#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <thread>
#include "../../src/orchestrator/orchestrator.h"
#include "../../src/persistence/sqlite_round_store.h"
#include "../../src/vision/replay_screen_reader.h"
#include "../../src/vision/region_resolver.h"
#include "../../src/common/errors.h"

using namespace Roundwatch;

namespace {

// Colors are the centroids of the default phase model.
const char kTwoRounds[] = R"(
sources:
  default:
    frames:
      - {phase: [90, 90, 90], my_money: "1,000.00"}
      - {phase: [40, 180, 70], my_money: "1,000.00"}
      - {phase: [50, 90, 200], score: "1.12x", other_count: "12/154", other_money: "2,310.00"}
      - {phase: [50, 90, 200], score: "1.40x", other_count: "87/150", other_money: "2,950.50"}
      - {phase: [200, 40, 40], score: "1.40x", other_count: "87/150", other_money: "3,120.00", my_money: "975.00"}
      - {phase: [90, 90, 90], my_money: "975.00"}
      - {phase: [40, 180, 70], my_money: "975.00"}
      - {phase: [50, 90, 200], score: "1.55x", other_count: "9/162", other_money: "1,980.00"}
      - {phase: [150, 60, 200], score: "2.40x", other_count: "66/140", other_money: "4,400.00"}
      - {phase: [200, 40, 40], score: "3.10x", other_count: "131/131", other_money: "5,600.00", my_money: "1,042.50"}
)";

const char kModel[] = R"(
model:
  centroids:
    - [200, 40, 40]
    - [90, 90, 90]
    - [40, 180, 70]
    - [50, 90, 200]
    - [150, 60, 200]
    - [230, 180, 40]
)";

RegionMap Layout() {
    RegionMap regions;
    int i = 0;
    for (const auto& role : RequiredRoles()) {
        regions[role] = Region{20 + 60 * i, 100, 50, 30};
        i++;
    }
    return regions;
}

std::string WriteFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}

} // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = ::testing::TempDir() + "roundwatch_orchestrator_" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".db";
        RemoveFiles();
        model_path_ = WriteFile("roundwatch_orchestrator_model.yaml", kModel);

        options_.worker.poll_interval = std::chrono::milliseconds(2);
        options_.worker.error_backoff = std::chrono::milliseconds(5);
        options_.worker.balance_retry_delay = std::chrono::milliseconds(0);
        options_.actuator.cooldown = std::chrono::milliseconds(10);
        options_.actuator.receive_poll = std::chrono::milliseconds(10);
        options_.actuator.click_settle = std::chrono::milliseconds(0);
        options_.actuator.select_settle = std::chrono::milliseconds(0);
        options_.actuator.keystroke_interval = std::chrono::milliseconds(0);
        options_.actuator.type_settle = std::chrono::milliseconds(0);
        options_.actuator.post_click = std::chrono::milliseconds(0);
        options_.persistence.batch_size = 50;
        options_.persistence.batch_timeout = std::chrono::milliseconds(100);
        options_.worker_join_timeout = std::chrono::milliseconds(2000);
    }

    void TearDown() override {
        RemoveFiles();
    }

    void RemoveFiles() {
        std::remove(db_path_.c_str());
        std::remove((db_path_ + "-wal").c_str());
        std::remove((db_path_ + "-shm").c_str());
    }

    std::vector<SourceConfig> Sources(double target_money) {
        std::vector<SourceConfig> sources;
        int offset = 0;
        for (const char* id : {"bookmaker1", "bookmaker2", "bookmaker3"}) {
            SourceConfig source;
            source.id = id;
            source.regions = ApplyOffset(Layout(), PositionOffset{offset, 0});
            source.bet_sequence = {25, 50, 100, 200};
            source.auto_stop = 2.35;
            source.target_money = target_money;
            sources.push_back(source);
            offset += 640;
        }
        return sources;
    }

    std::unique_ptr<Orchestrator> MakeOrchestrator(double target_money) {
        return std::make_unique<Orchestrator>(Sources(target_money), PhaseClassifier::LoadFromFile(model_path_),
                                              MakeReplayReaderFactory(LoadReplayTracesFromString(kTwoRounds)),
                                              std::make_unique<DryRunInputDevice>(),
                                              std::make_unique<SqliteRoundStore>(db_path_), options_);
    }

    std::string db_path_;
    std::string model_path_;
    OrchestratorOptions options_;
};

TEST_F(OrchestratorTest, ReplayedRoundsAreBetAndPersisted) {
    auto orchestrator = MakeOrchestrator(0);
    orchestrator->Start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    auto done = [&] {
        for (const auto& worker : orchestrator->workers()) {
            if (worker->stats().records_enqueued < 2) return false;
        }
        return orchestrator->actuator().executed() >= 6;
    };
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(done());

    orchestrator->RequestShutdown();
    orchestrator->Wait();
    orchestrator->Stop();

    for (const auto& worker : orchestrator->workers()) {
        EXPECT_TRUE(worker->finished());
        EXPECT_EQ(worker->stats().actions_enqueued, 2u);
        EXPECT_EQ(worker->stats().rounds_played, 2u);
    }
    EXPECT_EQ(orchestrator->actuator().failed(), 0u);
    EXPECT_EQ(orchestrator->persistence_stats().total_processed, 6u);

    SqliteRoundStore store(db_path_);
    EXPECT_EQ(store.CountRounds(), 6);
    EXPECT_EQ(store.CountRounds("bookmaker2"), 2);
    EXPECT_EQ(store.CountEarnings(), 6);
}

TEST_F(OrchestratorTest, WaitReturnsWhenEverySourceReachedItsTarget) {
    // 1,000 start + 40 target is passed by the 1,042.50 balance after round two.
    auto orchestrator = MakeOrchestrator(40);
    orchestrator->Start();
    orchestrator->Wait();
    orchestrator->Stop();

    for (const auto& worker : orchestrator->workers()) {
        EXPECT_TRUE(worker->finished());
        EXPECT_TRUE(worker->TargetReached());
    }
    SqliteRoundStore store(db_path_);
    EXPECT_EQ(store.CountRounds(), 6);
}

TEST_F(OrchestratorTest, StopWithoutStartReleasesEverything) {
    auto orchestrator = MakeOrchestrator(0);
    orchestrator->Stop();
    orchestrator->Stop();
    EXPECT_EQ(orchestrator->persistence_stats().total_batches, 0u);
}

TEST_F(OrchestratorTest, BuildsSourcesFromConfiguration) {
    Configuration configuration;
    std::string yaml = std::string(R"(
roundwatch:
  classifier:
    model_path: ")") + model_path_ + R"("
  layouts:
    three_up:
      phase:       {left: 20,  top: 820, width: 40,  height: 12}
      score:       {left: 180, top: 300, width: 280, height: 90}
      my_money:    {left: 430, top: 40,  width: 180, height: 30}
      other_count: {left: 20,  top: 120, width: 120, height: 28}
      other_money: {left: 150, top: 120, width: 160, height: 28}
      play_amount: {left: 120, top: 900, width: 140, height: 40}
      play_button: {left: 360, top: 890, width: 220, height: 70}
  positions:
    Left: {left: 0, top: 0}
    Right: {left: 1280, top: 0}
  sources:
    - {id: a, layout: three_up, position: Left, bet_style: cautious}
    - {id: b, layout: three_up, position: Right, bet_sequence: [5, 10]}
)";
    ASSERT_TRUE(configuration.loadFromString(yaml));

    auto sources = BuildSourceConfigs(configuration);
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(sources[1].regions.at(kPlayButtonRole), (Region{1640, 890, 220, 70}));
    EXPECT_EQ(sources[1].bet_sequence, (std::vector<int64_t>{5, 10}));
    EXPECT_EQ(sources[0].bet_sequence.front(), 10);

    Orchestrator orchestrator(configuration, MakeReplayReaderFactory(LoadReplayTracesFromString(kTwoRounds)),
                              std::make_unique<DryRunInputDevice>(), std::make_unique<SqliteRoundStore>(db_path_));
    EXPECT_EQ(orchestrator.workers().size(), 2u);
}

TEST_F(OrchestratorTest, StartupFailsOnBadModelOrUnknownPosition) {
    Configuration configuration;
    ASSERT_TRUE(configuration.loadFromString(R"(
roundwatch:
  classifier:
    model_path: "/nonexistent/model.yaml"
  layouts:
    solo:
      phase: {left: 0, top: 0, width: 1, height: 1}
  positions:
    Left: {left: 0, top: 0}
  sources:
    - {id: a, layout: solo, position: Left}
)"));
    // The layout lacks most roles.
    EXPECT_THROW(BuildSourceConfigs(configuration), ConfigError);

    configuration.config().layouts["solo"] = Layout();
    EXPECT_THROW(std::make_unique<Orchestrator>(configuration,
                                                MakeReplayReaderFactory(LoadReplayTracesFromString(kTwoRounds)),
                                                std::make_unique<DryRunInputDevice>(),
                                                std::make_unique<SqliteRoundStore>(":memory:")),
                 ModelLoadError);

    configuration.config().sources[0].position = "Middle";
    EXPECT_THROW(BuildSourceConfigs(configuration), ConfigError);
}
