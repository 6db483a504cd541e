#ifndef ROUNDWATCH_COMMON_TYPES_H_
#define ROUNDWATCH_COMMON_TYPES_H_

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Roundwatch {

/// Integer pixel rectangle on screen. Immutable once computed.
struct Region {
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;

    bool operator==(const Region& other) const {
        return left == other.left && top == other.top &&
               width == other.width && height == other.height;
    }
    bool operator!=(const Region& other) const { return !(*this == other); }
};

/// Named displacement applied to every region of a layout.
struct PositionOffset {
    int left = 0;
    int top = 0;
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
};

inline Point Center(const Region& region) {
    return Point{region.left + region.width / 2, region.top + region.height / 2};
}

/// role -> region
using RegionMap = std::map<std::string, Region>;

// Region roles
constexpr char kPhaseRole[] = "phase";
constexpr char kScoreRole[] = "score";
constexpr char kMyMoneyRole[] = "my_money";
constexpr char kOtherCountRole[] = "other_count";
constexpr char kOtherMoneyRole[] = "other_money";
constexpr char kPlayAmountRole[] = "play_amount";
constexpr char kPlayButtonRole[] = "play_button";

/// Roles every source layout must provide.
const std::vector<std::string>& RequiredRoles();

/// Round phases. Values are the cluster ids emitted by the default phase model.
enum class Phase : int {
    kEnded = 0,
    kWaiting = 1,
    kBettingReady = 2,
    kActiveLow = 3,
    kActiveMid = 4,
    kActiveHigh = 5,
    kUnknown = 99,
};

constexpr int kNumPhases = 6;

const char* PhaseName(Phase phase);

inline bool IsActive(Phase phase) {
    return phase == Phase::kActiveLow || phase == Phase::kActiveMid ||
           phase == Phase::kActiveHigh;
}

/// Mean color of a sampled region.
struct Rgb {
    double r = 0;
    double g = 0;
    double b = 0;
};

/// Betting action for the input actuator. Consumed exactly once.
struct ActionRequest {
    std::string source_id;
    int64_t stake_amount = 0;
    Point amount_field;
    Point play_button;
    std::string request_id;
    std::chrono::system_clock::time_point timestamp;
};

/// One in-round reading.
struct RoundSnapshot {
    double score = 0;
    int64_t players = 0;
    double players_win = 0;
    double timestamp = 0;  // seconds since epoch

    // Readings compare equal regardless of when they were taken.
    bool SameReading(const RoundSnapshot& other) const {
        return score == other.score && players == other.players &&
               players_win == other.players_win;
    }
};

struct Earnings {
    double stake = 0;
    double auto_stop = 0;
    double balance = 0;
};

/// Outcome of one finished round, handed to the persistence worker.
struct RoundRecord {
    std::string source_id;
    double final_score = 0;
    double total_win = 0;
    int64_t total_player_count = 0;
    std::vector<RoundSnapshot> snapshots;
    Earnings earnings;
    double timestamp = 0;  // seconds since epoch
};

double EpochSeconds(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

} // namespace Roundwatch

#endif // ROUNDWATCH_COMMON_TYPES_H_
