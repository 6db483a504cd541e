#include "types.h"

namespace Roundwatch {

const std::vector<std::string>& RequiredRoles() {
    static const std::vector<std::string> roles = {
        kPhaseRole, kScoreRole, kMyMoneyRole, kOtherCountRole,
        kOtherMoneyRole, kPlayAmountRole, kPlayButtonRole,
    };
    return roles;
}

const char* PhaseName(Phase phase) {
    switch (phase) {
        case Phase::kEnded:
            return "ENDED";
        case Phase::kWaiting:
            return "WAITING";
        case Phase::kBettingReady:
            return "BETTING_READY";
        case Phase::kActiveLow:
            return "ACTIVE_LOW";
        case Phase::kActiveMid:
            return "ACTIVE_MID";
        case Phase::kActiveHigh:
            return "ACTIVE_HIGH";
        case Phase::kUnknown:
            break;
    }
    return "UNKNOWN";
}

double EpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace Roundwatch
