#pragma once

#include "run_phase.h"
#include <nlohmann/json.hpp>
#include <string>

namespace handover::core {

// What observers see of a run; copied out, never shared
struct ProgressSnapshot {
    double fraction{0.0};         // [0, 1], 1.0 only after the peer confirmed completion
    std::string percentage{"0%"}; // "100%" only after the peer confirmed completion
    std::string eta;              // empty until the run starts and after completion
    std::string transfer_speed;
    std::string interface_label;  // "Wi-Fi", "Thunderbolt" or empty
    bool power_connected{true};
    RunPhase phase{RunPhase::kNotStarted};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ProgressSnapshot,
                                   fraction,
                                   percentage,
                                   eta,
                                   transfer_speed,
                                   interface_label,
                                   power_connected,
                                   phase);
};

} // namespace handover::core
