#pragma once

#include <core/model/run_phase.h>
#include <nlohmann/json.hpp>

namespace handover::core::feedback {

struct PhaseChanged {
    RunPhase phase;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(PhaseChanged, phase);
};

} // namespace handover::core::feedback
