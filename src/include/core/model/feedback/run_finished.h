#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

namespace handover::core::feedback {

struct RunFinished {
    std::size_t items_sent = 0;
    std::size_t items_failed = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RunFinished, items_sent, items_failed);
};

} // namespace handover::core::feedback
