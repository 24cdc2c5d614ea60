#pragma once

#include "feedback_type.h"
#include <nlohmann/json.hpp>

namespace handover::core {

// One notification of a migration run; data holds the payload named by type
struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    // e.g. feedback.payload<ProgressSnapshot>() for kProgressUpdated
    template<typename Payload>
    Payload payload() const {
        return data.get<Payload>();
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

} // namespace handover::core
