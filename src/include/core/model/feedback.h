#pragma once

#include "feedback/feedback.h"
#include "feedback/feedback_type.h"
#include "feedback/item_transferred.h"
#include "feedback/phase_changed.h"
#include "feedback/run_finished.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace handover::core {

using FeedbackCallback = std::function<void(Feedback&&)>;

} // namespace handover::core
