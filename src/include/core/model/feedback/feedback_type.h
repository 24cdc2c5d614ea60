#pragma once

#include <nlohmann/json.hpp>

namespace handover::core {

enum class FeedbackType {
    kProgressUpdated, // 进度快照有变化（完整的ProgressSnapshot）
    kPhaseChanged,    // 运行阶段切换（新阶段）
    kItemTransferred, // 单个条目发送结束（路径，类型，是否成功，失败原因）
    kRunFinished,     // 对端确认迁移完成（已发送条目数，失败条目数）
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kProgressUpdated, "ProgressUpdated"},
                                 {FeedbackType::kPhaseChanged, "PhaseChanged"},
                                 {FeedbackType::kItemTransferred, "ItemTransferred"},
                                 {FeedbackType::kRunFinished, "RunFinished"},
                             });

} // namespace handover::core
