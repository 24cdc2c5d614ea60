#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

namespace handover::core {

enum class RunPhase {
    kNotStarted,   // 等待对端就绪
    kPreparing,    // 计算续传偏移，记录开始
    kSendingFiles, // 按清单顺序发送文件
    kSendingApps,  // 按清单顺序发送应用
    kFinalizing,   // 通知对端迁移完成
    kCompleted,    // 对端确认完成
    kAborted,      // 被取消
};

NLOHMANN_JSON_SERIALIZE_ENUM(RunPhase,
                             {
                                 {RunPhase::kNotStarted, "NotStarted"},
                                 {RunPhase::kPreparing, "Preparing"},
                                 {RunPhase::kSendingFiles, "SendingFiles"},
                                 {RunPhase::kSendingApps, "SendingApps"},
                                 {RunPhase::kFinalizing, "Finalizing"},
                                 {RunPhase::kCompleted, "Completed"},
                                 {RunPhase::kAborted, "Aborted"},
                             })

inline std::string_view RunPhaseToString(RunPhase phase) {
    switch (phase) {
    case RunPhase::kNotStarted:
        return "NotStarted";
    case RunPhase::kPreparing:
        return "Preparing";
    case RunPhase::kSendingFiles:
        return "SendingFiles";
    case RunPhase::kSendingApps:
        return "SendingApps";
    case RunPhase::kFinalizing:
        return "Finalizing";
    case RunPhase::kCompleted:
        return "Completed";
    case RunPhase::kAborted:
        return "Aborted";
    }
    return "Unknown";
}

inline bool IsTerminal(RunPhase phase) {
    return phase == RunPhase::kCompleted || phase == RunPhase::kAborted;
}

} // namespace handover::core
