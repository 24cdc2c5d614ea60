#pragma once

#include <core/model/transfer_item.h>
#include <nlohmann/json.hpp>
#include <string>

namespace handover::core::feedback {

struct ItemTransferred {
    std::string path;
    ItemKind kind;
    bool success = true;
    std::string error_message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ItemTransferred, path, kind, success, error_message);
};

} // namespace handover::core::feedback
