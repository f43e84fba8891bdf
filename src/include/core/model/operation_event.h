#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace deckhand::core {

enum class OperationKind {
    kInstall,
    kDelete,
};

NLOHMANN_JSON_SERIALIZE_ENUM(OperationKind,
                             {
                                 {OperationKind::kInstall, "install"},
                                 {OperationKind::kDelete, "delete"},
                             });

enum class OperationStatus {
    kStart,
    kProgress,
    kComplete,
    kError,
};

NLOHMANN_JSON_SERIALIZE_ENUM(OperationStatus,
                             {
                                 {OperationStatus::kStart, "start"},
                                 {OperationStatus::kProgress, "progress"},
                                 {OperationStatus::kComplete, "complete"},
                                 {OperationStatus::kError, "error"},
                             });

// Pushed to the hub while an install or delete runs on the agent
struct OperationEvent {
    OperationKind type = OperationKind::kInstall;
    OperationStatus status = OperationStatus::kStart;
    std::string game_name;
    double progress = 0.0; // 0-100
    std::string message;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(
        OperationEvent, type, status, game_name, progress, message)
};

} // namespace deckhand::core
