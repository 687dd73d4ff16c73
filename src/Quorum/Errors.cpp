// =================================================================
// src/Quorum/Errors.cpp
// =================================================================
// Error type names.

#include "Quorum/Errors.hpp"

namespace Quorum {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::NETWORK: return "network";
        case ErrorType::TIMEOUT: return "timeout";
        case ErrorType::VALIDATION: return "validation";
        case ErrorType::AI_SERVICE: return "ai_service";
        case ErrorType::FILESYSTEM: return "filesystem";
        case ErrorType::PROCESSING: return "processing";
        case ErrorType::RESOURCE: return "resource";
        case ErrorType::USER: return "user";
        case ErrorType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

std::optional<ErrorType> parseErrorType(const std::string& name) {
    static const ErrorType all_types[] = {
        ErrorType::NETWORK, ErrorType::TIMEOUT, ErrorType::VALIDATION,
        ErrorType::AI_SERVICE, ErrorType::FILESYSTEM, ErrorType::PROCESSING,
        ErrorType::RESOURCE, ErrorType::USER, ErrorType::UNKNOWN
    };

    for (ErrorType type : all_types) {
        if (errorTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace Quorum
