// =================================================================
// include/Quorum/Errors.hpp
// =================================================================
// Exception hierarchy and the fixed error taxonomy.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace Quorum {

/**
 * @brief Classified failure categories
 */
enum class ErrorType {
    NETWORK,        ///< Connection refused, DNS, TLS, no endpoint available
    TIMEOUT,        ///< Deadline exceeded
    VALIDATION,     ///< Bad input data, never retried
    AI_SERVICE,     ///< Inference service returned an error
    FILESYSTEM,     ///< File access or disk problems
    PROCESSING,     ///< Malformed model output or parsing failure
    RESOURCE,       ///< Memory or other resource exhaustion
    USER,           ///< Invalid user request, never retried
    UNKNOWN         ///< Anything else
};

/**
 * @brief Get the canonical lowercase name of an error type
 * @param type Error type
 * @return Name such as "network" or "ai_service"
 */
std::string errorTypeToString(ErrorType type);

/**
 * @brief Parse an error type name
 * @param name Lowercase name as produced by errorTypeToString
 * @return Error type, or std::nullopt if the name is unknown
 */
std::optional<ErrorType> parseErrorType(const std::string& name);

/**
 * @brief Base class of every error raised by Quorum
 */
class QuorumError : public std::runtime_error {
public:
    QuorumError(ErrorType type, const std::string& name, const std::string& message)
        : std::runtime_error(message), m_type(type), m_name(name) {}

    ErrorType getType() const { return m_type; }

    /// Class name reported in error records
    const std::string& getName() const { return m_name; }

private:
    ErrorType m_type;
    std::string m_name;
};

class NetworkError : public QuorumError {
public:
    explicit NetworkError(const std::string& message)
        : QuorumError(ErrorType::NETWORK, "NetworkError", message) {}

protected:
    NetworkError(const std::string& name, const std::string& message)
        : QuorumError(ErrorType::NETWORK, name, message) {}
};

class TimeoutError : public QuorumError {
public:
    explicit TimeoutError(const std::string& message)
        : QuorumError(ErrorType::TIMEOUT, "TimeoutError", message) {}
};

class ValidationError : public QuorumError {
public:
    explicit ValidationError(const std::string& message)
        : QuorumError(ErrorType::VALIDATION, "ValidationError", message) {}
};

class AiServiceError : public QuorumError {
public:
    AiServiceError(const std::string& message, int status_code = 0)
        : QuorumError(ErrorType::AI_SERVICE, "AiServiceError", message), m_status_code(status_code) {}

    /// HTTP status returned by the service, 0 if not applicable
    int getStatusCode() const { return m_status_code; }

private:
    int m_status_code;
};

class FileSystemError : public QuorumError {
public:
    explicit FileSystemError(const std::string& message)
        : QuorumError(ErrorType::FILESYSTEM, "FileSystemError", message) {}
};

class ProcessingError : public QuorumError {
public:
    explicit ProcessingError(const std::string& message)
        : QuorumError(ErrorType::PROCESSING, "ProcessingError", message) {}
};

class ResourceError : public QuorumError {
public:
    explicit ResourceError(const std::string& message)
        : QuorumError(ErrorType::RESOURCE, "ResourceError", message) {}
};

class UserError : public QuorumError {
public:
    explicit UserError(const std::string& message)
        : QuorumError(ErrorType::USER, "UserError", message) {}
};

/**
 * @brief Raised when a pool has no eligible endpoint to serve a request
 */
class NoHealthyEndpointError : public NetworkError {
public:
    explicit NoHealthyEndpointError(const std::string& pool_id)
        : NetworkError("NoHealthyEndpointError", "No healthy endpoints available in pool: " + pool_id),
          m_pool_id(pool_id) {}

    const std::string& getPoolId() const { return m_pool_id; }

private:
    std::string m_pool_id;
};

/**
 * @brief Raised when a run is cancelled by its caller
 *
 * Not part of the taxonomy; the retry engine never retries it.
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Quorum
