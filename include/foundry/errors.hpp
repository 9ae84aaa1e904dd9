#ifndef FOUNDRY_ERRORS_HPP
#define FOUNDRY_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace foundry {

// =============================================================================
// Error Kind
// =============================================================================

enum ErrorKind {
    ERR_CONFIGURATION,  // invalid policy/endpoint, never retried
    ERR_AUTH,           // credential resolution failed
    ERR_HTTP,           // transport failure or non-JSON error body
    ERR_API,            // structured error returned by the service
    ERR_STREAM,         // streaming protocol failure
    ERR_SDK_DEPENDENCY  // failure surfaced by an underlying library
};

const char* error_kind_to_string(ErrorKind kind);

/**
 * Base exception for all Foundry SDK errors.
 *
 * Every error carries its proximate cause as a std::exception_ptr, so a
 * caller can walk down to the root failure with error_chain().
 * Messages are expected to be sanitized by the code that builds them.
 */
class FoundryError : public std::runtime_error {
public:
    FoundryError(ErrorKind kind,
                 const std::string& message,
                 int status_code = 0,
                 const std::string& code = "",
                 std::exception_ptr cause = std::exception_ptr())
        : std::runtime_error(message)
        , kind_(kind)
        , status_code_(status_code)
        , code_(code)
        , cause_(cause)
    {}

    ErrorKind kind() const { return kind_; }

    /** HTTP status code (0 when no status was observed). */
    int status_code() const { return status_code_; }

    /** Machine code (e.g., "InvalidRequest", "TIMEOUT"). */
    const std::string& code() const { return code_; }

    /** The proximate cause, or a null exception_ptr. */
    std::exception_ptr cause() const { return cause_; }

    bool has_cause() const { return static_cast<bool>(cause_); }

private:
    ErrorKind kind_;
    int status_code_;
    std::string code_;
    std::exception_ptr cause_;
};

/**
 * Invalid configuration detected at construction time.
 */
class ConfigurationError : public FoundryError {
public:
    explicit ConfigurationError(const std::string& message,
                                std::exception_ptr cause = std::exception_ptr())
        : FoundryError(ERR_CONFIGURATION, "Missing configuration: " + message, 0,
                       "CONFIGURATION", cause)
    {}
};

/**
 * Credential resolution failed.
 */
class AuthError : public FoundryError {
public:
    explicit AuthError(const std::string& message,
                       std::exception_ptr cause = std::exception_ptr())
        : FoundryError(ERR_AUTH, "Authentication failed: " + message, 0,
                       "AUTH_FAILED", cause)
    {}
};

/**
 * HTTP failure. status_code() is 0 when the transport failed before a
 * status line was received.
 */
class HttpError : public FoundryError {
public:
    HttpError(int status_code,
              const std::string& message,
              const std::string& code = "",
              std::exception_ptr cause = std::exception_ptr());

    /** The message without the "HTTP error: <status> - " prefix. */
    const std::string& detail() const { return detail_; }

    /** True when no HTTP status was obtained. */
    bool is_transport_failure() const { return status_code() == 0; }

private:
    std::string detail_;
};

/**
 * Structured error returned by the remote service.
 */
class ApiError : public FoundryError {
public:
    ApiError(int status_code,
             const std::string& code,
             const std::string& message,
             std::exception_ptr cause = std::exception_ptr())
        : FoundryError(ERR_API, "API error (" + code + "): " + message,
                       status_code, code, cause)
        , detail_(message)
    {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

/**
 * Streaming protocol failure. Never retried.
 */
class StreamError : public FoundryError {
public:
    explicit StreamError(const std::string& message,
                         std::exception_ptr cause = std::exception_ptr())
        : FoundryError(ERR_STREAM, "Stream error: " + message, 0,
                       "STREAM_ERROR", cause)
    {}
};

/**
 * Failure surfaced by an underlying library (libcurl, picojson, az CLI).
 */
class SdkDependencyError : public FoundryError {
public:
    SdkDependencyError(const std::string& library,
                       const std::string& message,
                       std::exception_ptr cause = std::exception_ptr())
        : FoundryError(ERR_SDK_DEPENDENCY, library + " error: " + message, 0,
                       "SDK_DEPENDENCY", cause)
        , library_(library)
    {}

    const std::string& library() const { return library_; }

private:
    std::string library_;
};

// =============================================================================
// Helpers
// =============================================================================

/**
 * Messages of the error and each of its causes, outermost first.
 * Non-Foundry exceptions end the chain.
 */
std::vector<std::string> error_chain(const std::exception& error);

/** The innermost cause in the chain (rethrown and caught by the caller). */
std::exception_ptr root_cause(const FoundryError& error);

/**
 * Convert a non-success response into a terminal error and throw it.
 *
 * JSON bodies shaped as {"error": {"code": ..., "message": ...}} become
 * ApiError; anything else becomes HttpError carrying the body. The message
 * is sanitized before it is truncated.
 *
 * @throws ApiError or HttpError, always.
 */
void throw_error_from_response(int status_code, const std::string& body);

} // namespace foundry

#endif // FOUNDRY_ERRORS_HPP
