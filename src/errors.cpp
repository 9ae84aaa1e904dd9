#include "foundry/errors.hpp"
#include "foundry/sanitize.hpp"

#include <picojson/picojson.h>

#include <sstream>

namespace foundry {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ERR_CONFIGURATION:  return "Configuration";
        case ERR_AUTH:           return "Auth";
        case ERR_HTTP:           return "Http";
        case ERR_API:            return "Api";
        case ERR_STREAM:         return "Stream";
        case ERR_SDK_DEPENDENCY: return "SdkDependency";
        default:                 return "Unknown";
    }
}

static std::string http_what(int status_code, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTP error: " << status_code << " - " << message;
    return oss.str();
}

HttpError::HttpError(int status_code,
                     const std::string& message,
                     const std::string& code,
                     std::exception_ptr cause)
    : FoundryError(ERR_HTTP, http_what(status_code, message), status_code,
                   code.empty() ? (status_code == 0 ? "NETWORK_ERROR" : "HTTP_ERROR") : code,
                   cause)
    , detail_(message)
{}

// =============================================================================
// Cause chain
// =============================================================================

std::vector<std::string> error_chain(const std::exception& error) {
    std::vector<std::string> chain;
    chain.push_back(error.what());

    const FoundryError* current = dynamic_cast<const FoundryError*>(&error);
    std::exception_ptr next = current ? current->cause() : std::exception_ptr();

    while (next) {
        try {
            std::rethrow_exception(next);
        } catch (const FoundryError& e) {
            chain.push_back(e.what());
            next = e.cause();
        } catch (const std::exception& e) {
            chain.push_back(e.what());
            next = std::exception_ptr();
        } catch (...) {
            chain.push_back("unknown error");
            next = std::exception_ptr();
        }
    }
    return chain;
}

std::exception_ptr root_cause(const FoundryError& error) {
    std::exception_ptr root = error.cause();
    while (root) {
        try {
            std::rethrow_exception(root);
        } catch (const FoundryError& e) {
            if (!e.has_cause()) return root;
            root = e.cause();
        } catch (...) {
            return root;
        }
    }
    return root;
}

// =============================================================================
// Response classification
// =============================================================================

void throw_error_from_response(int status_code, const std::string& body) {
    picojson::value parsed;
    std::string parse_err = picojson::parse(parsed, body);

    if (parse_err.empty() && parsed.is<picojson::object>()) {
        const picojson::object& obj = parsed.get<picojson::object>();
        picojson::object::const_iterator err_it = obj.find("error");
        if (err_it != obj.end() && err_it->second.is<picojson::object>()) {
            const picojson::object& err_obj = err_it->second.get<picojson::object>();

            std::string code = "unknown";
            picojson::object::const_iterator code_it = err_obj.find("code");
            if (code_it != err_obj.end() && code_it->second.is<std::string>()) {
                code = code_it->second.get<std::string>();
            }

            std::string message = body;
            picojson::object::const_iterator msg_it = err_obj.find("message");
            if (msg_it != err_obj.end() && msg_it->second.is<std::string>()) {
                message = msg_it->second.get<std::string>();
            }

            throw ApiError(status_code, sanitize_and_truncate(code),
                           sanitize_and_truncate(message));
        }
    }

    std::string message = body;
    if (message.empty()) {
        std::ostringstream oss;
        oss << "Request failed with status " << status_code;
        message = oss.str();
    }
    throw HttpError(status_code, sanitize_and_truncate(message));
}

} /* namespace foundry */
