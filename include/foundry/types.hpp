#ifndef FOUNDRY_TYPES_HPP
#define FOUNDRY_TYPES_HPP

#include <map>
#include <string>

namespace foundry {

// =============================================================================
// HTTP primitives
// =============================================================================

/**
 * Header map. Response header names are stored lower-cased so lookups
 * are case-insensitive by construction.
 */
typedef std::map<std::string, std::string> Headers;

/**
 * One HTTP request as handed to a transport.
 */
struct HttpRequest {
    std::string method;   // GET, POST, DELETE
    std::string url;
    Headers headers;
    std::string body;
    int timeout_ms;

    HttpRequest()
        : method("GET")
        , timeout_ms(30000)
    {}
};

/**
 * A fully-read HTTP response.
 */
struct HttpResponse {
    int status;
    Headers headers;
    std::string body;

    HttpResponse()
        : status(0)
    {}

    bool is_success() const { return status >= 200 && status < 300; }

    /** Header value by lower-case name, or "" when absent. */
    std::string header(const std::string& name) const {
        Headers::const_iterator it = headers.find(name);
        return it != headers.end() ? it->second : std::string();
    }
};

/** Lower-case an ASCII header name. */
std::string to_lower(const std::string& s);

/** Environment variable value, or fallback when unset or empty. */
std::string env_or(const char* name, const std::string& fallback);

} // namespace foundry

#endif // FOUNDRY_TYPES_HPP
