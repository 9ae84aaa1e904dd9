#ifndef FOUNDRY_CLIENT_HPP
#define FOUNDRY_CLIENT_HPP

#include "types.hpp"
#include "errors.hpp"
#include "credential.hpp"
#include "retry.hpp"
#include "stream.hpp"
#include "transport.hpp"

#include <memory>
#include <string>

namespace foundry {

/** api-version sent when neither Config nor FOUNDRY_API_VERSION sets one. */
#define FOUNDRY_DEFAULT_API_VERSION "2025-01-01-preview"

// =============================================================================
// Configuration
// =============================================================================

/**
 * Configuration for the Foundry client.
 *
 * endpoint:    https://<resource>.services.ai.azure.com
 *              Falls back to FOUNDRY_ENDPOINT environment variable.
 * credential:  Falls back to Credential::from_env() when left empty.
 * api_version: Falls back to FOUNDRY_API_VERSION, then the default.
 * timeout_ms:  Per-attempt timeout in milliseconds. Default: 30000.
 * retry:       Retry policy shared by every request shape.
 * transport:   HTTP transport. Defaults to CurlTransport.
 */
struct Config {
    std::string endpoint;
    Credential credential;
    std::string api_version;
    int timeout_ms;
    RetryPolicy retry;
    std::shared_ptr<HttpTransport> transport;

    Config()
        : timeout_ms(30000)
    {}
};

/**
 * Foundry client - authenticated, retried requests against one endpoint.
 *
 * Core methods:
 *   - get()          - GET a path
 *   - post()         - POST a JSON body
 *   - del()          - DELETE a path
 *   - post_stream()  - POST a JSON body and read server-sent events
 *
 * Every method runs through the same RetryExecutor and resolves the
 * credential again on every attempt. A streaming call is retried only
 * until a success status arrives; after that the stream is the caller's.
 *
 * Example:
 *   foundry::Config cfg;
 *   cfg.endpoint = "https://my-resource.services.ai.azure.com";
 *   cfg.credential = foundry::Credential::api_key("my-key");
 *   foundry::Client client(cfg);
 *
 *   foundry::HttpResponse r = client.post(
 *       "/openai/v1/chat/completions",
 *       "{\"model\":\"gpt-4o\",\"messages\":[{\"role\":\"user\",\"content\":\"Hi\"}]}");
 */
class Client {
public:
    /**
     * @throws ConfigurationError if no endpoint is available or it is not
     *         an http(s) URL.
     */
    explicit Client(const Config& config = Config());

    ~Client();

    // Non-copyable, movable
    Client(Client&& other);
    Client& operator=(Client&& other);

    const std::string& endpoint() const;
    const std::string& api_version() const;
    const Credential& credential() const;
    const RetryPolicy& retry_policy() const;

    /** Endpoint joined with path by exactly one '/'. */
    std::string url(const std::string& path) const;

    // =========================================================================
    // Non-streaming requests
    // =========================================================================

    /**
     * @throws AuthError, HttpError or ApiError once retries are exhausted
     *         or on a non-retriable status.
     */
    HttpResponse get(const std::string& path);

    HttpResponse post(const std::string& path, const std::string& json_body);

    HttpResponse del(const std::string& path);

    // =========================================================================
    // Streaming requests
    // =========================================================================

    /**
     * POST and return the response body as a stream of events.
     *
     * Retries cover establishing the stream only. Failures while reading
     * surface from EventStream::next() as StreamError.
     */
    EventStream post_stream(const std::string& path, const std::string& json_body);

private:
    Client(const Client&);
    Client& operator=(const Client&);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace foundry

#endif // FOUNDRY_CLIENT_HPP
