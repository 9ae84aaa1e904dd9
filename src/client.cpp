#include "foundry/client.hpp"
#include "foundry/sanitize.hpp"

#include <plog/Log.h>

namespace foundry {

// =============================================================================
// Helpers
// =============================================================================

static bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

/**
 * Validate and normalize the endpoint: http(s) scheme, non-empty host,
 * no trailing slash.
 */
static std::string normalize_endpoint(const std::string& raw) {
    std::string endpoint = raw;
    while (!endpoint.empty() && endpoint[endpoint.size() - 1] == '/') {
        endpoint.erase(endpoint.size() - 1);
    }

    size_t scheme_len = 0;
    if (starts_with(endpoint, "https://")) {
        scheme_len = 8;
    } else if (starts_with(endpoint, "http://")) {
        scheme_len = 7;
    } else {
        throw ConfigurationError("Invalid endpoint URL: '" + sanitize(raw) +
                                 "' (expected http:// or https://)");
    }

    std::string rest = endpoint.substr(scheme_len);
    if (rest.empty() || rest[0] == '/' || rest.find(' ') != std::string::npos) {
        throw ConfigurationError("Invalid endpoint URL: '" + sanitize(raw) + "'");
    }
    return endpoint;
}

// =============================================================================
// Client::Impl (PIMPL)
// =============================================================================

struct Client::Impl {
    std::string endpoint;
    std::string api_version;
    int timeout_ms;
    Credential credential;
    RetryExecutor executor;
    std::shared_ptr<HttpTransport> transport;

    explicit Impl(const Config& config)
        : timeout_ms(config.timeout_ms > 0 ? config.timeout_ms : 30000)
        , executor(config.retry)
    {
        /* Resolve endpoint */
        std::string raw = config.endpoint;
        if (raw.empty()) {
            raw = env_or("FOUNDRY_ENDPOINT", env_or("AZURE_AI_FOUNDRY_ENDPOINT", ""));
        }
        if (raw.empty()) {
            throw ConfigurationError(
                "endpoint is required. Set config.endpoint, FOUNDRY_ENDPOINT or "
                "AZURE_AI_FOUNDRY_ENDPOINT.");
        }
        endpoint = normalize_endpoint(raw);

        api_version = config.api_version;
        if (api_version.empty()) {
            api_version = env_or("FOUNDRY_API_VERSION", FOUNDRY_DEFAULT_API_VERSION);
        }

        credential = config.credential;
        if (credential.kind() == CRED_NONE) {
            credential = Credential::from_env();
        }

        transport = config.transport;
        if (!transport) {
            transport = std::make_shared<CurlTransport>();
        }

        PLOGD << "client:init endpoint=" << sanitize(endpoint)
              << " api_version=" << api_version
              << " credential=" << credential.describe()
              << " max_retries=" << config.retry.max_retries();
    }

    std::string url(const std::string& path) const {
        if (path.empty()) return endpoint;
        if (path[0] == '/') return endpoint + path;
        return endpoint + "/" + path;
    }

    /**
     * Build one attempt's request. Resolves the credential every time so a
     * long backoff never reuses a token that expired meanwhile.
     */
    HttpRequest make_request(const std::string& method,
                             const std::string& target,
                             const std::string& body) const {
        HttpRequest req;
        req.method = method;
        req.url = target;
        req.timeout_ms = timeout_ms;
        req.headers["Authorization"] = credential.resolve();
        req.headers["api-version"] = api_version;
        if (method == "POST" || method == "PATCH" || method == "PUT") {
            req.headers["Content-Type"] = "application/json";
            req.body = body;
        }
        return req;
    }

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const std::string& body) {
        const std::string target = url(path);

        return executor.execute([&](int attempt) -> HttpResponse {
            HttpRequest req = make_request(method, target, body);
            PLOGD << "http:attempt method=" << method
                  << " url=" << sanitize(target) << " attempt=" << attempt;
            HttpResponse resp = transport->send(req);
            PLOGD << "http:response status=" << resp.status << " bytes=" << resp.body.size();
            return resp;
        });
    }

    EventStream stream(const std::string& path, const std::string& body) {
        const std::string target = url(path);
        std::unique_ptr<ResponseStream> established;

        executor.execute([&](int attempt) -> HttpResponse {
            established.reset();

            HttpRequest req = make_request("POST", target, body);
            req.headers["Accept"] = "text/event-stream";
            PLOGD << "http:stream_attempt url=" << sanitize(target) << " attempt=" << attempt;

            std::unique_ptr<ResponseStream> opened = transport->open_stream(req);

            HttpResponse head;
            head.status = opened->status();
            head.headers = opened->headers();
            if (!head.is_success()) {
                /* bounded read; the status alone decides the retry */
                head.body = opened->read_all(ResponseStream::MAX_ERROR_BODY_BYTES);
                return head;
            }

            established = std::move(opened);
            return head;
        });

        PLOGD << "http:stream_established url=" << sanitize(target);
        return EventStream(std::unique_ptr<ChunkSource>(established.release()));
    }
};

// =============================================================================
// Client construction / destruction
// =============================================================================

Client::Client(const Config& config)
    : impl_(new Impl(config))
{}

Client::~Client() {}

Client::Client(Client&& other)
    : impl_(std::move(other.impl_))
{}

Client& Client::operator=(Client&& other) {
    impl_ = std::move(other.impl_);
    return *this;
}

const std::string& Client::endpoint() const {
    return impl_->endpoint;
}

const std::string& Client::api_version() const {
    return impl_->api_version;
}

const Credential& Client::credential() const {
    return impl_->credential;
}

const RetryPolicy& Client::retry_policy() const {
    return impl_->executor.policy();
}

std::string Client::url(const std::string& path) const {
    return impl_->url(path);
}

// =============================================================================
// Requests
// =============================================================================

HttpResponse Client::get(const std::string& path) {
    return impl_->request("GET", path, "");
}

HttpResponse Client::post(const std::string& path, const std::string& json_body) {
    return impl_->request("POST", path, json_body);
}

HttpResponse Client::del(const std::string& path) {
    return impl_->request("DELETE", path, "");
}

EventStream Client::post_stream(const std::string& path, const std::string& json_body) {
    return impl_->stream(path, json_body);
}

} /* namespace foundry */
