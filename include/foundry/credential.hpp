#ifndef FOUNDRY_CREDENTIAL_HPP
#define FOUNDRY_CREDENTIAL_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace foundry {

class HttpTransport;

/** Scope requested for Cognitive Services / Foundry APIs. */
#define FOUNDRY_COGNITIVE_SERVICES_SCOPE "https://cognitiveservices.azure.com/.default"

/** A cached token is refreshed this long before its stated expiry. */
static const int TOKEN_REFRESH_BUFFER_SECS = 300;

typedef std::chrono::system_clock::time_point TimePoint;
typedef std::function<TimePoint()> ClockFn;

// =============================================================================
// Tokens
// =============================================================================

/**
 * A bearer token and the instant it stops being valid.
 */
struct AccessToken {
    std::string token;
    TimePoint expires_at;

    AccessToken() {}
    AccessToken(const std::string& t, TimePoint e)
        : token(t)
        , expires_at(e)
    {}
};

/**
 * External token-issuing capability.
 *
 * Implementations may block on network or process I/O and report failure
 * by throwing. The credential wraps whatever is thrown in an AuthError.
 */
class TokenProvider {
public:
    virtual ~TokenProvider() {}

    virtual AccessToken get_token(const std::vector<std::string>& scopes) = 0;
};

/**
 * Token provider backed by the Azure CLI
 * ("az account get-access-token ... --output json").
 *
 * @throws SdkDependencyError if the command fails or its output is not
 *         the expected JSON document.
 */
class CliTokenProvider : public TokenProvider {
public:
    /** command defaults to the "az" binary on PATH. */
    explicit CliTokenProvider(const std::string& command = "az");

    AccessToken get_token(const std::vector<std::string>& scopes);

    /**
     * Parse the CLI's JSON output. Exposed for tests.
     *
     * @throws SdkDependencyError on malformed output.
     */
    static AccessToken parse_output(const std::string& output);

private:
    std::string command_;
};

/**
 * Token provider backed by the Azure Developer CLI
 * ("azd auth token --output json").
 *
 * @throws SdkDependencyError if the command fails or its output is not
 *         the expected JSON document.
 */
class AzdTokenProvider : public TokenProvider {
public:
    /** command defaults to the "azd" binary on PATH. */
    explicit AzdTokenProvider(const std::string& command = "azd");

    AccessToken get_token(const std::vector<std::string>& scopes);

    /**
     * Parse {"token": ..., "expiresOn": "<RFC 3339 timestamp>"}.
     *
     * @throws SdkDependencyError on malformed output.
     */
    static AccessToken parse_output(const std::string& output);

private:
    std::string command_;
};

/**
 * Token provider for workloads hosted in Azure.
 *
 * Uses the App Service identity endpoint when IDENTITY_ENDPOINT and
 * IDENTITY_HEADER are set, otherwise the instance metadata service at
 * IMDS_TOKEN_URL. A non-empty client_id selects a user-assigned identity.
 *
 * @throws SdkDependencyError if the endpoint is unreachable, answers with
 *         a non-success status, or returns an unexpected document.
 */
class ManagedIdentityTokenProvider : public TokenProvider {
public:
    static const char* const IMDS_TOKEN_URL;

    /** transport defaults to a CurlTransport. */
    explicit ManagedIdentityTokenProvider(
        const std::string& client_id = "",
        const std::shared_ptr<HttpTransport>& transport = std::shared_ptr<HttpTransport>());

    AccessToken get_token(const std::vector<std::string>& scopes);

    /**
     * Parse the token endpoint's JSON. expires_on (epoch seconds, number or
     * string) wins over expires_in, which is taken relative to now.
     *
     * @throws SdkDependencyError on malformed output.
     */
    static AccessToken parse_response(const std::string& body, TimePoint now);

private:
    std::string client_id_;
    std::shared_ptr<HttpTransport> transport_;
};

/**
 * Tries each source in order and returns the first token obtained.
 *
 * With reuse_successful_source, the source that succeeded first is used
 * alone for every later call.
 *
 * @throws SdkDependencyError naming every source's failure when none
 *         produces a token; the last failure is the cause.
 */
class ChainedTokenProvider : public TokenProvider {
public:
    typedef std::vector<std::shared_ptr<TokenProvider> > Sources;

    /** @throws ConfigurationError if sources is empty or holds a null entry. */
    explicit ChainedTokenProvider(const Sources& sources,
                                  bool reuse_successful_source = true);

    AccessToken get_token(const std::vector<std::string>& scopes);

private:
    Sources sources_;
    bool reuse_successful_source_;

    std::mutex mutex_;
    size_t successful_source_;
};

// =============================================================================
// Credential
// =============================================================================

enum CredentialKind {
    CRED_NONE,     // default-constructed, resolve() fails
    CRED_API_KEY,  // static secret, never cached
    CRED_TOKEN     // dynamic, backed by a TokenProvider
};

/**
 * Credential used to build the Authorization header.
 *
 * A value type. Copies of a token credential share one cache slot, so
 * every copy benefits from (and is serialized by) the same single-flight
 * refresh. Two credentials created independently share nothing.
 *
 * Example:
 *   foundry::Credential cred = foundry::Credential::api_key("my-key");
 *   std::string header = cred.resolve();   // "Bearer my-key"
 */
class Credential {
public:
    Credential();

    /** Static API key credential. */
    static Credential api_key(const std::string& key);

    /**
     * Dynamic credential. clock is used for expiry checks and defaults to
     * std::chrono::system_clock::now.
     */
    static Credential token_provider(const std::shared_ptr<TokenProvider>& provider,
                                     const ClockFn& clock = ClockFn());

    /** Dynamic credential backed by CliTokenProvider. */
    static Credential azure_cli();

    /** Azure CLI, then Azure Developer CLI. */
    static Credential developer_tools();

    /** Dynamic credential backed by ManagedIdentityTokenProvider. */
    static Credential managed_identity(const std::string& client_id = "");

    /**
     * FOUNDRY_API_KEY, then AZURE_AI_FOUNDRY_API_KEY, when set and
     * non-empty; otherwise developer_tools().
     */
    static Credential from_env();

    CredentialKind kind() const { return kind_; }

    /**
     * Produce the Authorization header value ("Bearer <secret>").
     *
     * For a token credential, returns the cached token unless it is within
     * TOKEN_REFRESH_BUFFER_SECS of expiry; otherwise fetches a new one.
     * Concurrent callers on an expired slot trigger exactly one fetch.
     *
     * @throws AuthError if the provider fails (cause preserved) or the
     *         credential is empty.
     */
    std::string resolve() const;

    /**
     * Fetch a new token unconditionally and replace the cached one.
     * For an API key credential this is the same as resolve().
     *
     * @throws AuthError if the provider fails.
     */
    std::string force_refresh() const;

    /**
     * The raw token (cached path) with its expiry.
     *
     * @throws AuthError for an API key credential.
     */
    AccessToken get_token() const;

    /** Printable form; never contains the secret. */
    std::string describe() const;

private:
    struct TokenCache;

    CredentialKind kind_;
    std::string api_key_;
    std::shared_ptr<TokenCache> cache_;
};

} // namespace foundry

#endif // FOUNDRY_CREDENTIAL_HPP
