#include "foundry/credential.hpp"
#include "foundry/errors.hpp"
#include "foundry/sanitize.hpp"
#include "foundry/transport.hpp"
#include "foundry/types.hpp"

#include <picojson/picojson.h>
#include <plog/Log.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <sstream>

#ifdef _WIN32
#define FOUNDRY_POPEN _popen
#define FOUNDRY_PCLOSE _pclose
#define FOUNDRY_DEVNULL "NUL"
#else
#include <sys/wait.h>
#define FOUNDRY_POPEN popen
#define FOUNDRY_PCLOSE pclose
#define FOUNDRY_DEVNULL "/dev/null"
#endif

namespace foundry {

// =============================================================================
// Helpers
// =============================================================================

/** "https://host/.default" -> "https://host" */
static std::string scope_to_resource(const std::string& scope) {
    static const std::string SUFFIX = "/.default";
    if (scope.size() >= SUFFIX.size() &&
        scope.compare(scope.size() - SUFFIX.size(), SUFFIX.size(), SUFFIX) == 0) {
        return scope.substr(0, scope.size() - SUFFIX.size());
    }
    return scope;
}

static std::string first_scope(const std::vector<std::string>& scopes) {
    return scopes.empty() ? FOUNDRY_COGNITIVE_SERVICES_SCOPE : scopes[0];
}

/**
 * Run a developer tool and return its stdout. stderr is discarded; the
 * tools print the login hint there, never the token.
 */
static std::string run_tool(const std::string& tool, const std::string& command,
                            const std::string& hint) {
    FILE* pipe = FOUNDRY_POPEN(command.c_str(), "r");
    if (!pipe) {
        throw SdkDependencyError(tool, "failed to start " + tool);
    }

    std::string output;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }

    int rc = FOUNDRY_PCLOSE(pipe);
#ifndef _WIN32
    if (rc != -1 && WIFEXITED(rc)) {
        rc = WEXITSTATUS(rc);
    }
#endif
    if (rc != 0) {
        std::ostringstream msg;
        msg << "command exited with status " << rc << " (" << hint << ")";
        throw SdkDependencyError(tool, msg.str());
    }
    return output;
}

/** Epoch seconds, given as a JSON number or a decimal string. */
static bool epoch_seconds(const picojson::value& v, long long& out) {
    if (v.is<double>()) {
        out = static_cast<long long>(v.get<double>());
        return true;
    }
    if (v.is<std::string>()) {
        const std::string& s = v.get<std::string>();
        char* end = NULL;
        long long parsed = std::strtoll(s.c_str(), &end, 10);
        if (!s.empty() && end && *end == '\0') {
            out = parsed;
            return true;
        }
    }
    return false;
}

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)" into epoch
 * seconds. A timestamp without a zone is taken as UTC.
 */
static bool parse_rfc3339(const std::string& s, long long& out) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &y, &mo, &d, &h, &mi, &sec, &consumed) != 6) {
        return false;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60) {
        return false;
    }

    size_t p = static_cast<size_t>(consumed);
    if (p < s.size() && s[p] == '.') {
        ++p;
        while (p < s.size() && std::isdigit(static_cast<unsigned char>(s[p]))) ++p;
    }

    long long offset = 0;
    if (p < s.size() && (s[p] == 'Z' || s[p] == 'z')) {
        ++p;
    } else if (p < s.size() && (s[p] == '+' || s[p] == '-')) {
        int oh = 0, om = 0, n = 0;
        if (std::sscanf(s.c_str() + p + 1, "%2d:%2d%n", &oh, &om, &n) != 2) {
            return false;
        }
        offset = (oh * 3600LL + om * 60LL) * (s[p] == '-' ? -1 : 1);
        p += 1 + static_cast<size_t>(n);
    }
    if (p != s.size()) {
        return false;
    }

    /* days since 1970-01-01 in the proleptic Gregorian calendar */
    long long yy = y - (mo <= 2 ? 1 : 0);
    long long era = (yy >= 0 ? yy : yy - 399) / 400;
    long long yoe = yy - era * 400;
    long long doy = (153 * (mo + (mo > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    long long days = era * 146097 + doe - 719468;

    out = days * 86400 + h * 3600LL + mi * 60LL + sec - offset;
    return true;
}

static std::string url_encode(const std::string& value) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    for (size_t i = 0; i < value.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(value[i]);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

// =============================================================================
// CliTokenProvider
// =============================================================================

CliTokenProvider::CliTokenProvider(const std::string& command)
    : command_(command.empty() ? "az" : command)
{}

AccessToken CliTokenProvider::get_token(const std::vector<std::string>& scopes) {
    std::ostringstream cmd;
    cmd << command_ << " account get-access-token --resource \""
        << scope_to_resource(first_scope(scopes)) << "\" --output json 2>" << FOUNDRY_DEVNULL;

    return parse_output(run_tool("az", cmd.str(),
                                 "is the Azure CLI installed and logged in?"));
}

AccessToken CliTokenProvider::parse_output(const std::string& output) {
    picojson::value parsed;
    std::string parse_err = picojson::parse(parsed, output);
    if (!parse_err.empty() || !parsed.is<picojson::object>()) {
        throw SdkDependencyError("az", "unexpected get-access-token output: " +
                                 sanitize_and_truncate(parse_err.empty() ? output : parse_err));
    }
    const picojson::object& obj = parsed.get<picojson::object>();

    picojson::object::const_iterator tok = obj.find("accessToken");
    if (tok == obj.end() || !tok->second.is<std::string>() ||
        tok->second.get<std::string>().empty()) {
        throw SdkDependencyError("az", "get-access-token output has no accessToken");
    }

    /* older CLI versions emit expires_on as a string */
    long long expires_on = -1;
    picojson::object::const_iterator exp = obj.find("expires_on");
    if (exp == obj.end() || !epoch_seconds(exp->second, expires_on) || expires_on < 0) {
        throw SdkDependencyError("az", "get-access-token output has no usable expires_on");
    }

    return AccessToken(tok->second.get<std::string>(),
                       TimePoint(std::chrono::seconds(expires_on)));
}

// =============================================================================
// AzdTokenProvider
// =============================================================================

AzdTokenProvider::AzdTokenProvider(const std::string& command)
    : command_(command.empty() ? "azd" : command)
{}

AccessToken AzdTokenProvider::get_token(const std::vector<std::string>& scopes) {
    std::ostringstream cmd;
    cmd << command_ << " auth token --output json --scope \""
        << first_scope(scopes) << "\" 2>" << FOUNDRY_DEVNULL;

    return parse_output(run_tool("azd", cmd.str(),
                                 "is the Azure Developer CLI installed and logged in?"));
}

AccessToken AzdTokenProvider::parse_output(const std::string& output) {
    picojson::value parsed;
    std::string parse_err = picojson::parse(parsed, output);
    if (!parse_err.empty() || !parsed.is<picojson::object>()) {
        throw SdkDependencyError("azd", "unexpected auth token output: " +
                                 sanitize_and_truncate(parse_err.empty() ? output : parse_err));
    }
    const picojson::object& obj = parsed.get<picojson::object>();

    picojson::object::const_iterator tok = obj.find("token");
    if (tok == obj.end() || !tok->second.is<std::string>() ||
        tok->second.get<std::string>().empty()) {
        throw SdkDependencyError("azd", "auth token output has no token");
    }

    long long expires_on = 0;
    picojson::object::const_iterator exp = obj.find("expiresOn");
    if (exp == obj.end() || !exp->second.is<std::string>() ||
        !parse_rfc3339(exp->second.get<std::string>(), expires_on)) {
        throw SdkDependencyError("azd", "auth token output has no usable expiresOn");
    }

    return AccessToken(tok->second.get<std::string>(),
                       TimePoint(std::chrono::seconds(expires_on)));
}

// =============================================================================
// ManagedIdentityTokenProvider
// =============================================================================

const char* const ManagedIdentityTokenProvider::IMDS_TOKEN_URL =
    "http://169.254.169.254/metadata/identity/oauth2/token";

/* IMDS answers locally; a slow reply means there is no IMDS */
static const int MANAGED_IDENTITY_TIMEOUT_MS = 5000;

ManagedIdentityTokenProvider::ManagedIdentityTokenProvider(
    const std::string& client_id,
    const std::shared_ptr<HttpTransport>& transport)
    : client_id_(client_id)
    , transport_(transport)
{
    if (!transport_) {
        transport_ = std::make_shared<CurlTransport>();
    }
}

AccessToken ManagedIdentityTokenProvider::get_token(const std::vector<std::string>& scopes) {
    const std::string resource = scope_to_resource(first_scope(scopes));
    const std::string identity_endpoint = env_or("IDENTITY_ENDPOINT", "");
    const std::string identity_header = env_or("IDENTITY_HEADER", "");

    HttpRequest req;
    req.method = "GET";
    req.timeout_ms = MANAGED_IDENTITY_TIMEOUT_MS;

    std::ostringstream url;
    if (!identity_endpoint.empty() && !identity_header.empty()) {
        url << identity_endpoint << "?api-version=2019-08-01&resource=" << url_encode(resource);
        req.headers["X-IDENTITY-HEADER"] = identity_header;
    } else {
        url << IMDS_TOKEN_URL << "?api-version=2018-02-01&resource=" << url_encode(resource);
        req.headers["Metadata"] = "true";
    }
    if (!client_id_.empty()) {
        url << "&client_id=" << url_encode(client_id_);
    }
    req.url = url.str();

    HttpResponse resp;
    try {
        resp = transport_->send(req);
    } catch (const HttpError&) {
        throw SdkDependencyError("managed identity", "token endpoint unreachable",
                                 std::current_exception());
    }

    if (!resp.is_success()) {
        std::ostringstream msg;
        msg << "token endpoint returned status " << resp.status << ": "
            << sanitize_and_truncate(resp.body);
        throw SdkDependencyError("managed identity", msg.str());
    }

    return parse_response(resp.body, std::chrono::system_clock::now());
}

AccessToken ManagedIdentityTokenProvider::parse_response(const std::string& body, TimePoint now) {
    picojson::value parsed;
    std::string parse_err = picojson::parse(parsed, body);
    if (!parse_err.empty() || !parsed.is<picojson::object>()) {
        throw SdkDependencyError("managed identity", "unexpected token response: " +
                                 sanitize_and_truncate(parse_err.empty() ? body : parse_err));
    }
    const picojson::object& obj = parsed.get<picojson::object>();

    picojson::object::const_iterator tok = obj.find("access_token");
    if (tok == obj.end() || !tok->second.is<std::string>() ||
        tok->second.get<std::string>().empty()) {
        throw SdkDependencyError("managed identity", "token response has no access_token");
    }

    long long seconds = 0;
    picojson::object::const_iterator exp = obj.find("expires_on");
    if (exp != obj.end() && epoch_seconds(exp->second, seconds) && seconds >= 0) {
        return AccessToken(tok->second.get<std::string>(),
                           TimePoint(std::chrono::seconds(seconds)));
    }

    picojson::object::const_iterator in = obj.find("expires_in");
    if (in != obj.end() && epoch_seconds(in->second, seconds) && seconds >= 0) {
        return AccessToken(tok->second.get<std::string>(), now + std::chrono::seconds(seconds));
    }

    throw SdkDependencyError("managed identity", "token response has no usable expiry");
}

// =============================================================================
// ChainedTokenProvider
// =============================================================================

static const size_t SOURCE_NOT_SET = (std::numeric_limits<size_t>::max)();

ChainedTokenProvider::ChainedTokenProvider(const Sources& sources,
                                           bool reuse_successful_source)
    : sources_(sources)
    , reuse_successful_source_(reuse_successful_source)
    , successful_source_(SOURCE_NOT_SET)
{
    if (sources_.empty()) {
        throw ConfigurationError("credential chain needs at least one source");
    }
    for (size_t i = 0; i < sources_.size(); ++i) {
        if (!sources_[i]) {
            throw ConfigurationError("credential chain source must not be null");
        }
    }
}

AccessToken ChainedTokenProvider::get_token(const std::vector<std::string>& scopes) {
    size_t pinned = SOURCE_NOT_SET;
    if (reuse_successful_source_) {
        std::lock_guard<std::mutex> lock(mutex_);
        pinned = successful_source_;
    }
    if (pinned != SOURCE_NOT_SET) {
        return sources_[pinned]->get_token(scopes);
    }

    std::ostringstream failures;
    std::exception_ptr last;
    for (size_t i = 0; i < sources_.size(); ++i) {
        try {
            AccessToken token = sources_[i]->get_token(scopes);
            if (reuse_successful_source_) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (successful_source_ == SOURCE_NOT_SET) {
                    successful_source_ = i;
                }
            }
            PLOGD << "auth:chain_source_selected index=" << i;
            return token;
        } catch (const std::exception& e) {
            PLOGD << "auth:chain_source_failed index=" << i << " error=" << sanitize(e.what());
            failures << (i == 0 ? "" : "; ") << "[" << i << "] " << sanitize(e.what());
            last = std::current_exception();
        }
    }

    throw SdkDependencyError("credential chain",
                             "no source produced a token: " +
                             truncate_message(failures.str()),
                             last);
}

// =============================================================================
// Credential::TokenCache
// =============================================================================

/**
 * The shared cache slot of a token credential.
 *
 * The mutex is held across the provider call, which is what collapses
 * concurrent refreshes into one fetch. The token itself is immutable once
 * published; a refresh replaces the pointer.
 */
struct Credential::TokenCache {
    std::shared_ptr<TokenProvider> provider;
    ClockFn clock;
    std::vector<std::string> scopes;

    std::mutex mutex;
    std::shared_ptr<const AccessToken> token;

    TimePoint now() const {
        return clock ? clock() : std::chrono::system_clock::now();
    }

    bool is_fresh(const AccessToken& t) const {
        return now() < t.expires_at - std::chrono::seconds(TOKEN_REFRESH_BUFFER_SECS);
    }

    /** Requires mutex to be held. */
    std::shared_ptr<const AccessToken> fetch_locked() {
        AccessToken fetched;
        try {
            fetched = provider->get_token(scopes);
        } catch (const std::exception& e) {
            PLOGW << "auth:token_fetch_failed error=" << sanitize(e.what());
            throw AuthError(sanitize_and_truncate(e.what()), std::current_exception());
        } catch (...) {
            PLOGW << "auth:token_fetch_failed error=unknown";
            throw AuthError("token provider failed", std::current_exception());
        }

        token = std::shared_ptr<const AccessToken>(new AccessToken(fetched));

        long long remaining = std::chrono::duration_cast<std::chrono::seconds>(
            fetched.expires_at - now()).count();
        PLOGI << "auth:token_refreshed expires_in_s=" << remaining;
        return token;
    }

    std::shared_ptr<const AccessToken> get() {
        std::lock_guard<std::mutex> lock(mutex);
        if (token && is_fresh(*token)) {
            PLOGV << "auth:token_cache hit";
            return token;
        }
        return fetch_locked();
    }

    std::shared_ptr<const AccessToken> refresh() {
        std::lock_guard<std::mutex> lock(mutex);
        return fetch_locked();
    }
};

// =============================================================================
// Credential
// =============================================================================

Credential::Credential()
    : kind_(CRED_NONE)
{}

Credential Credential::api_key(const std::string& key) {
    Credential c;
    c.kind_ = CRED_API_KEY;
    c.api_key_ = key;
    return c;
}

Credential Credential::token_provider(const std::shared_ptr<TokenProvider>& provider,
                                      const ClockFn& clock) {
    if (!provider) {
        throw ConfigurationError("token provider must not be null");
    }
    Credential c;
    c.kind_ = CRED_TOKEN;
    c.cache_ = std::make_shared<TokenCache>();
    c.cache_->provider = provider;
    c.cache_->clock = clock;
    c.cache_->scopes.push_back(FOUNDRY_COGNITIVE_SERVICES_SCOPE);
    return c;
}

Credential Credential::azure_cli() {
    return token_provider(std::make_shared<CliTokenProvider>());
}

Credential Credential::developer_tools() {
    ChainedTokenProvider::Sources sources;
    sources.push_back(std::make_shared<CliTokenProvider>());
    sources.push_back(std::make_shared<AzdTokenProvider>());
    return token_provider(std::make_shared<ChainedTokenProvider>(sources));
}

Credential Credential::managed_identity(const std::string& client_id) {
    return token_provider(std::make_shared<ManagedIdentityTokenProvider>(client_id));
}

Credential Credential::from_env() {
    std::string key = env_or("FOUNDRY_API_KEY", env_or("AZURE_AI_FOUNDRY_API_KEY", ""));
    if (!key.empty()) {
        return api_key(key);
    }
    PLOGD << "auth:from_env no API key set, using developer tools";
    return developer_tools();
}

std::string Credential::resolve() const {
    switch (kind_) {
        case CRED_API_KEY:
            return "Bearer " + api_key_;
        case CRED_TOKEN:
            return "Bearer " + cache_->get()->token;
        default:
            throw AuthError("no credential configured");
    }
}

std::string Credential::force_refresh() const {
    switch (kind_) {
        case CRED_API_KEY:
            return "Bearer " + api_key_;
        case CRED_TOKEN:
            return "Bearer " + cache_->refresh()->token;
        default:
            throw AuthError("no credential configured");
    }
}

AccessToken Credential::get_token() const {
    if (kind_ != CRED_TOKEN) {
        throw AuthError("Cannot get token from API key credential. Use resolve() instead.");
    }
    return *cache_->get();
}

std::string Credential::describe() const {
    switch (kind_) {
        case CRED_API_KEY: return "Credential::ApiKey(****)";
        case CRED_TOKEN:   return "Credential::Token(...)";
        default:           return "Credential::None";
    }
}

} /* namespace foundry */
