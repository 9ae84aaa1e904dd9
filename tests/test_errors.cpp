/**
 * Foundry C++ SDK - error model and sanitization tests.
 */

#include <foundry/foundry.hpp>
#include "test_harness.hpp"

#include <vector>

int main() {
    std::cout << "Foundry C++ SDK - Error Tests" << std::endl;
    std::cout << "=============================" << std::endl;

    // =========================================================================
    // Error kinds
    // =========================================================================
    SECTION("Error kinds");

    RUN_TEST("Each error class reports its kind and prefix", {
        foundry::ConfigurationError cfg("endpoint is required");
        EXPECT(cfg.kind() == foundry::ERR_CONFIGURATION);
        EXPECT_EQ(std::string(cfg.what()), "Missing configuration: endpoint is required");

        foundry::AuthError auth("token expired");
        EXPECT(auth.kind() == foundry::ERR_AUTH);
        EXPECT_EQ(std::string(auth.what()), "Authentication failed: token expired");

        foundry::HttpError http(502, "Bad Gateway");
        EXPECT(http.kind() == foundry::ERR_HTTP);
        EXPECT_EQ(http.status_code(), 502);
        EXPECT_EQ(http.code(), "HTTP_ERROR");
        EXPECT_EQ(http.detail(), "Bad Gateway");
        EXPECT_EQ(std::string(http.what()), "HTTP error: 502 - Bad Gateway");
        EXPECT(!http.is_transport_failure());

        foundry::ApiError api(400, "InvalidRequest", "bad model");
        EXPECT(api.kind() == foundry::ERR_API);
        EXPECT_EQ(api.code(), "InvalidRequest");
        EXPECT_EQ(std::string(api.what()), "API error (InvalidRequest): bad model");

        foundry::StreamError stream("truncated");
        EXPECT(stream.kind() == foundry::ERR_STREAM);
        EXPECT_EQ(std::string(stream.what()), "Stream error: truncated");

        foundry::SdkDependencyError dep("libcurl", "Couldn't resolve host name");
        EXPECT(dep.kind() == foundry::ERR_SDK_DEPENDENCY);
        EXPECT_EQ(dep.library(), "libcurl");
        EXPECT_EQ(std::string(dep.what()), "libcurl error: Couldn't resolve host name");
    });

    RUN_TEST("Transport HttpError defaults to NETWORK_ERROR", {
        foundry::HttpError e(0, "connection refused");
        EXPECT(e.is_transport_failure());
        EXPECT_EQ(e.code(), "NETWORK_ERROR");
    });

    RUN_TEST("Kind names", {
        EXPECT_EQ(std::string(foundry::error_kind_to_string(foundry::ERR_API)), "Api");
        EXPECT_EQ(std::string(foundry::error_kind_to_string(foundry::ERR_SDK_DEPENDENCY)), "SdkDependency");
    });

    RUN_TEST("Subclasses are catchable as FoundryError", {
        EXPECT_THROW(throw foundry::StreamError("x"), foundry::FoundryError);
        EXPECT_THROW(throw foundry::ApiError(404, "NotFound", "x"), std::runtime_error);
    });

    // =========================================================================
    // Cause chain
    // =========================================================================
    SECTION("Cause chain");

    RUN_TEST("error_chain walks every level outermost first", {
        std::exception_ptr inner =
            std::make_exception_ptr(std::runtime_error("socket closed"));
        std::exception_ptr middle =
            std::make_exception_ptr(foundry::SdkDependencyError("libcurl", "recv failure", inner));
        foundry::StreamError outer("failed to read response body", middle);

        std::vector<std::string> chain = foundry::error_chain(outer);
        EXPECT_EQ(chain.size(), 3u);
        EXPECT_EQ(chain[0], "Stream error: failed to read response body");
        EXPECT_EQ(chain[1], "libcurl error: recv failure");
        EXPECT_EQ(chain[2], "socket closed");
    });

    RUN_TEST("root_cause returns the innermost exception", {
        std::exception_ptr inner =
            std::make_exception_ptr(foundry::SdkDependencyError("az", "not logged in"));
        foundry::AuthError outer("token fetch failed", inner);

        std::exception_ptr root = foundry::root_cause(outer);
        EXPECT(static_cast<bool>(root));
        EXPECT_THROW(std::rethrow_exception(root), foundry::SdkDependencyError);
    });

    RUN_TEST("ApiError carries a cause", {
        std::exception_ptr inner =
            std::make_exception_ptr(std::runtime_error("invalid JSON in error body"));
        foundry::ApiError api(502, "BadGateway", "upstream failed", inner);

        EXPECT(api.has_cause());
        EXPECT_EQ(api.status_code(), 502);
        EXPECT_EQ(api.code(), "BadGateway");
        std::vector<std::string> chain = foundry::error_chain(api);
        EXPECT_EQ(chain.size(), 2u);
        EXPECT_EQ(chain[1], "invalid JSON in error body");
    });

    RUN_TEST("Error without cause has a one-entry chain", {
        foundry::ConfigurationError e("x");
        EXPECT(!e.has_cause());
        EXPECT(!foundry::root_cause(e));
        EXPECT_EQ(foundry::error_chain(e).size(), 1u);
    });

    // =========================================================================
    // Response classification
    // =========================================================================
    SECTION("Response classification");

    RUN_TEST("Structured error body becomes ApiError", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(
                400, "{\"error\":{\"code\":\"DeploymentNotFound\",\"message\":\"no such deployment\"}}");
        } catch (const foundry::ApiError& e) {
            caught = true;
            EXPECT_EQ(e.status_code(), 400);
            EXPECT_EQ(e.code(), "DeploymentNotFound");
            EXPECT_EQ(e.detail(), "no such deployment");
        }
        EXPECT(caught);
    });

    RUN_TEST("Error object without code defaults to unknown", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(500, "{\"error\":{\"message\":\"boom\"}}");
        } catch (const foundry::ApiError& e) {
            caught = true;
            EXPECT_EQ(e.code(), "unknown");
            EXPECT_EQ(e.detail(), "boom");
        }
        EXPECT(caught);
    });

    RUN_TEST("Plain text body becomes HttpError", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(503, "Service Unavailable");
        } catch (const foundry::HttpError& e) {
            caught = true;
            EXPECT_EQ(e.status_code(), 503);
            EXPECT_EQ(e.detail(), "Service Unavailable");
        }
        EXPECT(caught);
    });

    RUN_TEST("Empty body names the status", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(404, "");
        } catch (const foundry::HttpError& e) {
            caught = true;
            EXPECT_EQ(e.detail(), "Request failed with status 404");
        }
        EXPECT(caught);
    });

    RUN_TEST("JSON without error object is HttpError", {
        EXPECT_THROW(foundry::throw_error_from_response(500, "{\"status\":\"down\"}"),
                     foundry::HttpError);
    });

    RUN_TEST("Secrets echoed in error bodies are redacted", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(
                401, "{\"error\":{\"code\":\"Unauthorized\","
                     "\"message\":\"bad header Authorization: Bearer sk-live-123\"}}");
        } catch (const foundry::ApiError& e) {
            caught = true;
            EXPECT(!contains(e.what(), "sk-live-123"));
            EXPECT(contains(e.what(), FOUNDRY_REDACTED));
        }
        EXPECT(caught);
    });

    RUN_TEST("Long error bodies are truncated", {
        bool caught = false;
        try {
            foundry::throw_error_from_response(500, std::string(5000, 'x'));
        } catch (const foundry::HttpError& e) {
            caught = true;
            EXPECT_EQ(e.detail().size(), foundry::MAX_ERROR_MESSAGE_LEN + 15);
            EXPECT(contains(e.detail(), "... (truncated)"));
        }
        EXPECT(caught);
    });

    return FINISH_TESTS();
}
