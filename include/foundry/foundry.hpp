#ifndef FOUNDRY_HPP
#define FOUNDRY_HPP

/**
 * Foundry C++ SDK - request core for Azure AI Foundry endpoints.
 *
 * Include this single header to get the full SDK:
 *
 *   #include <foundry/foundry.hpp>
 *
 *   int main() {
 *       foundry::Config cfg;
 *       cfg.endpoint = "https://my-resource.services.ai.azure.com";
 *       cfg.credential = foundry::Credential::from_env();
 *       cfg.retry = foundry::RetryPolicy::create(5, std::chrono::milliseconds(250));
 *       foundry::Client client(cfg);
 *
 *       // Plain request
 *       foundry::HttpResponse models = client.get("/openai/v1/models");
 *
 *       // Streamed chat completion
 *       foundry::EventStream events = client.post_stream(
 *           "/openai/v1/chat/completions",
 *           "{\"model\":\"gpt-4o\",\"stream\":true,"
 *           "\"messages\":[{\"role\":\"user\",\"content\":\"Hi\"}]}");
 *
 *       foundry::StreamFrame frame;
 *       while (events.next(frame)) {
 *           std::cout << frame.data << std::endl;
 *       }
 *   }
 *
 * Dependencies:
 *   - libcurl (linked at build time)
 *   - picojson (header-only)
 *   - plog (header-only; the application initializes its own logger)
 *
 * Minimum C++ standard: C++11
 */

#include "types.hpp"
#include "errors.hpp"
#include "sanitize.hpp"
#include "credential.hpp"
#include "retry.hpp"
#include "stream.hpp"
#include "transport.hpp"
#include "client.hpp"

/**
 * Version information
 */
#define FOUNDRY_SDK_VERSION_MAJOR 0
#define FOUNDRY_SDK_VERSION_MINOR 1
#define FOUNDRY_SDK_VERSION_PATCH 0
#define FOUNDRY_SDK_VERSION "0.1.0"

#endif // FOUNDRY_HPP
