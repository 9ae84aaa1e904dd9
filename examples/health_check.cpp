/**
 * Foundry C++ SDK - Health Check
 *
 * Verifies that credentials resolve and the endpoint answers.
 *
 * Run:
 *   export FOUNDRY_ENDPOINT="https://<resource>.services.ai.azure.com"
 *   export FOUNDRY_API_KEY="..."        # or `az login` / `azd auth login`
 *   ./health_check
 */

#include <foundry/foundry.hpp>

#include <picojson/picojson.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <iostream>
#include <string>
#include <vector>

int main() {
    static plog::ConsoleAppender<plog::TxtFormatter> console(plog::streamStdErr);
    plog::init(plog::warning, &console);

    std::cout << "Foundry C++ SDK Health Check v" << FOUNDRY_SDK_VERSION << std::endl;
    std::cout << "==========================================" << std::endl;

    try {
        foundry::Config cfg;
        cfg.retry = foundry::RetryPolicy::create(2, std::chrono::milliseconds(250));
        foundry::Client client(cfg);
        std::cout << "[1/3] Client initialized (" << client.credential().describe() << ")" << std::endl;

        // Test 1: credential
        std::string auth = client.credential().resolve();
        std::cout << "[2/3] Credential resolved (" << foundry::sanitize("Authorization: " + auth)
                  << ")" << std::endl;

        // Test 2: list models
        foundry::HttpResponse r = client.get("/openai/v1/models");
        picojson::value parsed;
        std::string err = picojson::parse(parsed, r.body);
        size_t count = 0;
        if (err.empty() && parsed.is<picojson::object>() && parsed.get("data").is<picojson::array>()) {
            count = parsed.get("data").get<picojson::array>().size();
        }
        std::cout << "[3/3] Models OK (" << count << " listed)" << std::endl;

        std::cout << "==========================================" << std::endl;
        std::cout << "All checks passed." << std::endl;
        return 0;

    } catch (const foundry::AuthError& e) {
        std::cerr << "FAIL: Authentication error - " << e.what() << std::endl;
        std::cerr << "Set FOUNDRY_API_KEY or run `az login` / `azd auth login`." << std::endl;
        return 1;
    } catch (const foundry::FoundryError& e) {
        std::cerr << "FAIL: [" << e.status_code() << "] - " << e.what() << std::endl;
        std::vector<std::string> chain = foundry::error_chain(e);
        for (size_t i = 1; i < chain.size(); ++i) {
            std::cerr << "  caused by: " << chain[i] << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "FAIL: " << e.what() << std::endl;
        return 1;
    }
}
