/**
 * Foundry C++ SDK - Streaming chat
 *
 * Streams a chat completion and prints the deltas as they arrive.
 *
 * Usage:
 *   1. Put FOUNDRY_ENDPOINT and FOUNDRY_API_KEY in .env
 *   2. mkdir build && cd build && cmake .. && make
 *   3. ./chat_stream "Tell me a joke"
 */

#include <foundry/foundry.hpp>

#include <picojson/picojson.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <iostream>
#include <fstream>
#include <cstdlib>

// Load KEY=VALUE pairs from a .env file into environment variables
void load_dotenv(const std::string& path) {
    std::ifstream file(path.c_str());
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        // Strip surrounding quotes if present
        if (val.size() >= 2 && (val[0] == '"' || val[0] == '\'')) {
            val = val.substr(1, val.size() - 2);
        }
        setenv(key.c_str(), val.c_str(), 0); // 0 = don't overwrite existing
    }
}

int main(int argc, char** argv) {
    load_dotenv("../.env");
    load_dotenv(".env");

    static plog::ConsoleAppender<plog::TxtFormatter> console(plog::streamStdErr);
    plog::init(std::getenv("FOUNDRY_DEBUG") ? plog::debug : plog::warning, &console);

    std::string prompt = argc > 1 ? argv[1] : "Write a haiku about retries.";
    const char* deployment = std::getenv("FOUNDRY_DEPLOYMENT");

    picojson::object message;
    message["role"] = picojson::value("user");
    message["content"] = picojson::value(prompt);

    picojson::array messages;
    messages.push_back(picojson::value(message));

    picojson::object request;
    request["model"] = picojson::value(std::string(deployment ? deployment : "gpt-4o"));
    request["stream"] = picojson::value(true);
    request["messages"] = picojson::value(messages);

    try {
        foundry::Client client;
        foundry::EventStream events =
            client.post_stream("/openai/v1/chat/completions", picojson::value(request).serialize());

        picojson::value chunk;
        while (events.next_json(chunk)) {
            if (!chunk.is<picojson::object>() || !chunk.get("choices").is<picojson::array>()) continue;
            const picojson::array& choices = chunk.get("choices").get<picojson::array>();
            if (choices.empty() || !choices[0].is<picojson::object>()) continue;

            const picojson::value& delta = choices[0].get("delta");
            if (!delta.is<picojson::object>()) continue;
            const picojson::value& content = delta.get("content");
            if (content.is<std::string>()) {
                std::cout << content.get<std::string>() << std::flush;
            }
        }
        std::cout << std::endl;

        if (!events.completed()) {
            std::cerr << "(stream ended without [DONE])" << std::endl;
        }
        if (events.skipped_lines() > 0) {
            std::cerr << "(" << events.skipped_lines() << " malformed lines skipped)" << std::endl;
        }

    } catch (const foundry::StreamError& e) {
        std::cerr << std::endl << "Stream failed: " << e.what() << std::endl;
        return 1;
    } catch (const foundry::FoundryError& e) {
        std::cerr << "Error [" << foundry::error_kind_to_string(e.kind()) << "]: "
                  << e.what() << std::endl;
        return 1;
    }
    return 0;
}
