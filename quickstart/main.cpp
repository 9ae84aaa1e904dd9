#include <foundry/foundry.hpp>

#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <iostream>
#include <fstream>
#include <cstdlib>

// Load .env file into environment variables
void load_dotenv(const std::string& path) {
    std::ifstream file(path.c_str());
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        if (val.size() >= 2 && (val[0] == '"' || val[0] == '\''))
            val = val.substr(1, val.size() - 2);
        setenv(key.c_str(), val.c_str(), 0);
    }
}

int main() {
    load_dotenv("../.env");
    load_dotenv(".env");

    static plog::ConsoleAppender<plog::TxtFormatter> console(plog::streamStdErr);
    plog::init(plog::info, &console);

    try {
        foundry::Client client;
        std::cout << "Connected to " << client.endpoint()
                  << " (" << client.credential().describe() << ")" << std::endl;

        const char* deployment = std::getenv("FOUNDRY_DEPLOYMENT");
        std::string body =
            std::string("{\"model\":\"") + (deployment ? deployment : "gpt-4o") + "\","
            "\"messages\":[{\"role\":\"user\",\"content\":\"Say hello in five words.\"}]}";

        foundry::HttpResponse r = client.post("/openai/v1/chat/completions", body);
        std::cout << "Status: " << r.status << std::endl;
        std::cout << r.body << std::endl;

        std::cout << "Done! SDK is working." << std::endl;

    } catch (const foundry::FoundryError& e) {
        std::cerr << "Error [" << foundry::error_kind_to_string(e.kind()) << "]: "
                  << e.what() << std::endl;
        return 1;
    }
    return 0;
}
