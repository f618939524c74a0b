// Basic Rencode usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <Rencode/parser.hpp>
#include <Rencode/serializer.hpp>
#include <Rencode/error_formatting.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace Rencode;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        int port;
    };
    Server server;

    A<std::vector<std::string>, options::key<"peers">> peer_hosts;
    std::optional<double> ratio;
};

int main() {
    Config config{"MyApp", 1, true, {"localhost", 8080}, std::vector<std::string>{"a.local", "b.local"}, std::nullopt};

    std::vector<std::uint8_t> bytes;
    auto written = Serialize(config, bytes);
    if (!written) {
        std::cout << SerializeResultToString(written) << std::endl;
        return 1;
    }
    std::cout << "Encoded " << bytes.size() << " bytes:";
    for (std::uint8_t b : bytes) {
        std::cout << ' ' << int(b);
    }
    std::cout << std::endl;

    Config decoded;
    auto result = Parse(decoded, bytes);
    if (!result) {
        std::cout << ParseResultToString(result, bytes) << std::endl;
        return 1;
    }

    std::cout << "App: " << decoded.app_name << std::endl;
    std::cout << "Version: " << decoded.version << std::endl;
    std::cout << "Debug: " << (decoded.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << decoded.server.host << ":" << decoded.server.port << std::endl;
    std::cout << "Peers: " << decoded.peer_hosts->size() << std::endl;

    // Without a schema
    Value any;
    if (!Parse(any, bytes)) {
        return 1;
    }
    const Value::Dict * fields = any.get_if<Value::Dict>();
    std::cout << "Fields: " << (fields ? fields->size() : 0) << std::endl;

    // Truncated input is reported as an error
    bytes.pop_back();
    auto truncated = Parse(decoded, bytes);
    std::cout << ParseResultToString(truncated, bytes) << std::endl;

    return 0;
}
