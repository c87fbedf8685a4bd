#pragma once
// Configuration: where the strand document lives
//
// Resolution order: --path flag, SKEIN_DATA_PATH, ./data/strands.json

#include <cstdlib>
#include <string>

namespace skein {

constexpr const char* DATA_PATH_ENV = "SKEIN_DATA_PATH";
constexpr const char* DEFAULT_DATA_PATH = "./data/strands.json";

struct ServerConfig {
    std::string data_path = DEFAULT_DATA_PATH;
    bool in_memory = false;     // Keep strands in process memory only
    bool json_output = false;   // CLI: print structured JSON
};

// Defaults plus environment; command-line flags are applied on top
inline ServerConfig config_from_env() {
    ServerConfig config;
    if (const char* env_path = std::getenv(DATA_PATH_ENV)) {
        if (*env_path) config.data_path = env_path;
    }
    return config;
}

} // namespace skein
