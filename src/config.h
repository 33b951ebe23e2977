#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>

namespace runbox {

struct ServerConfig {
    using EnvLookup = std::function<const char*(const char*)>;

    int port = 8000;
    std::string environment = "development";
    std::vector<std::string> allowed_hosts;
    std::filesystem::path temp_dir;
    std::string interpreter = "python3";

    bool is_production() const { return environment == "production"; }

    // Defaults, then the process environment, then command-line flags.
    // Throws ValidationError for a malformed port, an unknown flag or a
    // flag without a value.
    static ServerConfig load(int argc, char* argv[]);
    static ServerConfig load(int argc, char* argv[], const EnvLookup& getenv_fn);

    static std::vector<std::string> split_hosts(const std::string& list);
    static int parse_port(const std::string& value);
    static std::filesystem::path default_temp_dir();
};

} // namespace runbox
