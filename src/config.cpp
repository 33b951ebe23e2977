#include "config.h"
#include "constants.h"
#include "errors.h"
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace runbox {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

void apply_flag(ServerConfig& config, const std::string& flag, const std::string& value) {
    if (flag == "--port") {
        config.port = ServerConfig::parse_port(value);
    } else if (flag == "--env") {
        config.environment = value;
    } else if (flag == "--allowed-hosts") {
        config.allowed_hosts = ServerConfig::split_hosts(value);
    } else if (flag == "--temp-dir") {
        config.temp_dir = value;
    } else if (flag == "--interpreter") {
        config.interpreter = value;
    } else {
        throw ValidationError("Unknown option", flag);
    }
}

} // namespace

ServerConfig ServerConfig::load(int argc, char* argv[]) {
    return load(argc, argv, [](const char* name) -> const char* { return std::getenv(name); });
}

ServerConfig ServerConfig::load(int argc, char* argv[], const EnvLookup& getenv_fn) {
    ServerConfig config;
    config.port = DEFAULT_PORT;
    config.temp_dir = default_temp_dir();

    if (const char* v = getenv_fn("PORT")) config.port = parse_port(v);
    if (const char* v = getenv_fn("RUNBOX_ENV")) config.environment = v;
    if (const char* v = getenv_fn("RUNBOX_ALLOWED_HOSTS")) config.allowed_hosts = split_hosts(v);
    if (const char* v = getenv_fn("RUNBOX_TEMP_DIR")) config.temp_dir = v;
    if (const char* v = getenv_fn("RUNBOX_INTERPRETER")) config.interpreter = v;

    // Accepts both "--flag value" and "--flag=value"
    for (int i = 1; i < argc; i++) {
        std::string flag = argv[i];
        std::string value;
        size_t eq = flag.find('=');
        if (eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw ValidationError("Missing value for option", flag);
        }
        apply_flag(config, flag, value);
    }

    if (config.interpreter.empty()) {
        throw ValidationError("Interpreter must not be empty");
    }
    return config;
}

std::vector<std::string> ServerConfig::split_hosts(const std::string& list) {
    std::vector<std::string> hosts;
    std::istringstream stream(list);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            hosts.push_back(item);
        }
    }
    return hosts;
}

int ServerConfig::parse_port(const std::string& value) {
    std::string s = trim(value);
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos || s.size() > 5) {
        throw ValidationError("Invalid port", value);
    }
    int port = std::stoi(s);
    if (port < 1 || port > 65535) {
        throw ValidationError("Invalid port", value);
    }
    return port;
}

fs::path ServerConfig::default_temp_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / SERVICE_NAME;
}

} // namespace runbox
