#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace {

// Matches "--name value" and "--name=value"; advances i past a separate value.
bool take_value(int argc, char** argv, int& i, const char* name, std::string& value) {
    const size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0) {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string("missing value for ") + name);
        }
        value = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    return false;
}

weather::Units units_or_throw(const std::string& value) {
    auto units = weather::parse_units(value);
    if (!units) {
        throw std::invalid_argument("unknown units '" + value + "' (expected metric, imperial or standard)");
    }
    return *units;
}

int int_or_throw(const std::string& value, const char* name) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument(std::string("invalid number for ") + name + ": " + value);
    }
}

std::optional<weather::Units> units_from_env() {
    const char* env = std::getenv("WEATHER_UNITS");
    if (!env || !*env) {
        return std::nullopt;
    }
    return weather::parse_units(env);
}

} // namespace

bool parse_server_options(int argc, char** argv, ServerConfig& config, std::string& error) {
    if (auto units = units_from_env()) {
        config.units = *units;
    }

    try {
        for (int i = 1; i < argc; ++i) {
            std::string value;
            if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
                config.show_version = true;
            } else if (std::strcmp(argv[i], "--pdeathsig") == 0) {
                config.pdeathsig = true;
            } else if (take_value(argc, argv, i, "--config", value)) {
                config.log_config = value;
            } else if (take_value(argc, argv, i, "--units", value)) {
                config.units = units_or_throw(value);
            } else if (take_value(argc, argv, i, "--seed", value)) {
                int seed = int_or_throw(value, "--seed");
                if (seed < 0) {
                    throw std::invalid_argument("--seed must not be negative");
                }
                config.seed = static_cast<uint32_t>(seed);
            } else {
                throw std::invalid_argument(std::string("unknown argument: ") + argv[i]);
            }
        }
    } catch (const std::invalid_argument& exc) {
        error = exc.what();
        return false;
    }
    return true;
}

bool parse_agent_options(int argc, char** argv, AgentConfig& config, std::string& error) {
    if (auto units = units_from_env()) {
        config.units = *units;
    }

    std::string location;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string value;
            if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
                config.show_version = true;
            } else if (take_value(argc, argv, i, "--config", value)) {
                config.log_config = value;
            } else if (take_value(argc, argv, i, "--server", value)) {
                config.server_command = value;
            } else if (take_value(argc, argv, i, "--server-arg", value)) {
                config.server_args.push_back(value);
            } else if (take_value(argc, argv, i, "--timeout", value)) {
                config.timeout_ms = int_or_throw(value, "--timeout");
            } else if (take_value(argc, argv, i, "--units", value)) {
                config.units = units_or_throw(value);
            } else if (take_value(argc, argv, i, "--days", value)) {
                config.days = int_or_throw(value, "--days");
                if (config.days < 1) {
                    throw std::invalid_argument("--days must be at least 1");
                }
            } else if (argv[i][0] == '-') {
                throw std::invalid_argument(std::string("unknown argument: ") + argv[i]);
            } else {
                if (!location.empty()) {
                    location += ' ';
                }
                location += argv[i];
            }
        }
    } catch (const std::invalid_argument& exc) {
        error = exc.what();
        return false;
    }

    if (!location.empty()) {
        config.location = location;
    }
    return true;
}

void print_server_usage(const char* program) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options]\n", program);
    fprintf(stderr, "\n");
    fprintf(stderr, "Serves weather tools as line-delimited JSON-RPC on stdin/stdout.\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -v,  --version          print version and exit\n");
    fprintf(stderr, "       --config FILE      log4cplus configuration [log4cplus.ini]\n");
    fprintf(stderr, "       --units UNITS      default units: metric, imperial, standard [$WEATHER_UNITS or metric]\n");
    fprintf(stderr, "       --seed N           seed for generated weather data [random]\n");
    fprintf(stderr, "       --pdeathsig        exit when the parent process dies\n");
    fprintf(stderr, "\n");
}

void print_agent_usage(const char* program) {
    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s [options] [location words...]\n", program);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -v,  --version          print version and exit\n");
    fprintf(stderr, "       --config FILE      log4cplus configuration [log4cplus.ini]\n");
    fprintf(stderr, "       --server PATH      tool server executable [weather_tool_server next to this binary]\n");
    fprintf(stderr, "       --server-arg ARG   extra argument for the tool server, repeatable\n");
    fprintf(stderr, "       --timeout MS       per-call response timeout [30000]\n");
    fprintf(stderr, "       --units UNITS      metric, imperial, standard [$WEATHER_UNITS or metric]\n");
    fprintf(stderr, "       --days N           forecast days [3]\n");
    fprintf(stderr, "\n");
}
