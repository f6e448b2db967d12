#ifndef BRANCHMESH_CLI_COMMON_HPP
#define BRANCHMESH_CLI_COMMON_HPP

#include <common/run_config.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/skeleton_json.hpp>
#include <skeleton/skeleton.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace branchmesh::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<int> resolution;
    std::optional<float> min_radius;
    bool verbose = false;
    bool help = false;
};

inline int parse_int_arg(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    int result = 0;
    try {
        result = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
    return result;
}

inline float parse_float_arg(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    float result = 0.0f;
    try {
        result = std::stof(value, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::runtime_error(flag + " expects a number, got '" + value + "'");
    }
    return result;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = next_value("-c/--config");
        } else if (arg == "-r" || arg == "--resolution") {
            ctx.resolution = parse_int_arg("-r/--resolution", next_value("-r/--resolution"));
        } else if (arg == "--min-radius") {
            ctx.min_radius = parse_float_arg("--min-radius", next_value("--min-radius"));
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (!arg.empty() && arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    // Make sure dot comes after last slash (if any)
    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Configuration from -c (if any) with command line overrides applied
inline RunConfig load_run_config(const CommandContext& ctx) {
    RunConfig config;
    if (ctx.config_path) {
        config = json::payload(json::read_json_file(*ctx.config_path)).get<RunConfig>();
    }
    if (ctx.resolution) {
        config.tube.resolution = *ctx.resolution;
    }
    if (ctx.min_radius) {
        config.collider.min_radius = *ctx.min_radius;
    }
    return config;
}

inline Skeleton load_skeleton(const std::string& path) {
    return skeleton_from_json(json::read_json_file(path));
}

// Command function declarations
int command_mesh(int argc, char** argv);
int command_colliders(int argc, char** argv);
int command_info(int argc, char** argv);

}  // namespace branchmesh::cli

#endif // BRANCHMESH_CLI_COMMON_HPP
