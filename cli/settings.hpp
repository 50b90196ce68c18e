#pragma once

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

namespace sweeper_cli {

constexpr int kDefaultWidth = 10;
constexpr int kDefaultHeight = 5;
constexpr int kMaxDimension = 40;

struct Settings {
    int width{kDefaultWidth};
    int height{kDefaultHeight};
    std::optional<uint32_t> seed;
    std::string log_path;
};

inline int parse_dimension_string(const std::string& value, int fallback) {
    try {
        std::size_t used = 0;
        const int n = std::stoi(value, &used);
        if (used != value.size()) return fallback;
        if (n < 1 || n > kMaxDimension) return fallback;
        return n;
    } catch (const std::exception&) {
        return fallback;
    }
}

inline std::optional<uint32_t> parse_seed_string(const std::string& value) {
    // stoull accepts a leading minus sign
    if (value.empty() || value[0] == '-') return std::nullopt;
    try {
        std::size_t used = 0;
        const unsigned long long seed = std::stoull(value, &used);
        if (used != value.size() || seed > UINT32_MAX) return std::nullopt;
        return static_cast<uint32_t>(seed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Priority: --name / --name=... > env > none
inline std::optional<std::string> resolve_option(int argc, char** argv, const std::string& name,
                                                 const char* env_name) {
    const std::string flag = "--" + name;
    const std::string prefix = flag + "=";
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == flag && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
        if (arg.rfind(prefix, 0) == 0) {
            return arg.substr(prefix.size());
        }
    }
    if (env_name != nullptr) {
        if (const char* env = std::getenv(env_name)) return std::string(env);
    }
    return std::nullopt;
}

inline Settings resolve_settings(int argc, char** argv) {
    Settings settings;
    if (auto v = resolve_option(argc, argv, "width", "SWEEPER_WIDTH")) {
        settings.width = parse_dimension_string(*v, kDefaultWidth);
    }
    if (auto v = resolve_option(argc, argv, "height", "SWEEPER_HEIGHT")) {
        settings.height = parse_dimension_string(*v, kDefaultHeight);
    }
    if (auto v = resolve_option(argc, argv, "seed", "SWEEPER_SEED")) {
        settings.seed = parse_seed_string(*v);
        if (!settings.seed) std::cerr << "[INFO] Ignoring invalid seed '" << *v << "'\n";
    }
    if (auto v = resolve_option(argc, argv, "log", nullptr)) {
        settings.log_path = *v;
    }
    return settings;
}

} // namespace sweeper_cli
