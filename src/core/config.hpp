#pragma once

#include "core/types.hpp"
#include <string>
#include <array>
#include <optional>
#include <vector>
#include <cstdint>

namespace asciimedia {

constexpr int CONFIG_VERSION = 1;

enum class DrawPolicy {
    Vectorized,
    Exact
};

const char* policy_name(DrawPolicy policy);
std::optional<DrawPolicy> parse_policy(const std::string& name);

struct ConfigRender {
    std::string chars;
    std::string font_path;
    int font_size = 20;
    int boldness = 2;
    int background = 255;
    std::optional<std::array<int, 3>> monochrome;
    bool clip = true;
    DrawPolicy policy = DrawPolicy::Vectorized;
};

struct ConfigPipeline {
    int cores = 0;
};

struct ConfigRandom {
    bool enabled = false;
    int width = 1920;
    int height = 1080;
    double fps = 30.0;
    double duration = 10.0;
    uint32_t seed = 0;
};

struct ConfigOutput {
    bool audio = true;
    std::string codec = "libx264";
    int bitrate = 8000000;
};

struct Config {
    int version = CONFIG_VERSION;
    std::string input;
    std::string output;
    ConfigRender render;
    ConfigPipeline pipeline;
    ConfigRandom random;
    ConfigOutput encode;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

// Immutable per-run settings consumed by the atlas builder, the compositor
// and the frame pipeline.
struct RenderConfig {
    std::vector<uint32_t> codepoints;
    std::string font_path;
    int font_size = 20;
    int boldness = 2;
    int background = 255;
    std::optional<Color> monochrome;
    bool clip = true;
    DrawPolicy policy = DrawPolicy::Vectorized;
    int workers = 0;

    bool white_background() const { return background == 255; }

    // Expects a validated Config; caps workers at the hardware concurrency.
    static RenderConfig from(const Config& config);
};

}
