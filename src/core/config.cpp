#include "core/config.hpp"
#include "cli/args.hpp"
#include "glyph/char_sets.hpp"
#include <toml.hpp>

#include <filesystem>
#include <algorithm>
#include <cstdlib>
#include <thread>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace asciimedia {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

bool in_byte_range(int v) {
    return v >= 0 && v <= 255;
}

}

const char* policy_name(DrawPolicy policy) {
    switch (policy) {
        case DrawPolicy::Exact: return "exact";
        case DrawPolicy::Vectorized: return "vectorized";
    }
    return "vectorized";
}

std::optional<DrawPolicy> parse_policy(const std::string& name) {
    if (name == "exact") return DrawPolicy::Exact;
    if (name == "vectorized") return DrawPolicy::Vectorized;
    return std::nullopt;
}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/ascii-media";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (render.background != 0 && render.background != 255) {
        error = "render.background must be 0 (black) or 255 (white), got " + std::to_string(render.background);
        return false;
    }
    if (render.font_size <= 0) {
        error = "render.font_size must be positive";
        return false;
    }
    if (render.boldness < 0) {
        error = "render.boldness must not be negative";
        return false;
    }
    if (render.monochrome) {
        const auto& rgb = *render.monochrome;
        if (!in_byte_range(rgb[0]) || !in_byte_range(rgb[1]) || !in_byte_range(rgb[2])) {
            error = "render.monochrome components must be between 0 and 255";
            return false;
        }
    }
    if (CharSet::select(render.chars).empty()) {
        error = "render.chars selects no usable characters";
        return false;
    }
    if (pipeline.cores < 0) {
        error = "pipeline.cores must not be negative";
        return false;
    }
    if (random.enabled) {
        if (random.width <= 0 || random.height <= 0) {
            error = "random.width and random.height must be positive";
            return false;
        }
        if (random.fps <= 0.0 || random.duration <= 0.0) {
            error = "random.fps and random.duration must be positive";
            return false;
        }
    } else if (input.empty()) {
        error = "no input specified";
        return false;
    }
    if (output.empty()) {
        error = "no output specified";
        return false;
    }
    if (encode.bitrate <= 0) {
        error = "output.bitrate must be positive";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                return std::nullopt;
            }
        }

        if (auto render = tbl["render"]) {
            if (auto v = render["chars"].value<std::string>()) cfg.render.chars = *v;
            if (auto v = render["font"].value<std::string>()) cfg.render.font_path = *v;
            if (auto v = render["font_size"].value<int>()) cfg.render.font_size = *v;
            if (auto v = render["boldness"].value<int>()) cfg.render.boldness = *v;
            if (auto v = render["background"].value<int>()) cfg.render.background = *v;
            if (auto v = render["clip"].value<bool>()) cfg.render.clip = *v;
            if (auto v = render["policy"].value<std::string>()) {
                auto policy = parse_policy(*v);
                if (!policy) return std::nullopt;
                cfg.render.policy = *policy;
            }
            if (auto arr = render["monochrome"].as_array()) {
                if (arr->size() != 3) return std::nullopt;
                std::array<int, 3> rgb{};
                for (size_t i = 0; i < 3; ++i) {
                    auto c = (*arr)[i].value<int>();
                    if (!c) return std::nullopt;
                    rgb[i] = *c;
                }
                cfg.render.monochrome = rgb;
            }
        }

        if (auto pipeline = tbl["pipeline"]) {
            if (auto v = pipeline["cores"].value<int>()) cfg.pipeline.cores = *v;
        }

        if (auto random = tbl["random"]) {
            if (auto v = random["enabled"].value<bool>()) cfg.random.enabled = *v;
            if (auto v = random["width"].value<int>()) cfg.random.width = *v;
            if (auto v = random["height"].value<int>()) cfg.random.height = *v;
            if (auto v = random["fps"].value<double>()) cfg.random.fps = *v;
            if (auto v = random["duration"].value<double>()) cfg.random.duration = *v;
            if (auto v = random["seed"].value<int64_t>()) cfg.random.seed = static_cast<uint32_t>(*v);
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["audio"].value<bool>()) cfg.encode.audio = *v;
            if (auto v = output["codec"].value<std::string>()) cfg.encode.codec = *v;
            if (auto v = output["bitrate"].value<int>()) cfg.encode.bitrate = *v;
        }

        return cfg;
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.input.empty()) config.input = args.input;
    if (!args.output.empty()) config.output = args.output;
    if (args.chars) config.render.chars = *args.chars;
    if (args.font_path) config.render.font_path = *args.font_path;
    if (args.font_size) config.render.font_size = *args.font_size;
    if (args.boldness) config.render.boldness = *args.boldness;
    if (args.background) config.render.background = *args.background;
    if (args.monochrome) config.render.monochrome = *args.monochrome;
    if (args.no_clip) config.render.clip = false;
    if (args.exact) config.render.policy = DrawPolicy::Exact;
    if (args.cores) config.pipeline.cores = *args.cores;

    if (args.random) config.random.enabled = true;
    if (args.width) config.random.width = *args.width;
    if (args.height) config.random.height = *args.height;
    if (args.fps) config.random.fps = *args.fps;
    if (args.duration) config.random.duration = *args.duration;
    if (args.seed) config.random.seed = static_cast<uint32_t>(*args.seed);

    if (args.no_audio) config.encode.audio = false;
    return config;
}

RenderConfig RenderConfig::from(const Config& config) {
    RenderConfig rc;
    rc.codepoints = CharSet::select(config.render.chars);
    rc.font_path = config.render.font_path;
    rc.font_size = config.render.font_size;
    rc.boldness = config.render.boldness;
    rc.background = config.render.background;
    if (config.render.monochrome) {
        const auto& rgb = *config.render.monochrome;
        rc.monochrome = Color(static_cast<uint8_t>(rgb[0]),
                              static_cast<uint8_t>(rgb[1]),
                              static_cast<uint8_t>(rgb[2]));
    }
    rc.clip = config.render.clip;
    rc.policy = config.render.policy;

    int hardware = static_cast<int>(std::thread::hardware_concurrency());
    rc.workers = config.pipeline.cores;
    if (hardware > 0) {
        rc.workers = std::min(rc.workers, hardware);
    }
    return rc;
}

}
