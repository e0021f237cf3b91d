#include "core/types.hpp"
#include "core/config.hpp"
#include "core/frame_source.hpp"
#include "core/frame_pipeline.hpp"
#include "glyph/font_loader.hpp"
#include "glyph/glyph_atlas.hpp"
#include "render/compositor.hpp"
#include "render/frame_sink.hpp"
#include "cli/args.hpp"

#include <cstdio>
#include <iostream>
#include <iomanip>

#ifdef _WIN32
#include <io.h>
#define ASCIIMEDIA_ISATTY _isatty
#define ASCIIMEDIA_FILENO _fileno
#else
#include <unistd.h>
#define ASCIIMEDIA_ISATTY isatty
#define ASCIIMEDIA_FILENO fileno
#endif

int main(int argc, char* argv[]) {
    asciimedia::Args args = asciimedia::parse_args(argc, argv);

    if (args.show_help) {
        asciimedia::print_help(argv[0]);
        return 0;
    }

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << "\n";
        }
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        return 1;
    }

    asciimedia::Config config = asciimedia::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = asciimedia::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = *loaded;
    } else if (auto loaded_default = asciimedia::Config::load_default()) {
        config = *loaded_default;
    }
    config = asciimedia::apply_cli_overrides(config, args);

    if (!config.random.enabled && config.input.empty()) {
        std::cerr << "Error: No input specified\n";
        asciimedia::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    const asciimedia::RenderConfig render = asciimedia::RenderConfig::from(config);
    if (config.pipeline.cores > render.workers) {
        std::cerr << "Warning: Using " << render.workers << " cores instead of " << config.pipeline.cores << "\n";
    }

    const float pixel_size = static_cast<float>(render.font_size);
    asciimedia::FontLoader font_loader;
    if (!render.font_path.empty()) {
        auto font_result = font_loader.load(render.font_path, pixel_size);
        if (!font_result.success()) {
            std::cerr << "Warning: Failed to load font: " << render.font_path << " - " << font_result.message << "\n";
        }
    }
    if (!font_loader.is_loaded()) {
        auto fallback_result = font_loader.load_system_fallback(pixel_size);
        if (!fallback_result.success()) {
            std::cerr << "Error: " << fallback_result.message << "\n";
            return 1;
        }
    }

    asciimedia::GlyphAtlasBuilder::Config atlas_cfg;
    atlas_cfg.codepoints = render.codepoints;
    atlas_cfg.font_size = render.font_size;
    atlas_cfg.boldness = render.boldness;
    atlas_cfg.background = render.background;

    asciimedia::GlyphAtlas atlas;
    auto atlas_result = asciimedia::GlyphAtlasBuilder(font_loader).build(atlas_cfg, atlas);
    if (!atlas_result.success()) {
        std::cerr << "Error: Failed to build glyph atlas: " << atlas_result.message << "\n";
        return 1;
    }

    asciimedia::Compositor compositor(atlas, font_loader, render);

    auto source = asciimedia::create_source(config);
    auto open_result = asciimedia::open_source(*source, config.input);
    if (!open_result.success()) {
        std::cerr << "Error: " << open_result.message << "\n";
        return 1;
    }

    auto sink = asciimedia::create_sink(config, source->is_still());

    asciimedia::FramePipeline pipeline(compositor);
    const bool show_progress = !source->is_still() && ASCIIMEDIA_ISATTY(ASCIIMEDIA_FILENO(stderr));
    if (show_progress) {
        pipeline.set_progress_callback([](int done, int expected) {
            std::cerr << "\rframe " << done << "/" << expected << std::flush;
        });
    }

    auto run_result = pipeline.run(*source, *sink);
    if (show_progress && pipeline.stats().frames > 0) {
        std::cerr << "\n";
    }
    if (!run_result.success()) {
        std::cerr << "Error: " << run_result.message << "\n";
        return 1;
    }

    const auto& stats = pipeline.stats();
    const double fps = stats.seconds > 0.0 ? stats.frames / stats.seconds : 0.0;
    std::cerr << std::fixed << std::setprecision(2)
              << "[PERF] frames=" << stats.frames
              << ", wall_s=" << stats.seconds
              << ", effective_fps=" << fps
              << ", policy=" << (render.workers > 1 && !source->is_still()
                                     ? asciimedia::policy_name(asciimedia::DrawPolicy::Exact)
                                     : asciimedia::policy_name(render.policy))
              << "\n";

    return 0;
}
