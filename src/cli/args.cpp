#include "args.hpp"
#include <charconv>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <sstream>

namespace asciimedia {

namespace {

bool parse_int(const char* text, int& out) {
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, out);
    return ec == std::errc() && ptr == end;
}

bool parse_double(const char* text, double& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

}

bool parse_rgb(const std::string& text, std::array<int, 3>& out) {
    std::stringstream ss(text);
    std::string part;
    int count = 0;
    while (std::getline(ss, part, ',')) {
        if (count >= 3) return false;
        int value = 0;
        if (!parse_int(part.c_str(), value)) return false;
        out[count++] = value;
    }
    return count == 3;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    std::vector<std::string> positional;

    auto next_value = [&](int& i, const char* flag) -> const char* {
        if (i + 1 < argc) return argv[++i];
        args.errors.push_back(std::string("Missing value for ") + flag);
        return nullptr;
    };

    auto read_int = [&](int& i, const char* flag, std::optional<int>& field) {
        const char* value = next_value(i, flag);
        if (!value) return;
        int parsed = 0;
        if (!parse_int(value, parsed)) {
            args.errors.push_back(std::string("Invalid integer for ") + flag + ": " + value);
            return;
        }
        field = parsed;
    };

    auto read_double = [&](int& i, const char* flag, std::optional<double>& field) {
        const char* value = next_value(i, flag);
        if (!value) return;
        double parsed = 0.0;
        if (!parse_double(value, parsed)) {
            args.errors.push_back(std::string("Invalid number for ") + flag + ": " + value);
            return;
        }
        field = parsed;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "--chars") == 0 || strcmp(arg, "-chars") == 0) {
            if (const char* v = next_value(i, arg)) args.chars = v;
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--font-size") == 0) {
            read_int(i, arg, args.font_size);
        }
        else if (strcmp(arg, "-b") == 0 || strcmp(arg, "--boldness") == 0) {
            read_int(i, arg, args.boldness);
        }
        else if (strcmp(arg, "--bg") == 0 || strcmp(arg, "-bg") == 0) {
            read_int(i, arg, args.background);
        }
        else if (strcmp(arg, "-m") == 0 || strcmp(arg, "--mono") == 0) {
            if (const char* v = next_value(i, arg)) {
                std::array<int, 3> rgb{};
                if (parse_rgb(v, rgb)) {
                    args.monochrome = rgb;
                } else {
                    args.errors.push_back(std::string("Invalid color for ") + arg + " (expected R,G,B): " + v);
                }
            }
        }
        else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--exact") == 0) {
            args.exact = true;
        }
        else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--no-clip") == 0) {
            args.no_clip = true;
        }
        else if (strcmp(arg, "-r") == 0 || strcmp(arg, "--random") == 0) {
            args.random = true;
        }
        else if (strcmp(arg, "--width") == 0 || strcmp(arg, "-width") == 0) {
            read_int(i, arg, args.width);
        }
        else if (strcmp(arg, "--height") == 0 || strcmp(arg, "-height") == 0) {
            read_int(i, arg, args.height);
        }
        else if (strcmp(arg, "--cores") == 0 || strcmp(arg, "-cores") == 0) {
            read_int(i, arg, args.cores);
        }
        else if (strcmp(arg, "--fps") == 0 || strcmp(arg, "-fps") == 0) {
            read_double(i, arg, args.fps);
        }
        else if (strcmp(arg, "--duration") == 0 || strcmp(arg, "-dur") == 0) {
            read_double(i, arg, args.duration);
        }
        else if (strcmp(arg, "--seed") == 0) {
            std::optional<int> seed;
            read_int(i, arg, seed);
            if (seed) {
                if (*seed < 0) {
                    args.errors.push_back("Seed must not be negative");
                } else {
                    args.seed = static_cast<unsigned long>(*seed);
                }
            }
        }
        else if (strcmp(arg, "--font") == 0) {
            if (const char* v = next_value(i, arg)) args.font_path = v;
        }
        else if (strcmp(arg, "--config") == 0) {
            if (const char* v = next_value(i, arg)) args.config_path = v;
        }
        else if (strcmp(arg, "--no-audio") == 0) {
            args.no_audio = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.errors.push_back(std::string("Unknown option: ") + arg);
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.size() > 2) {
        args.errors.push_back("Too many positional arguments");
    }
    if (!positional.empty()) args.input = positional[0];
    if (positional.size() >= 2) args.output = positional[1];

    if (!args.input.empty() && !validate_path(args.input)) {
        args.errors.push_back("Invalid input path");
    }
    if (!args.output.empty() && !validate_path(args.output)) {
        args.errors.push_back("Invalid output path");
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <INPUT> <OUTPUT>\n\n", prog);
    printf("Converts an image or video into an ASCII rendering.\n\n");
    printf("INPUT / OUTPUT:\n");
    printf("  Image or video paths. Image extensions (.png, .jpg, .bmp, ...) select still\n");
    printf("  image mode; anything else is treated as video.\n\n");
    printf("OPTIONS:\n");
    printf("      --chars <STR>       Characters to use (filtered against the built-in ordering)\n");
    printf("  -f, --font-size <N>     Font size in pixels (default: 20)\n");
    printf("  -b, --boldness <N>      Stroke width; about 1/10 of the font size works well (default: 2)\n");
    printf("  -d, --exact             Draw every character with the font rasterizer (slow)\n");
    printf("      --bg <0|255>        Background: 255 for white, 0 for black (default: 255)\n");
    printf("  -m, --mono <R,G,B>      Draw all characters in one color\n");
    printf("  -c, --no-clip           Let characters extend past the image bounds\n");
    printf("  -r, --random            Render random noise instead of reading INPUT\n");
    printf("      --width <N>         Width of random media (default: 1920)\n");
    printf("      --height <N>        Height of random media (default: 1080)\n");
    printf("      --fps <N>           Frame rate of random video (default: 30)\n");
    printf("      --duration <N>      Duration in seconds of random video (default: 10)\n");
    printf("      --seed <N>          Seed for random media\n");
    printf("      --cores <N>         Frames converted in parallel (default: 0, sequential)\n");
    printf("      --font <PATH>       TrueType/OpenType font (auto-detects a monospace font)\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --no-audio          Do not copy the source audio into the output video\n");
    printf("  -h, --help              Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/ascii-media/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/ascii-media/config.toml\n");
    printf("    Windows: %%APPDATA%%\\ascii-media\\config.toml\n");
}

}
