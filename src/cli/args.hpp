#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace asciimedia {

struct Args {
    std::string input;
    std::string output;
    std::string config_path;
    std::optional<std::string> chars;
    std::optional<std::string> font_path;

    std::optional<int> font_size;
    std::optional<int> boldness;
    std::optional<int> background;
    std::optional<std::array<int, 3>> monochrome;
    std::optional<int> cores;

    std::optional<int> width;
    std::optional<int> height;
    std::optional<double> fps;
    std::optional<double> duration;
    std::optional<unsigned long> seed;

    bool exact = false;
    bool no_clip = false;
    bool random = false;
    bool no_audio = false;

    bool show_help = false;

    // Problems found while parsing; the caller reports them and exits.
    std::vector<std::string> errors;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

bool parse_rgb(const std::string& text, std::array<int, 3>& out);

}
