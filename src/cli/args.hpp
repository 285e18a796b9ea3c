#pragma once

#include <string>
#include <vector>

namespace seasonal {

struct Args {
    std::vector<std::string> colors;
    std::string config_path;
    std::string palette_path;
    std::string format;

    std::string season;
    std::string depth;
    std::string clarity;
    std::string undertone;

    std::string list_micro_season;
    bool dump_palette = false;
    bool show_attributes = false;

    bool show_help = false;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
