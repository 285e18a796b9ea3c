#include "args.hpp"
#include <cstring>
#include <cstdio>

namespace seasonal {

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find("..") != std::string::npos) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "--config") == 0) {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) {
                    args.config_path.clear();
                }
            }
        }
        else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--palette") == 0) {
            if (i + 1 < argc) {
                args.palette_path = argv[++i];
                if (!validate_path(args.palette_path)) {
                    args.palette_path.clear();
                }
            }
        }
        else if (strcmp(arg, "-f") == 0 || strcmp(arg, "--format") == 0) {
            if (i + 1 < argc) {
                std::string fmt = argv[++i];
                if (fmt == "text" || fmt == "json" || fmt == "toml") {
                    args.format = fmt;
                }
            }
        }
        else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--season") == 0) {
            if (i + 1 < argc) args.season = argv[++i];
        }
        else if (strcmp(arg, "--depth") == 0) {
            if (i + 1 < argc) args.depth = argv[++i];
        }
        else if (strcmp(arg, "--clarity") == 0) {
            if (i + 1 < argc) args.clarity = argv[++i];
        }
        else if (strcmp(arg, "--undertone") == 0) {
            if (i + 1 < argc) args.undertone = argv[++i];
        }
        else if (strcmp(arg, "-a") == 0 || strcmp(arg, "--attributes") == 0) {
            args.show_attributes = true;
        }
        else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--list") == 0) {
            if (i + 1 < argc) args.list_micro_season = argv[++i];
        }
        else if (strcmp(arg, "--dump-palette") == 0) {
            args.dump_palette = true;
        }
        else if (arg[0] != '-') {
            args.colors.emplace_back(arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <HEX>...\n\n", prog);
    printf("HEX:\n");
    printf("  Garment color as #RRGGBB, RRGGBB, #RGB or RGB (quote the '#' in most shells)\n\n");
    printf("OPTIONS:\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("  -p, --palette <FILE>    Load reference palette from a TOML file\n");
    printf("  -f, --format <FMT>      Output format: text, json, toml (default: text)\n");
    printf("  -s, --season <NAME>     Profile season: spring, summer, autumn, winter\n");
    printf("      --depth <NAME>      Profile depth: light, medium, deep\n");
    printf("      --clarity <NAME>    Profile clarity: muted, medium, clear, vivid\n");
    printf("      --undertone <NAME>  Profile undertone: warm, cool, neutral, olive\n");
    printf("  -a, --attributes        Report undertone, depth, and clarity of each garment\n");
    printf("  -l, --list <MICRO>      List the reference colors of one micro-season\n");
    printf("      --dump-palette      Print the active palette as TOML and exit\n");
    printf("  -h, --help              Show this help\n");
    printf("\nEXIT STATUS:\n");
    printf("  0  all inputs classified (including unclassified results)\n");
    printf("  1  config or palette error\n");
    printf("  2  one or more inputs were not valid hex colors\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/seasonal/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/seasonal/config.toml\n");
    printf("    Windows: %%APPDATA%%\\seasonal\\config.toml\n");
}

}
