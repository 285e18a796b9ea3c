#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/color_space.hpp"
#include "../src/palette/palette_registry.hpp"
#include "../src/classify/classifier.hpp"
#include "../src/cli/args.hpp"

using namespace seasonal;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static std::string write_temp_file(const std::string& name, const std::string& contents) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

static Args parse(std::vector<std::string> argv_strings) {
    argv_strings.insert(argv_strings.begin(), "seasonal");
    std::vector<char*> argv;
    for (auto& s : argv_strings) argv.push_back(s.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static Result parse_palette(const std::string& text) {
    std::optional<PaletteRegistry> out;
    Result r = PaletteRegistry::parse_toml(text, out);
    assert(r.success() == out.has_value());
    return r;
}

TEST(malformed_hex_is_data_not_exception) {
    for (const char* bad : {"", "#", "#12", "#1234", "#12345", "#GGGGGG", "red", "#FFFFFF00", "# FFF"}) {
        ClassificationResult r = classify_garment(bad);
        assert(r.dominant_hex == bad);
        assert(r.classification_status == ClassificationStatus::Unclassified);
        assert(!r.lab);
        assert(!r.micro_season_tag && !r.season_tag && !r.group_tag);
        assert(!r.nearest_palette_color && !r.min_delta_e);
        assert(!r.has_secondary() && !r.secondary_delta_e);
    }
}

TEST(surrounding_whitespace_is_trimmed) {
    auto padded = ColorSpace::hex_to_rgb("  #c96541\n");
    auto plain = ColorSpace::hex_to_rgb("#C96541");
    assert(padded && plain && *padded == *plain);

    ClassificationResult r = classify_garment(" #C96541 ");
    assert(r.micro_season_tag == MicroSeason::WarmAutumn);
    assert(r.dominant_hex == " #C96541 ");
}

TEST(empty_registry_never_matches) {
    PaletteRegistry registry(std::vector<PaletteEntry>{});
    assert(registry.empty());

    Classifier classifier(registry);
    ClassificationResult r = classifier.classify("#FFFFFF");
    assert(r.lab);
    assert(r.classification_status == ClassificationStatus::Unclassified);
    assert(!r.nearest_palette_color && !r.min_delta_e);
}

TEST(palette_errors_are_reported) {
    assert(parse_palette("palette_version = 1\n[[light_spring.accents]]\nname = \"A\"\nhex = \"#FFAA00\"\n").success());

    Result bad_syntax = parse_palette("palette_version = \n");
    assert(bad_syntax.error == ErrorCode::INVALID_FORMAT);
    assert(bad_syntax.message.find("line") != std::string::npos);

    Result unknown_micro = parse_palette("[[mid_spring.accents]]\nname = \"A\"\nhex = \"#FFAA00\"\n");
    assert(unknown_micro.error == ErrorCode::INVALID_FORMAT);
    assert(unknown_micro.message.find("mid_spring") != std::string::npos);

    Result unknown_group = parse_palette("[[light_spring.pastels]]\nname = \"A\"\nhex = \"#FFAA00\"\n");
    assert(unknown_group.error == ErrorCode::INVALID_FORMAT);

    Result missing_name = parse_palette("[[light_spring.accents]]\nhex = \"#FFAA00\"\n");
    assert(missing_name.error == ErrorCode::INVALID_FORMAT);
    assert(missing_name.message.find("name") != std::string::npos);

    Result bad_hex = parse_palette("[[light_spring.accents]]\nname = \"A\"\nhex = \"#FFAA0\"\n");
    assert(bad_hex.error == ErrorCode::INVALID_FORMAT);
    assert(bad_hex.message.find("#FFAA0") != std::string::npos);

    Result not_array = parse_palette("[light_spring]\naccents = \"#FFAA00\"\n");
    assert(not_array.error == ErrorCode::INVALID_FORMAT);

    Result wrong_version = parse_palette("palette_version = 7\n[[light_spring.accents]]\nname = \"A\"\nhex = \"#FFAA00\"\n");
    assert(wrong_version.error == ErrorCode::INVALID_FORMAT);

    Result string_version = parse_palette("palette_version = \"1\"\n[[light_spring.accents]]\nname = \"A\"\nhex = \"#FFAA00\"\n");
    assert(string_version.error == ErrorCode::INVALID_FORMAT);
    assert(string_version.message.find("palette_version") != std::string::npos);

    Result float_version = parse_palette("palette_version = 1.0\n[[light_spring.accents]]\nname = \"A\"\nhex = \"#FFAA00\"\n");
    assert(float_version.error == ErrorCode::INVALID_FORMAT);

    Result empty = parse_palette("palette_version = 1\n");
    assert(empty.error == ErrorCode::INVALID_FORMAT);
}

TEST(palette_file_missing) {
    std::optional<PaletteRegistry> out;
    Result r = PaletteRegistry::load_file("/nonexistent/seasonal/palette.toml", out);
    assert(r.error == ErrorCode::FILE_NOT_FOUND);
    assert(!out);
}

TEST(config_rejects_invalid_values) {
    std::string error;
    Config cfg = Config::defaults();
    assert(cfg.validate(error));

    cfg.classifier.great_gap = 1.0;
    assert(!cfg.validate(error));
    assert(error.find("great_gap") != std::string::npos);

    cfg = Config::defaults();
    cfg.classifier.crossover_threshold = 20.0;
    assert(!cfg.validate(error));

    cfg = Config::defaults();
    cfg.classifier.unclassified_threshold = 0.0;
    assert(!cfg.validate(error));

    cfg = Config::defaults();
    cfg.classifier.unclassified_threshold = std::numeric_limits<double>::quiet_NaN();
    assert(!cfg.validate(error));
    assert(error.find("finite") != std::string::npos);

    cfg = Config::defaults();
    cfg.classifier.great_gap = std::numeric_limits<double>::infinity();
    assert(!cfg.validate(error));

    cfg = Config::defaults();
    cfg.classifier.ambiguous_gap = std::numeric_limits<double>::quiet_NaN();
    assert(!cfg.validate(error));

    cfg = Config::defaults();
    cfg.output.format = "yaml";
    assert(!cfg.validate(error));

    cfg = Config::defaults();
    cfg.profile.season = "monsoon";
    assert(!cfg.validate(error));
    assert(error.find("monsoon") != std::string::npos);

    cfg = Config::defaults();
    cfg.profile.depth = "deep";
    assert(!cfg.validate(error));

    cfg.profile.season = "Winter";
    assert(cfg.validate(error));
}

TEST(config_load_failures) {
    assert(!Config::load("/nonexistent/seasonal/config.toml"));

    std::string wrong_version = write_temp_file("seasonal_edge_version.toml", "config_version = 2\n");
    assert(!Config::load(wrong_version));
    std::filesystem::remove(wrong_version);

    std::string invalid = write_temp_file("seasonal_edge_invalid.toml",
        "[classifier]\nambiguous_gap = 6.0\ngreat_gap = 4.0\n");
    assert(!Config::load(invalid));
    std::filesystem::remove(invalid);

    std::string nan_threshold = write_temp_file("seasonal_edge_nan.toml",
        "[classifier]\nunclassified_threshold = nan\n");
    assert(!Config::load(nan_threshold));
    std::filesystem::remove(nan_threshold);

    std::string nan_gap = write_temp_file("seasonal_edge_nan_gap.toml",
        "[classifier]\ngreat_gap = nan\n");
    assert(!Config::load(nan_gap));
    std::filesystem::remove(nan_gap);

    std::string inf_crossover = write_temp_file("seasonal_edge_inf.toml",
        "[classifier]\ncrossover_threshold = -inf\n");
    assert(!Config::load(inf_crossover));
    std::filesystem::remove(inf_crossover);

    std::string broken = write_temp_file("seasonal_edge_broken.toml", "[output\nformat = \"json\"\n");
    assert(!Config::load(broken));
    std::filesystem::remove(broken);
}

TEST(default_config_path_layout) {
    std::string path = Config::default_config_path();
    assert(path.find("seasonal") != std::string::npos);
    assert(path.size() >= 11 && path.substr(path.size() - 11) == "config.toml");
}

TEST(home_micro_season_resolution) {
    ConfigProfile profile;
    assert(!resolve_home_micro_season(profile));

    profile.season = "spring";
    assert(resolve_home_micro_season(profile) == MicroSeason::WarmSpring);

    profile.depth = "light";
    assert(resolve_home_micro_season(profile) == MicroSeason::LightSpring);

    profile.clarity = "blurry";
    assert(!resolve_home_micro_season(profile));
}

TEST(args_parsing) {
    Args args = parse({"#FFFFFF", "--format", "json", "-s", "winter", "--depth", "deep",
                       "--attributes", "C96541"});
    assert(args.colors.size() == 2);
    assert(args.colors[0] == "#FFFFFF");
    assert(args.colors[1] == "C96541");
    assert(args.format == "json");
    assert(args.season == "winter");
    assert(args.depth == "deep");
    assert(args.show_attributes);
    assert(!args.show_help);

    Args help = parse({"#FFFFFF", "-h", "--format", "json"});
    assert(help.show_help);
    assert(help.format.empty());

    Args bad_format = parse({"--format", "yaml"});
    assert(bad_format.format.empty());

    Args traversal = parse({"--palette", "../../etc/palette.toml", "--config", "ok.toml"});
    assert(traversal.palette_path.empty());
    assert(traversal.config_path == "ok.toml");

    Args listing = parse({"--list", "soft_summer", "--dump-palette"});
    assert(listing.list_micro_season == "soft_summer");
    assert(listing.dump_palette);

    Args dangling = parse({"--season"});
    assert(dangling.season.empty());
}

TEST(cli_overrides_config) {
    Config cfg = Config::defaults();
    cfg.profile.season = "summer";
    cfg.output.format = "toml";

    Args args = parse({"--season", "autumn", "--clarity", "muted", "-p", "palette.toml"});
    Config merged = apply_cli_overrides(cfg, args);
    assert(merged.profile.season == "autumn");
    assert(merged.profile.clarity == "muted");
    assert(merged.output.format == "toml");
    assert(merged.palette.path == "palette.toml");
    assert(resolve_home_micro_season(merged.profile) == MicroSeason::SoftAutumn);
}

TEST(season_palette_group_access) {
    SeasonPalette palette;
    palette.group(ColorGroup::Brights).push_back({"X", "#FF0000", Lab(53.24, 80.09, 67.2)});
    assert(palette.brights.size() == 1);
    assert(palette.size() == 1);

    bool threw = false;
    try {
        palette.group(static_cast<ColorGroup>(42));
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw && "Should throw on unknown color group");
}

int main() {
    std::cout << "=== Seasonal Edge Case Tests ===\n\n";

    RUN_TEST(malformed_hex_is_data_not_exception);
    RUN_TEST(surrounding_whitespace_is_trimmed);
    RUN_TEST(empty_registry_never_matches);
    RUN_TEST(palette_errors_are_reported);
    RUN_TEST(palette_file_missing);
    RUN_TEST(config_rejects_invalid_values);
    RUN_TEST(config_load_failures);
    RUN_TEST(default_config_path_layout);
    RUN_TEST(home_micro_season_resolution);
    RUN_TEST(args_parsing);
    RUN_TEST(cli_overrides_config);
    RUN_TEST(season_palette_group_access);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll edge case tests passed.\n";
        return 0;
    }

    std::cout << "\nSome edge case tests failed.\n";
    return 1;
}
