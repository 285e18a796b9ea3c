#include "core/types.hpp"
#include "core/config.hpp"
#include "palette/palette_registry.hpp"
#include "classify/classifier.hpp"
#include "classify/color_scorer.hpp"
#include "classify/garment_attributes.hpp"
#include "report/report_writer.hpp"
#include "cli/args.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    seasonal::Args args = seasonal::parse_args(argc, argv);

    if (args.show_help) {
        seasonal::print_help(argv[0]);
        return 0;
    }

    seasonal::Config config = seasonal::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = seasonal::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = seasonal::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = seasonal::Config::load_default()) {
            config = seasonal::merge_config(config, *loaded_default);
        }
    }
    config = seasonal::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    std::optional<seasonal::PaletteRegistry> loaded_palette;
    const seasonal::PaletteRegistry* registry = nullptr;
    if (!config.palette.path.empty()) {
        seasonal::Result r = seasonal::PaletteRegistry::load_file(config.palette.path, loaded_palette);
        if (r.failure()) {
            std::cerr << "Error: Failed to load palette: " << r.message << "\n";
            return 1;
        }
        registry = &*loaded_palette;
    } else {
        try {
            registry = &seasonal::PaletteRegistry::builtin();
        } catch (const std::invalid_argument& e) {
            std::cerr << "Error: Built-in palette is invalid: " << e.what() << "\n";
            return 1;
        }
    }

    if (args.dump_palette) {
        std::cout << registry->to_toml();
        return 0;
    }

    if (!args.list_micro_season.empty()) {
        auto micro = seasonal::parse_micro_season(args.list_micro_season);
        if (!micro) {
            std::cerr << "Error: Unknown micro-season: " << args.list_micro_season << "\n";
            return 1;
        }
        std::cout << seasonal::render_palette_listing(*registry, *micro);
        return 0;
    }

    if (args.colors.empty()) {
        std::cerr << "Error: No input specified\n";
        seasonal::print_help(argv[0]);
        return 1;
    }

    // validate() already rejected unknown formats
    seasonal::ReportFormat format =
        seasonal::parse_report_format(config.output.format).value_or(seasonal::ReportFormat::Text);

    std::optional<seasonal::ProfileSummary> profile;
    seasonal::UserProfile user;
    if (!config.profile.empty()) {
        auto season = seasonal::parse_parent_season(config.profile.season);
        auto home = seasonal::resolve_home_micro_season(config.profile);
        if (season && home) {
            profile = seasonal::ProfileSummary{*season, *home};
            user.season = *season;
            if (!config.profile.clarity.empty()) user.clarity = seasonal::parse_clarity(config.profile.clarity);
        }
    }

    seasonal::Classifier classifier(*registry, config.classifier.to_classifier_config());
    seasonal::GarmentAnalyzer analyzer;
    seasonal::ColorScorer scorer(*registry);

    std::vector<seasonal::GarmentReport> reports;
    reports.reserve(args.colors.size());
    bool malformed_input = false;

    for (const auto& hex : args.colors) {
        seasonal::GarmentReport report;
        report.result = classifier.classify(hex);

        if (!report.result.lab) {
            std::cerr << "Warning: Not a valid hex color: " << hex << "\n";
            malformed_input = true;
        }
        if (config.output.show_attributes && report.result.lab) {
            report.attributes = analyzer.analyze(*report.result.lab);
        }
        if (profile) {
            report.suits_profile = seasonal::suits_profile(report.result, profile->season);
            if (report.result.lab) {
                report.score = scorer.score(*report.result.lab, user);
            }
        }
        reports.push_back(std::move(report));
    }

    std::cout << seasonal::render_report(format, reports, profile);

    return malformed_input ? 2 : 0;
}
