#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <cmath>
#include <string>

#include <toml++/toml.hpp>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/palette/palette_registry.hpp"
#include "../src/classify/classifier.hpp"
#include "../src/classify/garment_attributes.hpp"
#include "../src/classify/color_scorer.hpp"
#include "../src/report/report_writer.hpp"

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

static bool near(double a, double b, double tol) {
    return std::abs(a - b) < tol;
}

static std::string write_temp_file(const std::string& name, const std::string& contents) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

TEST(builtin_registry_shape) {
    const PaletteRegistry& registry = PaletteRegistry::builtin();
    assert(registry.size() == 240);
    assert(&registry == &PaletteRegistry::builtin());

    for (MicroSeason micro : all_micro_seasons()) {
        const SeasonPalette& palette = registry.micro_season_palette(micro);
        assert(palette.size() == 20);
        for (ColorGroup group : all_color_groups()) {
            assert(palette.group(group).size() == 5);
        }
    }
}

TEST(white_matches_true_white) {
    ClassificationResult r = classify_garment("#FFFFFF");
    assert(r.nearest_palette_color);
    assert(r.nearest_palette_color->name == "True White");
    assert(near(*r.min_delta_e, 0.0, 1e-6));
    assert(r.micro_season_tag == MicroSeason::CoolWinter);
    assert(r.season_tag == ParentSeason::Winter);
    assert(r.group_tag == ColorGroup::Neutrals);
    assert(r.classification_status == ClassificationStatus::Good);

    assert(r.secondary_micro_season_tag == MicroSeason::LightSummer);
    assert(r.secondary_season_tag == ParentSeason::Summer);
    assert(r.secondary_group_tag == ColorGroup::Neutrals);
    assert(near(*r.secondary_delta_e, 3.1579, 1e-3));

    ClassificationResult shorthand = classify_garment("#fff");
    assert(shorthand.dominant_hex == "#fff");
    assert(shorthand.nearest_palette_color == r.nearest_palette_color);
    assert(shorthand.classification_status == r.classification_status);
}

TEST(far_field_is_unclassified) {
    ClassificationResult green = classify_garment("#008800");
    assert(green.classification_status == ClassificationStatus::Unclassified);
    assert(!green.micro_season_tag && !green.season_tag && !green.group_tag);
    assert(!green.has_secondary());
    assert(green.nearest_palette_color && green.nearest_palette_color->name == "Avocado");
    assert(near(*green.min_delta_e, 14.5991, 1e-3));
    assert(green.lab);

    ClassificationResult magenta = classify_garment("#AA11AA");
    assert(magenta.classification_status == ClassificationStatus::Unclassified);
    assert(magenta.nearest_palette_color->name == "Violet");
    assert(near(*magenta.min_delta_e, 13.8947, 1e-3));
}

TEST(exact_palette_hit_is_great) {
    ClassificationResult r = classify_garment("#C96541");
    assert(r.classification_status == ClassificationStatus::Great);
    assert(r.micro_season_tag == MicroSeason::WarmAutumn);
    assert(r.group_tag == ColorGroup::Accents);
    assert(r.nearest_palette_color->name == "Terracotta");
    assert(!r.has_secondary());
}

TEST(same_parent_near_tie_is_ambiguous) {
    ClassificationResult r = classify_garment("#000000");
    assert(r.micro_season_tag == MicroSeason::DeepWinter);
    assert(r.nearest_palette_color->name == "Black");
    assert(r.classification_status == ClassificationStatus::Ambiguous);
    assert(!r.has_secondary());
}

TEST(crossover_on_builtin_palette) {
    ClassificationResult r = classify_garment("#1E3A8A");
    assert(r.micro_season_tag == MicroSeason::DeepWinter);
    assert(r.group_tag == ColorGroup::Accents);
    assert(r.nearest_palette_color->name == "Ink Blue");
    assert(near(*r.min_delta_e, 4.9796, 1e-3));
    assert(r.classification_status == ClassificationStatus::Ambiguous);
    assert(r.secondary_micro_season_tag == MicroSeason::BrightSpring);
    assert(r.secondary_season_tag == ParentSeason::Spring);
    assert(r.secondary_group_tag == ColorGroup::Neutrals);
    assert(near(*r.secondary_delta_e, 5.6436, 1e-3));
}

TEST(classification_is_deterministic) {
    for (const char* hex : {"#FFFFFF", "#1E3A8A", "#008800", "#C96541", "bogus"}) {
        assert(classify_garment(hex) == classify_garment(hex));
    }
}

TEST(suits_profile_uses_primary_and_crossover) {
    ClassificationResult white = classify_garment("#FFFFFF");
    assert(suits_profile(white, ParentSeason::Winter));
    assert(suits_profile(white, ParentSeason::Summer));
    assert(!suits_profile(white, ParentSeason::Autumn));

    assert(suits_profile(classify_garment("#C96541"), ParentSeason::Autumn));
    assert(!suits_profile(classify_garment("#000000"), ParentSeason::Winter));
    assert(!suits_profile(classify_garment("#008800"), ParentSeason::Autumn));
}

TEST(score_on_builtin_palette) {
    ColorScorer scorer(PaletteRegistry::builtin());

    auto autumn = scorer.score("#C96541", UserProfile{ParentSeason::Autumn, std::nullopt});
    assert(autumn);
    assert(autumn->closest_micro_season == MicroSeason::WarmAutumn);
    assert(autumn->closest_group == ColorGroup::Accents);
    assert(autumn->closest_color.name == "Terracotta");
    assert(autumn->rating == ColorRating::Great);

    // warm terracotta on a cool season fails on undertone alone
    auto winter = scorer.score("#C96541", UserProfile{ParentSeason::Winter, std::nullopt});
    assert(winter);
    assert(parent_of(winter->closest_micro_season) == ParentSeason::Winter);
    assert(winter->undertone_conflict);
    assert(winter->rating == ColorRating::Risky);

    auto muted_autumn = scorer.score("#C96541", UserProfile{ParentSeason::Autumn, Clarity::Muted});
    assert(muted_autumn && muted_autumn->rating == ColorRating::Good);
}

TEST(palette_toml_round_trip) {
    const PaletteRegistry& builtin = PaletteRegistry::builtin();
    std::optional<PaletteRegistry> parsed;
    Result r = PaletteRegistry::parse_toml(builtin.to_toml(), parsed);
    assert(r.success());
    assert(parsed && parsed->size() == builtin.size());

    for (size_t i = 0; i < builtin.size(); ++i) {
        const RegistryEntry& a = builtin.entries()[i];
        const RegistryEntry& b = parsed->entries()[i];
        assert(a.micro_season == b.micro_season);
        assert(a.group == b.group);
        assert(a.color.name == b.color.name);
        assert(a.color.hex == b.color.hex);
    }

    Classifier classifier(*parsed);
    assert(classifier.classify("#1E3A8A") == classify_garment("#1E3A8A"));
}

TEST(palette_file_load) {
    std::string path = write_temp_file("seasonal_test_palette.toml",
        "palette_version = 1\n"
        "\n"
        "[[light_spring.accents]]\n"
        "name = \"Test Peach\"\n"
        "hex = \"#E0A080\"\n"
        "\n"
        "[[soft_autumn.softs]]\n"
        "name = \"Test Clay\"\n"
        "hex = \"DCA07E\"\n");

    std::optional<PaletteRegistry> registry;
    Result r = PaletteRegistry::load_file(path, registry);
    assert(r.success());
    assert(registry && registry->size() == 2);

    Classifier classifier(*registry);
    ClassificationResult result = classifier.classify("#E0A080");
    assert(result.classification_status == ClassificationStatus::Ambiguous);
    assert(result.secondary_season_tag == ParentSeason::Autumn);

    std::filesystem::remove(path);
}

TEST(config_load_from_file) {
    std::string path = write_temp_file("seasonal_test_config.toml",
        "config_version = 1\n"
        "\n"
        "[classifier]\n"
        "great_gap = 5.0\n"
        "\n"
        "[profile]\n"
        "season = \"winter\"\n"
        "depth = \"deep\"\n"
        "clarity = \"medium\"\n"
        "undertone = \"cool\"\n"
        "\n"
        "[output]\n"
        "format = \"json\"\n"
        "show_attributes = true\n");

    auto loaded = Config::load(path);
    assert(loaded);
    assert(loaded->config_path == path);
    assert(near(loaded->classifier.great_gap, 5.0, 1e-12));
    assert(near(loaded->classifier.unclassified_threshold, 12.0, 1e-12));
    assert(loaded->output.format == "json");
    assert(loaded->output.show_attributes);
    assert(resolve_home_micro_season(loaded->profile) == MicroSeason::DeepWinter);

    Config merged = merge_config(Config::defaults(), *loaded);
    assert(near(merged.classifier.great_gap, 5.0, 1e-12));
    assert(merged.profile.season == "winter");

    Classifier::Config cc = merged.classifier.to_classifier_config();
    assert(near(cc.great_gap, 5.0, 1e-12));
    assert(near(cc.crossover_threshold, 10.0, 1e-12));

    std::filesystem::remove(path);
}

TEST(report_formats) {
    GarmentAnalyzer analyzer;
    GarmentReport report;
    report.result = classify_garment("#C96541");
    report.attributes = analyzer.analyze(*report.result.lab);
    report.suits_profile = true;
    report.score = ColorScorer(PaletteRegistry::builtin()).score("#C96541", UserProfile{ParentSeason::Autumn, Clarity::Muted});

    std::vector<GarmentReport> reports = {report};
    ProfileSummary profile{ParentSeason::Autumn, MicroSeason::WarmAutumn};

    std::string toml_text = render_report(ReportFormat::Toml, reports, profile);
    toml::table parsed = toml::parse(toml_text);
    assert(parsed["profile"]["home_micro_season"].value<std::string>() == std::string("warm_autumn"));
    assert(parsed["garments"][0]["micro_season_tag"].value<std::string>() == std::string("warm_autumn"));
    assert(parsed["garments"][0]["classification_status"].value<std::string>() == std::string("great"));
    assert(parsed["garments"][0]["attributes"]["undertone"].value<std::string>() == std::string("warm"));
    assert(parsed["garments"][0]["suits_profile"].value<bool>() == true);
    // No crossover: the keys are omitted rather than written empty
    assert(!parsed["garments"][0]["secondary_season_tag"]);
    assert(parsed["garments"][0]["score"]["rating"].value<std::string>() == std::string("good"));
    assert(parsed["garments"][0]["score"]["base_rating"].value<std::string>() == std::string("great"));
    assert(parsed["garments"][0]["score"]["closest_color"]["name"].value<std::string>() == std::string("Terracotta"));
    assert(parsed["garments"][0]["score"]["clarity_capped"].value<bool>() == true);

    std::string json = render_report(ReportFormat::Json, reports, profile);
    assert(json.find("\"classification_status\"") != std::string::npos);
    assert(json.find("\"Terracotta\"") != std::string::npos);
    assert(json.find("secondary_season_tag") == std::string::npos);

    std::string text = render_report(ReportFormat::Text, reports, profile);
    assert(text.find("profile: autumn -> warm_autumn") != std::string::npos);
    assert(text.find("warm_autumn / autumn / accents") != std::string::npos);
    assert(text.find("crossover:  -") != std::string::npos);
    assert(text.find("Terracotta (#C96541)") != std::string::npos);
    assert(text.find("score:      good  dE 0.00 to Terracotta (warm_autumn / accents)  clarity capped  vivid")
           != std::string::npos);
}

TEST(palette_listing) {
    std::string listing = render_palette_listing(PaletteRegistry::builtin(), MicroSeason::DeepWinter);
    assert(listing.find("deep_winter (winter), 20 colors") != std::string::npos);
    assert(listing.find("Black") != std::string::npos);
    assert(listing.find("#000000") != std::string::npos);
}

int main() {
    std::cout << "=== Seasonal Integration Tests ===\n\n";

    RUN_TEST(builtin_registry_shape);
    RUN_TEST(white_matches_true_white);
    RUN_TEST(far_field_is_unclassified);
    RUN_TEST(exact_palette_hit_is_great);
    RUN_TEST(same_parent_near_tie_is_ambiguous);
    RUN_TEST(crossover_on_builtin_palette);
    RUN_TEST(classification_is_deterministic);
    RUN_TEST(suits_profile_uses_primary_and_crossover);
    RUN_TEST(score_on_builtin_palette);
    RUN_TEST(palette_toml_round_trip);
    RUN_TEST(palette_file_load);
    RUN_TEST(config_load_from_file);
    RUN_TEST(report_formats);
    RUN_TEST(palette_listing);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll integration tests passed.\n";
        return 0;
    }

    std::cout << "\nSome integration tests failed.\n";
    return 1;
}
