#pragma once

#include "core/types.hpp"
#include "classify/classifier.hpp"
#include <optional>
#include <string>

namespace seasonal {

constexpr int CONFIG_VERSION = 1;

struct ConfigPalette {
    std::string path;
};

struct ConfigClassifier {
    double unclassified_threshold = 12.0;
    double crossover_threshold = 10.0;
    double ambiguous_gap = 2.0;
    double great_gap = 4.0;

    Classifier::Config to_classifier_config() const;
};

struct ConfigProfile {
    std::string season;
    std::string depth;
    std::string clarity;
    std::string undertone;

    bool empty() const { return season.empty(); }
};

struct ConfigOutput {
    std::string format = "text";
    bool show_attributes = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigPalette palette;
    ConfigClassifier classifier;
    ConfigProfile profile;
    ConfigOutput output;

    std::string config_path;

    bool validate(std::string& error) const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

// Home micro-season for a configured profile; empty when no season is set or
// a tag does not parse.
std::optional<MicroSeason> resolve_home_micro_season(const ConfigProfile& profile);

}
