#include "core/config.hpp"
#include "classify/season_resolver.hpp"
#include "cli/args.hpp"
#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace seasonal {

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

bool validate_profile_tag(const std::string& value, const char* key,
                          bool (*parses)(const std::string&), std::string& error) {
    if (value.empty() || parses(value)) return true;
    error = std::string("profile.") + key + " has unknown value '" + value + "'";
    return false;
}

bool parses_season(const std::string& s) { return parse_parent_season(s).has_value(); }
bool parses_depth(const std::string& s) { return parse_depth(s).has_value(); }
bool parses_clarity(const std::string& s) { return parse_clarity(s).has_value(); }
bool parses_undertone(const std::string& s) { return parse_undertone(s).has_value(); }

}

Classifier::Config ConfigClassifier::to_classifier_config() const {
    Classifier::Config cfg;
    cfg.unclassified_threshold = unclassified_threshold;
    cfg.crossover_threshold = crossover_threshold;
    cfg.ambiguous_gap = ambiguous_gap;
    cfg.great_gap = great_gap;
    return cfg;
}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/seasonal";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (!std::isfinite(classifier.unclassified_threshold) || !std::isfinite(classifier.crossover_threshold) ||
        !std::isfinite(classifier.ambiguous_gap) || !std::isfinite(classifier.great_gap)) {
        error = "classifier thresholds must be finite numbers";
        return false;
    }
    if (classifier.unclassified_threshold <= 0.0 || classifier.unclassified_threshold > 100.0) {
        error = "classifier.unclassified_threshold must be > 0 and <= 100";
        return false;
    }
    if (classifier.crossover_threshold <= 0.0 ||
        classifier.crossover_threshold > classifier.unclassified_threshold) {
        error = "classifier.crossover_threshold must be > 0 and <= classifier.unclassified_threshold";
        return false;
    }
    if (classifier.ambiguous_gap < 0.0) {
        error = "classifier.ambiguous_gap must be >= 0";
        return false;
    }
    if (classifier.great_gap < classifier.ambiguous_gap) {
        error = "classifier.great_gap cannot be smaller than classifier.ambiguous_gap";
        return false;
    }
    if (output.format != "text" && output.format != "json" && output.format != "toml") {
        error = "output.format must be 'text', 'json', or 'toml'";
        return false;
    }
    if (!validate_profile_tag(profile.season, "season", parses_season, error)) return false;
    if (!validate_profile_tag(profile.depth, "depth", parses_depth, error)) return false;
    if (!validate_profile_tag(profile.clarity, "clarity", parses_clarity, error)) return false;
    if (!validate_profile_tag(profile.undertone, "undertone", parses_undertone, error)) return false;
    if (profile.season.empty() &&
        (!profile.depth.empty() || !profile.clarity.empty() || !profile.undertone.empty())) {
        error = "profile.season is required when depth, clarity, or undertone is set";
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

        if (auto palette = tbl["palette"]) {
            if (auto v = palette["path"].value<std::string>()) cfg.palette.path = *v;
        }

        if (auto classifier = tbl["classifier"]) {
            if (auto v = classifier["unclassified_threshold"].value<double>()) cfg.classifier.unclassified_threshold = *v;
            if (auto v = classifier["crossover_threshold"].value<double>()) cfg.classifier.crossover_threshold = *v;
            if (auto v = classifier["ambiguous_gap"].value<double>()) cfg.classifier.ambiguous_gap = *v;
            if (auto v = classifier["great_gap"].value<double>()) cfg.classifier.great_gap = *v;
        }

        if (auto profile = tbl["profile"]) {
            if (auto v = profile["season"].value<std::string>()) cfg.profile.season = *v;
            if (auto v = profile["depth"].value<std::string>()) cfg.profile.depth = *v;
            if (auto v = profile["clarity"].value<std::string>()) cfg.profile.clarity = *v;
            if (auto v = profile["undertone"].value<std::string>()) cfg.profile.undertone = *v;
        }

        if (auto output = tbl["output"]) {
            if (auto v = output["format"].value<std::string>()) cfg.output.format = *v;
            if (auto v = output["show_attributes"].value<bool>()) cfg.output.show_attributes = *v;
        }

        std::string error;
        if (!cfg.validate(error)) {
            return std::nullopt;
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

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config defaults = Config::defaults();

    if (!override.palette.path.empty()) result.palette.path = override.palette.path;

    if (override.classifier.unclassified_threshold != defaults.classifier.unclassified_threshold)
        result.classifier.unclassified_threshold = override.classifier.unclassified_threshold;
    if (override.classifier.crossover_threshold != defaults.classifier.crossover_threshold)
        result.classifier.crossover_threshold = override.classifier.crossover_threshold;
    if (override.classifier.ambiguous_gap != defaults.classifier.ambiguous_gap)
        result.classifier.ambiguous_gap = override.classifier.ambiguous_gap;
    if (override.classifier.great_gap != defaults.classifier.great_gap)
        result.classifier.great_gap = override.classifier.great_gap;

    if (!override.profile.season.empty()) result.profile.season = override.profile.season;
    if (!override.profile.depth.empty()) result.profile.depth = override.profile.depth;
    if (!override.profile.clarity.empty()) result.profile.clarity = override.profile.clarity;
    if (!override.profile.undertone.empty()) result.profile.undertone = override.profile.undertone;

    if (override.output.format != defaults.output.format) result.output.format = override.output.format;
    if (override.output.show_attributes) result.output.show_attributes = true;

    if (!override.config_path.empty()) result.config_path = override.config_path;
    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.palette_path.empty()) config.palette.path = args.palette_path;
    if (!args.format.empty()) config.output.format = args.format;
    if (args.show_attributes) config.output.show_attributes = true;

    if (!args.season.empty()) config.profile.season = args.season;
    if (!args.depth.empty()) config.profile.depth = args.depth;
    if (!args.clarity.empty()) config.profile.clarity = args.clarity;
    if (!args.undertone.empty()) config.profile.undertone = args.undertone;
    return config;
}

std::optional<MicroSeason> resolve_home_micro_season(const ConfigProfile& profile) {
    auto season = parse_parent_season(profile.season);
    if (!season) return std::nullopt;

    std::optional<Depth> depth;
    std::optional<Clarity> clarity;
    std::optional<Undertone> undertone;
    if (!profile.depth.empty()) {
        depth = parse_depth(profile.depth);
        if (!depth) return std::nullopt;
    }
    if (!profile.clarity.empty()) {
        clarity = parse_clarity(profile.clarity);
        if (!clarity) return std::nullopt;
    }
    if (!profile.undertone.empty()) {
        undertone = parse_undertone(profile.undertone);
        if (!undertone) return std::nullopt;
    }
    return determine_micro_season(*season, depth, clarity, undertone);
}

}
