#include "util/config.h"
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;
namespace pt = boost::property_tree;

namespace rastile {

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

std::string config_default_path() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home) + "/.config/rastile/config.json";
    return "/tmp/rastile/config.json";
}

std::optional<Config> config_load(const std::string& path) {
    if (!fs::exists(path)) {
        LOG_DEBUG("No config file at %s", path.c_str());
        return std::nullopt;
    }

    pt::ptree tree;
    try {
        pt::read_json(path, tree);
    } catch (const pt::json_parser_error& e) {
        LOG_ERROR("Failed to parse config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    Config cfg;
    try {
        cfg.engine_url       = tree.get("engine.url", cfg.engine_url);
        cfg.engine_timeout_s = tree.get("engine.timeout_s", cfg.engine_timeout_s);
        cfg.user_agent       = tree.get("engine.user_agent", cfg.user_agent);

        cfg.tile_cache_size = tree.get("tiles.cache_size", cfg.tile_cache_size);
        cfg.tile_size       = tree.get("tiles.tile_size", cfg.tile_size);
        cfg.min_zoom        = tree.get("tiles.min_zoom", cfg.min_zoom);
        cfg.max_zoom        = tree.get("tiles.max_zoom", cfg.max_zoom);
        cfg.fetch_threads   = tree.get("tiles.fetch_threads", cfg.fetch_threads);

        cfg.pixel_scale = tree.get("pixel_scale", cfg.pixel_scale);

        if (auto prefixes = tree.get_child_optional("remote_prefixes")) {
            cfg.remote_prefixes.clear();
            for (auto& [_, node] : *prefixes) {
                cfg.remote_prefixes.push_back(node.get_value<std::string>());
            }
        }

        cfg.log_level = log_level_from_string(
            tree.get<std::string>("log_level", level_name(cfg.log_level)));
    } catch (const pt::ptree_bad_data& e) {
        LOG_ERROR("Invalid value in config %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    if (cfg.tile_cache_size < 1) {
        LOG_WARN("tiles.cache_size must be >= 1, using 1");
        cfg.tile_cache_size = 1;
    }
    if (cfg.fetch_threads < 1) cfg.fetch_threads = 1;
    if (cfg.pixel_scale <= 0.0) {
        LOG_WARN("pixel_scale must be positive, using 0.01");
        cfg.pixel_scale = 0.01;
    }

    LOG_INFO("Loaded config from %s", path.c_str());
    return cfg;
}

Config config_load_or_default(const std::string& path) {
    auto cfg = config_load(path);
    return cfg ? *cfg : Config{};
}

bool config_save(const Config& cfg, const std::string& path) {
    pt::ptree tree;
    tree.put("engine.url", cfg.engine_url);
    tree.put("engine.timeout_s", cfg.engine_timeout_s);
    tree.put("engine.user_agent", cfg.user_agent);
    tree.put("tiles.cache_size", cfg.tile_cache_size);
    tree.put("tiles.tile_size", cfg.tile_size);
    tree.put("tiles.min_zoom", cfg.min_zoom);
    tree.put("tiles.max_zoom", cfg.max_zoom);
    tree.put("tiles.fetch_threads", cfg.fetch_threads);
    tree.put("pixel_scale", cfg.pixel_scale);

    pt::ptree prefixes;
    for (auto& p : cfg.remote_prefixes) {
        pt::ptree item;
        item.put_value(p);
        prefixes.push_back(std::make_pair("", item));
    }
    tree.add_child("remote_prefixes", prefixes);
    tree.put("log_level", level_name(cfg.log_level));

    std::error_code ec;
    fs::path dir = fs::path(path).parent_path();
    if (!dir.empty()) fs::create_directories(dir, ec);
    if (ec) {
        LOG_WARN("Failed to create config directory for: %s", path.c_str());
        return false;
    }

    try {
        pt::write_json(path, tree);
    } catch (const pt::json_parser_error& e) {
        LOG_ERROR("Failed to write config %s: %s", path.c_str(), e.what());
        return false;
    }
    return true;
}

} // namespace rastile
