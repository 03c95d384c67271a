#pragma once
#include "util/log.h"
#include <string>
#include <vector>
#include <optional>

namespace rastile {

/* Runtime settings. Loaded from JSON, then overridden by command-line flags. */
struct Config {
    /* Raster-processing service */
    std::string engine_url = "http://127.0.0.1:8765";
    long engine_timeout_s = 30;
    std::string user_agent = "rastile/0.1";

    /* Tiles */
    int tile_cache_size = 500;
    int tile_size = 256;
    int min_zoom = 0;
    int max_zoom = 22;
    int fetch_threads = 1;

    /* Degrees per pixel for non-georeferenced imagery */
    double pixel_scale = 0.01;

    /* Path prefixes of remote/streamed datasets whose tiles depend on overview level */
    std::vector<std::string> remote_prefixes = {"/vsicurl/"};

    LogLevel log_level = LogLevel::Info;
};

/* Default config location: $HOME/.config/rastile/config.json */
std::string config_default_path();

/* Read a JSON config file. Missing keys keep their defaults.
   Returns nullopt if the file is missing or malformed (reason is logged). */
std::optional<Config> config_load(const std::string& path);

/* Load from path, falling back to defaults on any failure. */
Config config_load_or_default(const std::string& path);

bool config_save(const Config& cfg, const std::string& path);

} // namespace rastile
