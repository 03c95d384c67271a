#ifndef RASTILE_H
#define RASTILE_H

#include "types.h"

#ifdef _WIN32
  #ifdef RASTILE_EXPORTS
    #define RASTILE_API __declspec(dllexport)
  #else
    #define RASTILE_API __declspec(dllimport)
  #endif
#else
  #define RASTILE_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ── Lifecycle ─────────────────────────────────────────────────────── */
/* engine_url may be NULL to use the configured/default service. 1 on success. */
RASTILE_API int  rastile_init(const char* engine_url);
RASTILE_API void rastile_shutdown(void);

/* ── Layers ────────────────────────────────────────────────────────── */
/* Writes the new layer id (NUL-terminated, truncated to cap). 1 on success. */
RASTILE_API int  rastile_open_raster(const char* path, char* out_id, int cap);
RASTILE_API int  rastile_remove_layer(const char* id);

/* ── Display ───────────────────────────────────────────────────────── */
RASTILE_API int  rastile_set_band(const char* id, int band);
RASTILE_API int  rastile_set_stretch(const char* id, rastile_stretch_t stretch);
RASTILE_API int  rastile_set_display_mode(const char* id, rastile_display_mode_t mode);
RASTILE_API int  rastile_set_rgb_bands(const char* id, rastile_rgb_bands_t bands);

/* cross != 0 builds a cross-layer composition from the source's config */
RASTILE_API int  rastile_create_composition(const char* source_id, int cross,
                                            char* out_id, int cap);

/* ── Tiles ─────────────────────────────────────────────────────────── */
/* Fetch raster-<id>://z/x/y into buf. Returns the tile size in bytes
   (0 for a blank tile) or -1 on error. If the tile does not fit in cap
   nothing is copied and the required size is returned. */
RASTILE_API int  rastile_fetch_tile(const char* url, uint8_t* buf, int cap);
RASTILE_API int  rastile_cache_stats(rastile_cache_stats_t* out);

/* Report a finished zoom gesture (drives remote-source invalidation) */
RASTILE_API void rastile_set_zoom(double zoom);

/* ── Diagnostics ───────────────────────────────────────────────────── */
/* Copies the most recent log message. Returns its level, or -1 if none. */
RASTILE_API int  rastile_last_log(char* buf, int cap);

#ifdef __cplusplus
}
#endif

#endif /* RASTILE_H */
