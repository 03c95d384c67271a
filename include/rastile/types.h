#ifndef RASTILE_TYPES_H
#define RASTILE_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    RASTILE_DISPLAY_GRAYSCALE       = 0,
    RASTILE_DISPLAY_RGB             = 1,
    RASTILE_DISPLAY_CROSS_LAYER_RGB = 2
} rastile_display_mode_t;

typedef struct {
    double min;
    double max;
    double gamma;
} rastile_stretch_t;

typedef struct {
    int r, g, b;  /* 1-indexed band numbers */
} rastile_rgb_bands_t;

typedef struct {
    long   hits;
    long   misses;
    long   evictions;
    int    size;
    int    max_size;
    double hit_rate;  /* percent */
} rastile_cache_stats_t;

typedef enum {
    RASTILE_LOG_DEBUG = 0,
    RASTILE_LOG_INFO  = 1,
    RASTILE_LOG_WARN  = 2,
    RASTILE_LOG_ERROR = 3
} rastile_log_level_t;

#ifdef __cplusplus
}
#endif

#endif /* RASTILE_TYPES_H */
