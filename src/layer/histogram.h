#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rastile {

/* Layout helpers for a histogram panel drawn by the host UI */

bool should_use_log_scale(uint64_t max_count, uint64_t threshold = 1000);

/* log10(count + 1) */
double log_scale_value(double count);

/* Bar heights in pixels, tallest bar filling height - 2 * padding */
std::vector<double> histogram_bar_heights(const std::vector<uint64_t>& counts, double height,
                                          double padding = 10.0, bool log_scale = false);

/* X position of `value` on a [min, max] axis; the centre when min == max */
double histogram_x_position(double value, double min, double max, double width,
                            double padding = 10.0);

/* "--" for non-finite values, 1.5M / 2.3K for large ones, integers as-is,
   otherwise two decimals */
std::string format_histogram_value(double value);

} // namespace rastile
