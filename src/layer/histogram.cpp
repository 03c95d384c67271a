#include "layer/histogram.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace rastile {

bool should_use_log_scale(uint64_t max_count, uint64_t threshold) {
    return max_count > threshold;
}

double log_scale_value(double count) {
    return std::log10(count + 1.0);
}

std::vector<double> histogram_bar_heights(const std::vector<uint64_t>& counts, double height,
                                          double padding, bool log_scale) {
    if (counts.empty()) return {};

    double draw_height = height - padding * 2.0;
    uint64_t max_count = *std::max_element(counts.begin(), counts.end());
    if (max_count == 0) return std::vector<double>(counts.size(), 0.0);

    double max_value = log_scale ? log_scale_value(static_cast<double>(max_count))
                                 : static_cast<double>(max_count);

    std::vector<double> heights;
    heights.reserve(counts.size());
    for (uint64_t c : counts) {
        double v = log_scale ? log_scale_value(static_cast<double>(c)) : static_cast<double>(c);
        heights.push_back(v / max_value * draw_height);
    }
    return heights;
}

double histogram_x_position(double value, double min, double max, double width, double padding) {
    double draw_width = width - padding * 2.0;
    double range = max - min;
    if (range == 0.0) return padding + draw_width / 2.0;
    return padding + (value - min) / range * draw_width;
}

std::string format_histogram_value(double value) {
    if (!std::isfinite(value)) return "--";

    char buf[64];
    if (std::fabs(value) >= 1e6) {
        std::snprintf(buf, sizeof(buf), "%.1fM", value / 1e6);
    } else if (std::fabs(value) >= 1e3) {
        std::snprintf(buf, sizeof(buf), "%.1fK", value / 1e3);
    } else if (value == std::floor(value)) {
        std::snprintf(buf, sizeof(buf), "%.0f", value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f", value);
    }
    return buf;
}

} // namespace rastile
