#include "lcfeat/roi.hpp"

#include <algorithm>
#include <cmath>

namespace lcfeat {

std::vector<double> Roi::profile(std::size_t length) const {
    std::vector<double> result(length, 0.0);
    if (length == 0 || points_.empty()) return result;

    const double scale = height_ > 0.0 ? 1.0 / height_ : 0.0;
    const auto n = static_cast<double>(points_.size());
    const auto apex = static_cast<double>(apex_index_);
    const double half_width = std::max(apex, n - 1.0 - apex);

    if (length == 1 || half_width == 0.0) {
        result[length / 2] = points_[apex_index_].intensity * scale;
        return result;
    }

    const double step = 2.0 * half_width / static_cast<double>(length - 1);
    for (std::size_t j = 0; j < length; ++j) {
        double x = apex - half_width + step * static_cast<double>(j);
        if (x < 0.0 || x > n - 1.0) continue;

        auto lo = static_cast<std::size_t>(std::floor(x));
        std::size_t hi = std::min(lo + 1, points_.size() - 1);
        double t = x - static_cast<double>(lo);
        double value = points_[lo].intensity +
                       t * (points_[hi].intensity - points_[lo].intensity);
        result[j] = value * scale;
    }
    return result;
}

} // namespace lcfeat
