#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace optstrat::math {

template<typename T>
class GridStatistics {
public:
    // Evenly spaced points covering [lower, upper], both ends included.
    static std::vector<T> linspace(T lower, T upper, std::size_t count) {
        if (count < 2) {
            throw std::logic_error("linspace needs at least two points");
        }
        std::vector<T> points(count);
        const T step = (upper - lower) / static_cast<T>(count - 1);
        for (std::size_t i = 0; i < count; ++i) {
            points[i] = lower + step * static_cast<T>(i);
        }
        points.back() = upper;
        return points;
    }

    static T sum(const std::vector<T>& data) {
        return std::accumulate(data.begin(), data.end(), T{0});
    }

    // Rescales non-negative weights in place so they sum to one.
    static void normalize(std::vector<T>& weights) {
        const T total = sum(weights);
        if (!(total > T{0}) || !std::isfinite(total)) {
            throw std::logic_error("probability weights are degenerate and cannot be normalized");
        }
        std::transform(weights.begin(), weights.end(), weights.begin(),
            [total](T w) { return w / total; });
    }

    static T weighted_sum(const std::vector<T>& values, const std::vector<T>& weights) {
        if (values.size() != weights.size()) {
            throw std::logic_error("values and weights must have the same size");
        }
        return std::inner_product(values.begin(), values.end(), weights.begin(), T{0});
    }

    // Sum of the weights whose value is strictly positive.
    static T positive_mass(const std::vector<T>& values, const std::vector<T>& weights) {
        if (values.size() != weights.size()) {
            throw std::logic_error("values and weights must have the same size");
        }
        T mass{0};
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (values[i] > T{0}) {
                mass += weights[i];
            }
        }
        return mass;
    }
};

}
