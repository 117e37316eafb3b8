/// @file src/learner/entropy_window.cpp
/// @brief EntropyWindow — rolling mean / variance / roughness of ΔH.

#include "ska/entropy_window.hpp"

#include <cmath>

namespace ska {

EntropyWindow::EntropyWindow(std::size_t window) noexcept
    : window_(window < 1 ? 1 : window) {}

void EntropyWindow::push(double entropy_increment) noexcept {
    if (!std::isfinite(entropy_increment)) {
        return;
    }
    values_.push_back(entropy_increment);
    if (values_.size() > window_) {
        values_.pop_front();
    }
}

EntropyStats EntropyWindow::stats() const noexcept {
    const std::size_t n = values_.size();
    EntropyStats out{.count = n, .mean = 0.0, .variance = 0.0, .roughness = 0.0};
    if (n == 0) {
        return out;
    }

    double sum = 0.0;
    for (double v : values_) {
        sum += v;
    }
    out.mean = sum / static_cast<double>(n);

    if (n >= 2) {
        double sq_sum = 0.0;
        for (double v : values_) {
            const double d = v - out.mean;
            sq_sum += d * d;
        }
        out.variance = sq_sum / static_cast<double>(n - 1);
    }

    if (n >= 3) {
        double rough = 0.0;
        for (std::size_t k = 2; k < n; ++k) {
            rough += std::abs(values_[k] - 2.0 * values_[k - 1] + values_[k - 2]);
        }
        out.roughness = rough / static_cast<double>(n - 2);
    }
    return out;
}

void EntropyWindow::reset() noexcept {
    values_.clear();
}

} // namespace ska
