#pragma once

/// @file include/ska/entropy_window.hpp
/// @brief EntropyWindow — rolling statistics of entropy increments.
///
/// # Module: Performance Window
///
/// ## Responsibility
/// Keep the last `window` entropy increments ΔH_n and report their rolling
/// mean, sample variance and roughness. Roughness is the mean absolute
/// second difference
/// ```
/// R = mean_k |ΔH_k − 2·ΔH_{k−1} + ΔH_{k−2}|
/// ```
/// which is close to zero for a smooth entropy trajectory and grows with
/// sample-to-sample irregularity (e.g. observation noise).
///
/// ## Edge Cases
/// - Fewer than 2 values: variance = 0
/// - Fewer than 3 values: roughness = 0
/// - Non-finite values are ignored
///
/// ## Guarantees
/// - Stateful: push in step order
/// - Never divides by zero

#include <cstddef>
#include <deque>

namespace ska {

/// Snapshot of the rolling entropy statistics.
struct EntropyStats {
    std::size_t count;      ///< Values currently in the window
    double      mean;       ///< Rolling mean of ΔH
    double      variance;   ///< Bessel-corrected rolling variance of ΔH
    double      roughness;  ///< Mean |second difference| of ΔH
};

class EntropyWindow {
public:
    /// Construct with a given window size (minimum 1).
    explicit EntropyWindow(std::size_t window) noexcept;

    /// Append one entropy increment, evicting the oldest beyond capacity.
    void push(double entropy_increment) noexcept;

    [[nodiscard]] EntropyStats stats() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] std::size_t window_size() const noexcept { return window_; }

    /// Clear all buffered values.
    void reset() noexcept;

private:
    std::size_t        window_;
    std::deque<double> values_;
};

} // namespace ska
