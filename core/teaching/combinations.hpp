#pragma once

#include <cstddef>
#include <numeric>
#include <vector>

namespace teachsim {

/// Walks every k-subset of {0, ..., n-1} in lexicographic order,
/// starting at {0, 1, ..., k-1}. Requires 0 < k <= n.
class CombinationCursor {
public:
    CombinationCursor(size_t n, size_t k) : n_(n), indices_(k) {
        std::iota(indices_.begin(), indices_.end(), 0);
    }

    const std::vector<size_t>& indices() const { return indices_; }

    /// Advance to the next subset. Returns false once the last one
    /// ({n-k, ..., n-1}) has been passed.
    bool next() {
        size_t k = indices_.size();
        for (size_t i = k; i-- > 0;) {
            if (indices_[i] < n_ - k + i) {
                indices_[i]++;
                for (size_t j = i + 1; j < k; j++) {
                    indices_[j] = indices_[j - 1] + 1;
                }
                return true;
            }
        }
        return false;
    }

private:
    size_t n_;
    std::vector<size_t> indices_;
};

/// C(n, k) as a double, to size search work without overflow.
inline double binomial(size_t n, size_t k) {
    if (k > n) return 0.0;
    if (k > n - k) k = n - k;
    double result = 1.0;
    for (size_t i = 1; i <= k; i++) {
        result = result * static_cast<double>(n - k + i) / static_cast<double>(i);
    }
    return result;
}

} // namespace teachsim
