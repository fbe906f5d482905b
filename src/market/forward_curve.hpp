// SPDX-License-Identifier: MIT
#pragma once

#include "src/market/utc_time.hpp"
#include <map>
#include <optional>

namespace dvolkit {

/// Forward prices keyed by expiry
///
/// Lookups match the expiry exactly; there is no interpolation between
/// futures expiries. Assets without a dated futures curve use an empty curve
/// and fall back to spot.
class ForwardCurve {
public:
    ForwardCurve() = default;

    void insert(UtcTime expiry, double forward) { forwards_[expiry] = forward; }

    [[nodiscard]] std::optional<double> find(UtcTime expiry) const {
        auto it = forwards_.find(expiry);
        if (it == forwards_.end()) return std::nullopt;
        return it->second;
    }

    /// Forward for `expiry`, or `fallback` (spot) under zero cost of carry
    [[nodiscard]] double forward_or(UtcTime expiry, double fallback) const {
        return find(expiry).value_or(fallback);
    }

    [[nodiscard]] bool empty() const { return forwards_.empty(); }
    [[nodiscard]] size_t size() const { return forwards_.size(); }

    auto begin() const { return forwards_.begin(); }
    auto end() const { return forwards_.end(); }

private:
    std::map<UtcTime, double> forwards_;
};

}  // namespace dvolkit
