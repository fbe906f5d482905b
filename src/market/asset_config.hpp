// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace dvolkit {

/// Per-asset market conventions
struct AssetConfig {
    std::string name;               ///< "BTC", "ETH", ...
    bool is_inverse = false;        ///< Mark prices quoted in the base coin
    size_t min_snapshot_instruments = 50;  ///< Instruments required to emit an options snapshot
};

/// Built-in asset table (BTC, ETH, SOL, XRP)
[[nodiscard]] std::span<const AssetConfig> default_assets() noexcept;

/// Look up a built-in asset by name
[[nodiscard]] std::expected<AssetConfig, ValidationError> find_asset(std::string_view name);

}  // namespace dvolkit
