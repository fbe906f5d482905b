// SPDX-License-Identifier: MIT
#include "src/market/asset_config.hpp"
#include <array>

namespace dvolkit {

namespace {

// XRP options trade thinly; a full day rarely shows more than ~30 instruments.
const std::array<AssetConfig, 4> kAssets = {{
    {"BTC", true, 50},
    {"ETH", true, 50},
    {"SOL", false, 50},
    {"XRP", false, 5},
}};

}  // namespace

std::span<const AssetConfig> default_assets() noexcept {
    return kAssets;
}

std::expected<AssetConfig, ValidationError> find_asset(std::string_view name) {
    for (size_t i = 0; i < kAssets.size(); ++i) {
        if (kAssets[i].name == name) {
            return kAssets[i];
        }
    }
    return std::unexpected(ValidationError(ValidationErrorCode::UnknownAsset, 0.0, kAssets.size()));
}

}  // namespace dvolkit
