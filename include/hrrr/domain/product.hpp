#pragma once

#include <array>
#include <cstdint>
#include <string_view>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/common/enum_table.hpp"

namespace hrrr {

// Output file family of an HRRR run. The string form is the short token
// that appears in archive file names.
enum class Product : uint8_t {
  kPressure,
  kNative,
  kSurface,
  kSubHourly,
};

inline constexpr std::array kAllProducts = {
    Product::kPressure, Product::kNative, Product::kSurface,
    Product::kSubHourly};

inline constexpr std::array kProductNames =
    std::to_array<common::EnumName<Product>>({
        {.value = Product::kPressure, .name = "prs"},
        {.value = Product::kNative, .name = "nat"},
        {.value = Product::kSurface, .name = "sfc"},
        {.value = Product::kSubHourly, .name = "subh"},
    });

auto ToString(Product product) -> std::string_view;
auto ParseProduct(std::string_view name) -> Result<Product>;

}  // namespace hrrr
