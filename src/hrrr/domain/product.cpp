#include "hrrr/domain/product.hpp"

#include <string_view>

namespace hrrr {

auto ToString(Product product) -> std::string_view {
  return common::EnumToString(kProductNames, product, "ToString(Product)");
}

auto ParseProduct(std::string_view name) -> Result<Product> {
  return common::ParseEnum(kProductNames, name);
}

}  // namespace hrrr
