#pragma once

#include <string>

#include "hrrr/common/diagnostic.hpp"

namespace hrrr {

// One layer of an archived GRIB file, described independently of any
// forecast hour. Loaded from packaged inventory data.
struct TemplateEntry {
  // 1-based position of the layer inside the GRIB file. Downstream readers
  // index layers by this number, so it is carried through unchanged.
  int row_number;
  std::string level_layer;
  std::string parameter;
  std::string forecast_valid_template;
  std::string description;

  auto operator==(const TemplateEntry&) const -> bool = default;
};

// A template entry resolved against one forecast hour.
struct Variable {
  int row_number;
  std::string level_layer;
  std::string parameter;
  std::string forecast_valid;
  std::string description;

  auto operator==(const Variable&) const -> bool = default;
};

// Fails with kRange for hours outside [0, 48] and kTemplateParse for an
// unrecognized forecast_valid_template.
auto ExpandVariable(const TemplateEntry& entry, int forecast_hour)
    -> Result<Variable>;

}  // namespace hrrr
