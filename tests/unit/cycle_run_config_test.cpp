#include <gtest/gtest.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "hrrr/common/diagnostic.hpp"
#include "hrrr/inventory/cycle_run_config.hpp"
#include "hrrr/inventory/template_registry.hpp"

namespace hrrr {
namespace {

class CycleRunConfigTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    packaged_ = std::make_unique<TemplateRegistry>(
        TemplateRegistry::LoadFromDirectory(HRRR_TEST_DATA_DIR));
  }

  static void TearDownTestSuite() {
    packaged_.reset();
  }

  static auto Entry(int row, std::string parameter, std::string tmpl)
      -> TemplateEntry {
    return TemplateEntry{
        .row_number = row,
        .level_layer = "surface",
        .parameter = std::move(parameter),
        .forecast_valid_template = std::move(tmpl),
        .description = "",
    };
  }

  static std::unique_ptr<TemplateRegistry> packaged_;
};

std::unique_ptr<TemplateRegistry> CycleRunConfigTest::packaged_;

TEST_F(CycleRunConfigTest, CoversEveryHourOfTheSet) {
  CycleRunConfig config(
      Region::kConus, Product::kSurface, ForecastHourSet::kFh02To48,
      *packaged_);
  const auto& inventory = config.Inventory();
  ASSERT_EQ(inventory.size(), 47U);
  EXPECT_EQ(inventory.begin()->first, 2);
  EXPECT_EQ(inventory.rbegin()->first, 48);
}

TEST_F(CycleRunConfigTest, PreservesTemplateOrderAndRowNumbers) {
  InventoryKey key{
      .region = Region::kConus,
      .product = Product::kSurface,
      .forecast_hour_set = ForecastHourSet::kFh02To48};
  const auto& templates = packaged_->At(key);
  CycleRunConfig config(
      key.region, key.product, key.forecast_hour_set, *packaged_);

  for (const auto& [hour, variables] : config.Inventory()) {
    ASSERT_EQ(variables.size(), templates.size()) << hour;
    for (std::size_t i = 0; i < variables.size(); ++i) {
      EXPECT_EQ(variables[i].row_number, templates[i].row_number);
      EXPECT_EQ(variables[i].parameter, templates[i].parameter);
      EXPECT_EQ(variables[i].level_layer, templates[i].level_layer);
    }
  }
}

TEST_F(CycleRunConfigTest, ExpandsPerHour) {
  InventoryKey key{
      .region = Region::kAlaska,
      .product = Product::kNative,
      .forecast_hour_set = ForecastHourSet::kFh00To01};
  std::map<InventoryKey, TemplateRegistry::Entries> entries;
  entries[key] = {
      Entry(1, "PRES", "analysis"), Entry(2, "APCP", "0-0 day acc")};
  TemplateRegistry registry(std::move(entries));

  CycleRunConfig config(
      key.region, key.product, key.forecast_hour_set, registry);
  EXPECT_EQ(config.GetRegion(), Region::kAlaska);
  EXPECT_EQ(config.GetProduct(), Product::kNative);
  EXPECT_EQ(config.GetForecastHourSet(), ForecastHourSet::kFh00To01);

  auto hour0 = config.VariablesAt(0);
  ASSERT_TRUE(hour0.has_value());
  ASSERT_EQ(hour0->size(), 2U);
  EXPECT_EQ((*hour0)[0].forecast_valid, "analysis");
  EXPECT_EQ((*hour0)[1].forecast_valid, "0-0 day acc");

  auto hour1 = config.VariablesAt(1);
  ASSERT_TRUE(hour1.has_value());
  EXPECT_EQ((*hour1)[0].forecast_valid, "1 hour fcst");
  EXPECT_EQ((*hour1)[1].forecast_valid, "0-1 hour acc");
}

TEST_F(CycleRunConfigTest, HourOutsideSetIsRangeError) {
  CycleRunConfig config(
      Region::kConus, Product::kSubHourly, ForecastHourSet::kFh00,
      *packaged_);
  auto variables = config.VariablesAt(1);
  ASSERT_FALSE(variables.has_value());
  EXPECT_EQ(variables.error().Kind(), DiagKind::kRange);
}

TEST_F(CycleRunConfigTest, UnregisteredCombinationFailsConstruction) {
  try {
    CycleRunConfig config(
        Region::kConus, Product::kSubHourly, ForecastHourSet::kFh02To48,
        *packaged_);
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    EXPECT_EQ(e.GetDiagnostic().Kind(), DiagKind::kMissingTemplate);
  }
}

TEST_F(CycleRunConfigTest, BadTemplateFailsWholeConstruction) {
  InventoryKey key{
      .region = Region::kConus,
      .product = Product::kPressure,
      .forecast_hour_set = ForecastHourSet::kFh02To48};
  std::map<InventoryKey, TemplateRegistry::Entries> entries;
  entries[key] = {Entry(1, "TMP", "2 hour fcst"), Entry(2, "HGT", "bogus")};
  TemplateRegistry registry(std::move(entries));

  try {
    CycleRunConfig config(
        key.region, key.product, key.forecast_hour_set, registry);
    FAIL() << "expected DiagnosticException";
  } catch (const DiagnosticException& e) {
    const auto& diag = e.GetDiagnostic();
    EXPECT_EQ(diag.Kind(), DiagKind::kTemplateParse);
    ASSERT_EQ(diag.notes.size(), 1U);
    EXPECT_NE(diag.notes[0].find("row 2"), std::string::npos);
  }
}

TEST_F(CycleRunConfigTest, EveryPackagedInventoryExpands) {
  for (const auto& key : AllInventoryKeys()) {
    EXPECT_NO_THROW(
        CycleRunConfig(
            key.region, key.product, key.forecast_hour_set, *packaged_))
        << ToString(key);
  }
}

TEST_F(CycleRunConfigTest, SubHourlyWindowsAdvanceByHour) {
  CycleRunConfig config(
      Region::kConus, Product::kSubHourly, ForecastHourSet::kFh01To18,
      *packaged_);
  auto hour1 = config.VariablesAt(1);
  auto hour3 = config.VariablesAt(3);
  ASSERT_TRUE(hour1.has_value());
  ASSERT_TRUE(hour3.has_value());
  EXPECT_EQ(hour1->front().forecast_valid, "15 min fcst");
  EXPECT_EQ(hour3->front().forecast_valid, "135 min fcst");
}

// =============================================================================
// InventoryFor
// =============================================================================

TEST_F(CycleRunConfigTest, InventoryForSelectsSet) {
  auto variables =
      InventoryFor(*packaged_, Region::kConus, Product::kSurface, 24);
  ASSERT_TRUE(variables.has_value());
  ASSERT_FALSE(variables->empty());

  bool saw_day_window = false;
  for (const auto& variable : *variables) {
    if (variable.parameter == "APCP") {
      EXPECT_EQ(variable.forecast_valid, "0-1 day acc");
      saw_day_window = true;
    }
  }
  EXPECT_TRUE(saw_day_window);
}

TEST_F(CycleRunConfigTest, InventoryForAnalysisHour) {
  auto variables =
      InventoryFor(*packaged_, Region::kAlaska, Product::kPressure, 0);
  ASSERT_TRUE(variables.has_value());
  for (const auto& variable : *variables) {
    EXPECT_EQ(variable.forecast_valid, "analysis");
  }
}

TEST_F(CycleRunConfigTest, InventoryForRejectsOutOfRangeHour) {
  auto variables =
      InventoryFor(*packaged_, Region::kConus, Product::kSurface, 49);
  ASSERT_FALSE(variables.has_value());
  EXPECT_EQ(variables.error().Kind(), DiagKind::kRange);
}

TEST_F(CycleRunConfigTest, InventoryForSubHourlyPastEighteen) {
  auto variables =
      InventoryFor(*packaged_, Region::kConus, Product::kSubHourly, 19);
  ASSERT_FALSE(variables.has_value());
  EXPECT_EQ(variables.error().Kind(), DiagKind::kRange);
}

}  // namespace
}  // namespace hrrr
