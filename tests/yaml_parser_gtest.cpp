#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "flue/io/config_manager.hpp"
#include "flue/io/yaml_parser.hpp"

using namespace flue::io;
using flue::combustion::Species;
using flue::combustion::UnreachableTargetPolicy;

class YamlParserTestFixture: public ::testing::Test
{
 protected:
  void SetUp() override
  {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() / (std::string("flue_yaml_") + info->name());
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  auto WriteConfig(const std::string& contents) -> std::string
  {
    const auto path = dir_ / "config.yaml";
    std::ofstream out(path);
    out << contents;
    return path.string();
  }

  auto Load(const std::string& contents) -> std::expected<Configuration, flue::core::ConfigurationError>
  {
    return manager_.load(WriteConfig(contents));
  }

  std::filesystem::path dir_;
  ConfigurationManager manager_;
};

TEST_F (YamlParserTestFixture, MinimalConfiguration)
{
  auto config = Load(R"(
fuel:
  composition:
    CH4: 90.0
    N2: 10.0
  mass_flow: 2.0
combustion:
  target_o2_percent: 3.0
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();

  EXPECT_FALSE(config->fuel.preset.has_value());
  EXPECT_DOUBLE_EQ(config->fuel.mass_flow, 2.0);
  EXPECT_NEAR(config->fuel.composition.fraction(Species::CH4), 0.9, 1.0e-12);
  EXPECT_NEAR(config->combustion.target_o2_fraction, 0.03, 1.0e-15);

  // defaults for the optional sections
  EXPECT_EQ(config->numerical.solver.unreachable_target_policy, UnreachableTargetPolicy::Fail);
  EXPECT_DOUBLE_EQ(config->numerical.solver.bracket_factor, 5.0);
  EXPECT_EQ(config->output.output_directory, "flue_outputs");
  EXPECT_EQ(config->output.formats.size(), 1u);
  EXPECT_FALSE(config->sweep.enabled);

  EXPECT_TRUE(manager_.config_file_path().is_absolute());
}

TEST_F (YamlParserTestFixture, FullConfiguration)
{
  auto config = Load(R"(
fuel:
  preset: default
  composition:
    CO2: 4.0
  normalize: true
  mass_flow: 0.5
combustion:
  target_o2_fraction: 0.045
numerical:
  bisection_tolerance: 1.0e-8
  bisection_relative_tolerance: 1.0e-10
  bracket_factor: 4.0
  max_iterations: 500
  max_bracket_expansions: 3
  unreachable_target_policy: Clamp
output:
  output_directory: results
  include_timestamp: false
  formats: [HDF5, csv, h5]
  mole_fraction_display_threshold: 0.1
sweep:
  enabled: true
  target_o2_percent_min: 1.0
  target_o2_percent_max: 12.0
  points: 12
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();

  ASSERT_TRUE(config->fuel.preset.has_value());
  EXPECT_EQ(*config->fuel.preset, "default");
  EXPECT_DOUBLE_EQ(config->fuel.raw_composition.at("CO2"), 4.0);
  EXPECT_NEAR(config->fuel.composition.sum(), 1.0, 1.0e-12);
  EXPECT_NEAR(config->combustion.target_o2_fraction, 0.045, 1.0e-15);

  const auto& solver = config->numerical.solver;
  EXPECT_DOUBLE_EQ(solver.tolerance, 1.0e-8);
  EXPECT_DOUBLE_EQ(solver.relative_tolerance, 1.0e-10);
  EXPECT_DOUBLE_EQ(solver.bracket_factor, 4.0);
  EXPECT_EQ(solver.max_iterations, 500);
  EXPECT_EQ(solver.max_bracket_expansions, 3);
  EXPECT_EQ(solver.unreachable_target_policy, UnreachableTargetPolicy::Clamp);

  EXPECT_EQ(config->output.output_directory, "results");
  EXPECT_FALSE(config->output.include_timestamp);
  ASSERT_EQ(config->output.formats.size(), 2u);
  EXPECT_EQ(config->output.formats[0], OutputConfig::Format::HDF5);
  EXPECT_EQ(config->output.formats[1], OutputConfig::Format::CSV);
  EXPECT_DOUBLE_EQ(config->output.mole_fraction_display_threshold, 0.1);

  EXPECT_TRUE(config->sweep.enabled);
  EXPECT_EQ(config->sweep.points, 12);
  EXPECT_DOUBLE_EQ(config->sweep.target_o2_percent_max, 12.0);
}

TEST_F (YamlParserTestFixture, FractionUnits)
{
  auto config = Load(R"(
fuel:
  composition: {CH4: 0.8, C2H6: 0.2}
  units: fraction
  normalize: false
  mass_flow: 1.0
combustion:
  target_o2_percent: 2.0
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  EXPECT_EQ(config->fuel.units, FuelConfig::Units::Fraction);
  EXPECT_NEAR(config->fuel.composition.fraction(Species::C2H6), 0.2, 1.0e-12);
}

TEST_F (YamlParserTestFixture, MissingSections)
{
  auto no_fuel = Load("combustion:\n  target_o2_percent: 3.0\n");
  ASSERT_FALSE(no_fuel.has_value());
  EXPECT_NE(no_fuel.error().message().find("'fuel'"), std::string::npos);

  auto no_combustion = Load("fuel:\n  preset: methane\n  mass_flow: 1.0\n");
  ASSERT_FALSE(no_combustion.has_value());
  EXPECT_NE(no_combustion.error().message().find("'combustion'"), std::string::npos);

  auto no_mass_flow = Load("fuel:\n  preset: methane\ncombustion:\n  target_o2_percent: 3.0\n");
  ASSERT_FALSE(no_mass_flow.has_value());
  EXPECT_NE(no_mass_flow.error().message().find("mass_flow"), std::string::npos);

  auto no_target = Load("fuel:\n  preset: methane\n  mass_flow: 1.0\ncombustion: {}\n");
  EXPECT_FALSE(no_target.has_value());
}

TEST_F (YamlParserTestFixture, InvalidValues)
{
  const std::string fuel = "fuel:\n  preset: methane\n  mass_flow: 1.0\n";

  EXPECT_FALSE(Load(fuel + "combustion:\n  target_o2_percent: 3.0\n  target_o2_fraction: 0.03\n").has_value());
  EXPECT_FALSE(Load(fuel + "combustion:\n  target_o2_percent: 0.0\n").has_value());
  EXPECT_FALSE(Load(fuel + "combustion:\n  target_o2_fraction: 1.5\n").has_value());
  EXPECT_FALSE(Load("fuel:\n  preset: methane\n  mass_flow: -2.0\ncombustion:\n  target_o2_percent: 3.0\n")
                   .has_value());
  EXPECT_FALSE(Load("fuel:\n  preset: butane\n  mass_flow: 1.0\ncombustion:\n  target_o2_percent: 3.0\n")
                   .has_value());
  EXPECT_FALSE(Load("fuel:\n  mass_flow: 1.0\ncombustion:\n  target_o2_percent: 3.0\n").has_value());
  EXPECT_FALSE(Load("fuel:\n  preset: methane\n  units: fraction\n  composition: {N2: 0.1}\n  mass_flow: 1.0\n"
                    "combustion:\n  target_o2_percent: 3.0\n")
                   .has_value());
}

TEST_F (YamlParserTestFixture, PresetUnits)
{
  const std::string combustion = "combustion:\n  target_o2_percent: 3.0\n";

  auto fraction = Load("fuel:\n  preset: methane\n  units: fraction\n  mass_flow: 1.0\n" + combustion);
  ASSERT_FALSE(fraction.has_value());
  EXPECT_NE(fraction.error().message().find("fuel.units"), std::string::npos);

  auto percent = Load("fuel:\n  preset: methane\n  units: percent\n  mass_flow: 1.0\n" + combustion);
  ASSERT_TRUE(percent.has_value()) << percent.error().message();
  EXPECT_NEAR(percent->fuel.composition.fraction(Species::CH4), 1.0, 1.0e-12);

  EXPECT_FALSE(Load("fuel:\n  preset: methane\n  units: ppm\n  mass_flow: 1.0\n" + combustion).has_value());
}

TEST_F (YamlParserTestFixture, SweepWithoutCombustionSection)
{
  auto config = Load(R"(
fuel:
  preset: methane
  mass_flow: 1.0
sweep:
  enabled: true
  target_o2_percent_min: 2.0
  target_o2_percent_max: 8.0
  points: 4
)");
  ASSERT_TRUE(config.has_value()) << config.error().message();
  EXPECT_TRUE(config->sweep.enabled);
  EXPECT_EQ(config->sweep.points, 4);

  // a bad target is still rejected when the section is given
  auto bad_target = Load(R"(
fuel:
  preset: methane
  mass_flow: 1.0
combustion:
  target_o2_percent: 150.0
sweep:
  enabled: true
  target_o2_percent_min: 2.0
  target_o2_percent_max: 8.0
)");
  EXPECT_FALSE(bad_target.has_value());
}

TEST_F (YamlParserTestFixture, CaseInsensitiveEnums)
{
  const std::string base = "fuel:\n  preset: methane\n  mass_flow: 1.0\ncombustion:\n  target_o2_percent: 3.0\n";

  auto upper = Load(base + "numerical:\n  unreachable_target_policy: EXPAND\noutput:\n  formats: [CSV]\n");
  ASSERT_TRUE(upper.has_value()) << upper.error().message();
  EXPECT_EQ(upper->numerical.solver.unreachable_target_policy, UnreachableTargetPolicy::Expand);
  EXPECT_EQ(upper->output.formats.front(), OutputConfig::Format::CSV);

  // bytes above 0x7f must not match, nor crash the lowercasing
  auto accented = Load(base + "numerical:\n  unreachable_target_policy: \"\xC3\x89" "chec\"\n");
  EXPECT_FALSE(accented.has_value());
  auto accented_format = Load(base + "output:\n  formats: [\"c\xC5\x9Fv\"]\n");
  EXPECT_FALSE(accented_format.has_value());
}

TEST_F (YamlParserTestFixture, InvalidNumericalSection)
{
  const std::string base = "fuel:\n  preset: methane\n  mass_flow: 1.0\ncombustion:\n  target_o2_percent: 3.0\n";

  auto policy = Load(base + "numerical:\n  unreachable_target_policy: ignore\n");
  ASSERT_FALSE(policy.has_value());
  EXPECT_NE(policy.error().message().find("Valid options"), std::string::npos);

  EXPECT_FALSE(Load(base + "numerical:\n  bracket_factor: 1.0\n").has_value());
  EXPECT_FALSE(Load(base + "numerical:\n  bisection_tolerance: 0.0\n").has_value());
  EXPECT_FALSE(Load(base + "numerical:\n  max_iterations: 0\n").has_value());
  EXPECT_FALSE(Load(base + "numerical:\n  max_bracket_expansions: -1\n").has_value());
  EXPECT_FALSE(Load(base + "numerical:\n  bisection_relative_tolerance: -1.0e-9\n").has_value());
  EXPECT_FALSE(Load(base + "numerical:\n  max_iterations: many\n").has_value());
}

TEST_F (YamlParserTestFixture, InvalidOutputAndSweep)
{
  const std::string base = "fuel:\n  preset: methane\n  mass_flow: 1.0\ncombustion:\n  target_o2_percent: 3.0\n";

  EXPECT_FALSE(Load(base + "output:\n  formats: [vtk]\n").has_value());
  EXPECT_FALSE(Load(base + "output:\n  formats: []\n").has_value());

  EXPECT_FALSE(Load(base + "sweep:\n  enabled: true\n  target_o2_percent_min: 5.0\n  target_o2_percent_max: 2.0\n")
                   .has_value());
  EXPECT_FALSE(Load(base + "sweep:\n  enabled: true\n  target_o2_percent_min: 1.0\n"
                           "  target_o2_percent_max: 5.0\n  points: 1\n")
                   .has_value());
  EXPECT_FALSE(Load(base + "sweep:\n  enabled: true\n  target_o2_percent_max: 5.0\n").has_value());

  // ranges are only checked for an enabled sweep
  auto disabled = Load(base + "sweep:\n  enabled: false\n  target_o2_percent_min: 5.0\n  target_o2_percent_max: 2.0\n");
  ASSERT_TRUE(disabled.has_value());
  EXPECT_FALSE(disabled->sweep.enabled);
}

TEST_F (YamlParserTestFixture, FileProblems)
{
  auto missing = manager_.load((dir_ / "missing.yaml").string());
  ASSERT_FALSE(missing.has_value());
  EXPECT_NE(missing.error().message().find("could not locate"), std::string::npos);

  auto directory = manager_.load(dir_.string());
  ASSERT_FALSE(directory.has_value());

  auto malformed = Load("fuel: [unclosed\n");
  ASSERT_FALSE(malformed.has_value());
  EXPECT_NE(malformed.error().message().find("Failed to load YAML"), std::string::npos);
}

TEST_F (YamlParserTestFixture, ParseBeforeLoad)
{
  YamlParser parser(WriteConfig("fuel: {}\n"));
  auto result = parser.parse();
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("load()"), std::string::npos);
}
