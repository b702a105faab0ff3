#include "eos_table.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// Test fixture for EOS sweeps and table output
class EOSTableTest : public ::testing::Test {
protected:
  void SetUp() override {
    // Use /tmp directory for test outputs
    test_output_dir = "/tmp/mineral_eos_test_outputs";
    std::filesystem::create_directories(test_output_dir);

    ParameterSet params{{"V_0", 1.0e-5}, {"T_0", 300.0},        {"E_0", 0.0},      {"S_0", 0.0},
                        {"K_0", 250e9},  {"Kprime_0", 4.0},     {"Kdprime_0", -0.02e-9},
                        {"n", 1.0},      {"Cv", 100.0},         {"grueneisen_0", 1.5}, {"q_0", 1.0}};
    eos = std::make_unique<DKSSolidEOS>(params);
  }

  void TearDown() override {
    // Cleanup after each test
    try {
      std::filesystem::remove_all(test_output_dir);
    } catch (const std::filesystem::filesystem_error &e) {
      std::cerr << "Warning: Could not remove test directory: " << e.what() << std::endl;
    }
  }

  std::string test_output_dir;
  std::unique_ptr<DKSSolidEOS> eos;

  EOSTableParameters getDefaultParams() {
    EOSTableParameters params;
    params.p_min = 0.0;
    params.p_max = 100e9;
    params.temperature = 1500.0;
    params.num_points = 21;
    return params;
  }

  std::vector<std::string> readLines(const std::string &path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
      lines.push_back(line);
    }
    return lines;
  }
};

// Test default table parameters
TEST_F(EOSTableTest, DefaultParameters) {
  EOSTableParameters params;
  EXPECT_DOUBLE_EQ(params.p_min, 0.0);
  EXPECT_DOUBLE_EQ(params.p_max, 100e9);
  EXPECT_DOUBLE_EQ(params.temperature, 300.0);
  EXPECT_EQ(params.num_points, 100);
  EXPECT_EQ(params.output_file, "dks_solid_eos.csv");
  EXPECT_FALSE(params.use_log_spacing);
  EXPECT_EQ(params.properties.size(), 6u);
}

// Linear grid
TEST_F(EOSTableTest, LinearPressureGrid) {
  auto grid = createPressureGrid(0.0, 100e9, 11, false);

  ASSERT_EQ(grid.size(), 11u);
  EXPECT_DOUBLE_EQ(grid.front(), 0.0);
  EXPECT_NEAR(grid.back(), 100e9, 1.0);
  EXPECT_NEAR(grid[1] - grid[0], 10e9, 1.0);
}

// Logarithmic grid
TEST_F(EOSTableTest, LogPressureGrid) {
  auto grid = createPressureGrid(1e5, 1e11, 7, true);

  ASSERT_EQ(grid.size(), 7u);
  EXPECT_NEAR(grid.front(), 1e5, 1e-6);
  EXPECT_NEAR(grid.back(), 1e11, 1e-1);
  EXPECT_NEAR(grid[1] / grid[0], 10.0, 1e-9);
}

// Invalid grids
TEST_F(EOSTableTest, InvalidPressureGrid) {
  EXPECT_THROW(createPressureGrid(10e9, 1e9, 10, false), std::invalid_argument);
  EXPECT_THROW(createPressureGrid(0.0, 1e9, 1, false), std::invalid_argument);
  EXPECT_THROW(createPressureGrid(0.0, 1e9, 10, true), std::invalid_argument);
}

// Isotherm solve agrees with point-by-point inversion
TEST_F(EOSTableTest, EvaluateIsotherm) {
  auto pressures = createPressureGrid(0.0, 80e9, 9, false);
  auto points = evaluateIsotherm(*eos, pressures, 2000.0);

  ASSERT_EQ(points.size(), pressures.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    EXPECT_EQ(points[i].status, SolveStatus::OK);
    EXPECT_DOUBLE_EQ(points[i].pressure, pressures[i]);
    EXPECT_DOUBLE_EQ(points[i].temperature, 2000.0);
    EXPECT_DOUBLE_EQ(points[i].volume, eos->volume(pressures[i], 2000.0));
  }

  // Volume shrinks along the isotherm
  for (std::size_t i = 1; i < points.size(); ++i) {
    EXPECT_LT(points[i].volume, points[i - 1].volume);
  }
}

// A failing point does not stop the sweep
TEST_F(EOSTableTest, SweepContinuesPastFailure) {
  std::vector<double> pressures = {10e9, 1e13, 20e9};
  std::vector<double> temperatures = {300.0, 300.0, 1000.0};

  auto points = evaluatePoints(*eos, pressures, temperatures);

  ASSERT_EQ(points.size(), 3u);
  EXPECT_EQ(points[0].status, SolveStatus::OK);
  EXPECT_EQ(points[1].status, SolveStatus::ROOT_NOT_BRACKETED);
  EXPECT_TRUE(std::isnan(points[1].volume));
  EXPECT_FALSE(points[1].message.empty());
  EXPECT_EQ(points[2].status, SolveStatus::OK);
  EXPECT_NEAR(eos->pressure(1000.0, points[2].volume), 20e9, 1e-6 * 20e9);

  auto gibbs = evaluateProperty(*eos, points, Property::GIBBS_FREE_ENERGY);
  ASSERT_EQ(gibbs.size(), 3u);
  EXPECT_TRUE(std::isfinite(gibbs[0]));
  EXPECT_TRUE(std::isnan(gibbs[1]));
  EXPECT_TRUE(std::isfinite(gibbs[2]));
}

// Mismatched arrays
TEST_F(EOSTableTest, MismatchedSizes) {
  std::vector<double> pressures = {1e9, 2e9};
  std::vector<double> temperatures = {300.0};
  EXPECT_THROW(evaluatePoints(*eos, pressures, temperatures), std::invalid_argument);
}

// A non-positive temperature fails the solve; a property failing at a
// solved point yields NaN
TEST_F(EOSTableTest, PropertyDomainErrorIsNaN) {
  std::vector<double> pressures = {5e9};
  std::vector<double> temperatures = {0.0};
  auto points = evaluatePoints(*eos, pressures, temperatures);
  ASSERT_EQ(points.size(), 1u);
  EXPECT_EQ(points[0].status, SolveStatus::DOMAIN_ERROR);
  EXPECT_TRUE(std::isnan(points[0].volume));

  // Entropy takes ln(T/T_0) even when the volume is valid
  const double V = eos->volume(5e9, 300.0);
  std::vector<StatePoint> solved = {{5e9, 0.0, V, SolveStatus::OK, ""}};

  auto entropy = evaluateProperty(*eos, solved, Property::ENTROPY);
  EXPECT_TRUE(std::isnan(entropy[0]));

  auto volume = evaluateProperty(*eos, solved, Property::VOLUME);
  EXPECT_DOUBLE_EQ(volume[0], V);
}

// Test EOS table generation
TEST_F(EOSTableTest, EOSTableGeneration) {
  EOSTableParameters params = getDefaultParams();
  params.output_file = test_output_dir + "/isotherm_1500K.csv";

  bool result = generateEOSTable(*eos, params);

  EXPECT_TRUE(result);
  EXPECT_TRUE(std::filesystem::exists(params.output_file));

  auto lines = readLines(params.output_file);
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0], "# Finite-strain solid EOS: DKS solid");

  std::size_t header_index = 0;
  while (header_index < lines.size() && lines[header_index].rfind("#", 0) == 0) {
    header_index++;
  }
  ASSERT_LT(header_index, lines.size());
  EXPECT_EQ(lines[header_index], "P[Pa],T[K],V[m^3/mol],grueneisen_parameter,entropy,helmholtz_free_energy,"
                                 "gibbs_free_energy,internal_energy,enthalpy,status");

  // One row per grid point, all solved
  EXPECT_EQ(lines.size() - header_index - 1, static_cast<std::size_t>(params.num_points));
  for (std::size_t i = header_index + 1; i < lines.size(); ++i) {
    EXPECT_NE(lines[i].find(",OK"), std::string::npos) << lines[i];
  }

  // Parameters are recorded in the metadata
  bool found_k0 = false;
  for (std::size_t i = 0; i < header_index; ++i) {
    if (lines[i].rfind("# K_0 = ", 0) == 0) {
      found_k0 = true;
    }
  }
  EXPECT_TRUE(found_k0);
}

// Placeholder columns are flagged in the header
TEST_F(EOSTableTest, UnsupportedColumnNote) {
  EOSTableParameters params = getDefaultParams();
  params.num_points = 3;
  params.properties = {Property::ENTROPY, Property::SHEAR_MODULUS};
  params.output_file = test_output_dir + "/with_shear.csv";

  ASSERT_TRUE(generateEOSTable(*eos, params));

  auto lines = readLines(params.output_file);
  bool found_note = false;
  for (const auto &line : lines) {
    if (line == "# shear_modulus is not derived by this model (written as 0)") {
      found_note = true;
    }
  }
  EXPECT_TRUE(found_note);
}

// Failed rows keep their status in the table
TEST_F(EOSTableTest, FailedRowsWritten) {
  std::vector<double> pressures = {1e9, 1e13};
  auto points = evaluateIsotherm(*eos, pressures, 300.0);
  std::string path = test_output_dir + "/with_failure.csv";

  ASSERT_TRUE(writeEOSTable(path, *eos, points, {Property::ENTROPY}));

  auto lines = readLines(path);
  ASSERT_GE(lines.size(), 2u);
  EXPECT_NE(lines.back().find("ROOT_NOT_BRACKETED"), std::string::npos);
  EXPECT_NE(lines.back().find("nan"), std::string::npos);
}

// Invalid parameters are reported, not thrown
TEST_F(EOSTableTest, InvalidTableParameters) {
  EOSTableParameters params = getDefaultParams();
  params.p_min = 100e9;
  params.p_max = 10e9;
  params.output_file = test_output_dir + "/invalid.csv";

  EXPECT_FALSE(generateEOSTable(*eos, params));

  params = getDefaultParams();
  params.output_file = test_output_dir + "/missing_dir/table.csv";
  EXPECT_FALSE(generateEOSTable(*eos, params));
}
