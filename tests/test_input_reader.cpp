// Blackbody input reader tests

// C++ headers
#include <fstream>  // ofstream
#include <string>   // string

// Library headers
#include <gtest/gtest.h>

// Blackbody headers
#include "blackbody.hpp"                                // ExponentPrecision
#include "input_reader/input_reader.hpp"                // InputReader
#include "radiance_evaluator/radiance_evaluator.hpp"    // RadianceOptions
#include "utils/exceptions.hpp"                         // BlackbodyException

namespace {

std::string WriteInputFile(const std::string &name, const std::string &contents)
{
  std::string path = ::testing::TempDir() + name;
  std::ofstream output(path);
  output << contents;
  return path;
}

TEST(InputReaderTest, ReadsAllKeys)
{
  std::string path = WriteInputFile("blackbody_all.inputs",
      "# Radiance evaluation\n"
      "exponent_precision = double\n"
      "temperature_epsilon = 1.0e-3   # kelvin\n"
      "\n"
      "max_grid_elements = 1000000\n"
      "num_threads = 2\n"
      "verbose = true\n");
  InputReader input_reader(path);
  input_reader.Read();
  EXPECT_EQ(input_reader.exponent_precision.value(), ExponentPrecision::full);
  EXPECT_DOUBLE_EQ(input_reader.temperature_epsilon.value(), 1.0e-3);
  EXPECT_EQ(input_reader.max_grid_elements.value(), 1000000l);
  EXPECT_EQ(input_reader.num_threads.value(), 2);
  EXPECT_TRUE(input_reader.verbose.value());

  RadianceOptions options(&input_reader);
  EXPECT_EQ(options.exponent_precision, ExponentPrecision::full);
  EXPECT_DOUBLE_EQ(options.temperature_epsilon, 1.0e-3);
  EXPECT_EQ(options.max_grid_elements, 1000000l);
  EXPECT_EQ(options.num_threads, 2);
  EXPECT_TRUE(options.verbose);
}

TEST(InputReaderTest, MissingKeysKeepDefaults)
{
  std::string path = WriteInputFile("blackbody_partial.inputs", "num_threads = 3\n");
  InputReader input_reader(path);
  input_reader.Read();
  EXPECT_FALSE(input_reader.exponent_precision.has_value());
  EXPECT_FALSE(input_reader.verbose.has_value());

  RadianceOptions defaults;
  RadianceOptions options(&input_reader);
  EXPECT_EQ(options.exponent_precision, ExponentPrecision::single);
  EXPECT_DOUBLE_EQ(options.temperature_epsilon, defaults.temperature_epsilon);
  EXPECT_EQ(options.max_grid_elements, defaults.max_grid_elements);
  EXPECT_EQ(options.num_threads, 3);
  EXPECT_FALSE(options.verbose);
}

TEST(InputReaderTest, RejectsMalformedLines)
{
  InputReader input_reader("unused");
  EXPECT_THROW(input_reader.ReadLine("num_threads 2"), BlackbodyException);
  EXPECT_THROW(input_reader.ReadLine("colour = red"), BlackbodyException);
  EXPECT_THROW(input_reader.ReadLine("verbose = yes"), BlackbodyException);
  EXPECT_THROW(input_reader.ReadLine("exponent_precision = half"), BlackbodyException);
  EXPECT_THROW(input_reader.ReadLine("num_threads = many"), BlackbodyException);
  EXPECT_THROW(input_reader.ReadLine("max_grid_elements = 99999999999999999999999"),
      BlackbodyException);
  EXPECT_NO_THROW(input_reader.ReadLine("   # only a comment"));
  EXPECT_NO_THROW(input_reader.ReadLine(""));
}

TEST(InputReaderTest, MissingFileThrows)
{
  InputReader input_reader(::testing::TempDir() + "blackbody_missing.inputs");
  EXPECT_THROW(input_reader.Read(), BlackbodyException);
}

TEST(InputReaderTest, InvalidOptionValuesThrow)
{
  InputReader input_reader("unused");
  input_reader.ReadLine("num_threads = 0");
  EXPECT_THROW(RadianceOptions options(&input_reader), BlackbodyException);

  InputReader negative_reader("unused");
  negative_reader.ReadLine("temperature_epsilon = -1.0");
  EXPECT_THROW(RadianceOptions options(&negative_reader), BlackbodyException);

  InputReader limit_reader("unused");
  limit_reader.ReadLine("max_grid_elements = 0");
  EXPECT_THROW(RadianceOptions options(&limit_reader), BlackbodyException);
}

}  // namespace
