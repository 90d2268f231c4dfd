// Blackbody input reader header

#ifndef INPUT_READER_H_
#define INPUT_READER_H_

// C++ headers
#include <optional>  // optional
#include <string>    // string

// Blackbody headers
#include "../blackbody.hpp"  // enums

//--------------------------------------------------------------------------------------------------

// Input reader
struct InputReader
{
  // Constructors and destructor
  InputReader(const std::string input_file_);
  InputReader(const InputReader &source) = delete;
  InputReader &operator=(const InputReader &source) = delete;
  ~InputReader() = default;

  // Input file
  const std::string input_file;

  // Data - evaluation parameters
  std::optional<ExponentPrecision> exponent_precision;
  std::optional<double> temperature_epsilon;
  std::optional<long int> max_grid_elements;

  // Data - execution parameters
  std::optional<int> num_threads;
  std::optional<bool> verbose;

  // External functions
  void Read();
  void ReadLine(std::string line);

  // Internal functions - input_reader.cpp
  static bool RemoveableSpace(unsigned char c);
  bool ReadBool(const std::string &string);

  // Internal functions - enum_readers.cpp
  ExponentPrecision ReadExponentPrecision(const std::string &string);
};

#endif
