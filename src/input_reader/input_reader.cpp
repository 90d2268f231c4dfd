// Blackbody input reader

// C++ headers
#include <algorithm>  // remove_if
#include <cctype>     // isspace
#include <fstream>    // ifstream
#include <sstream>    // ostringstream
#include <stdexcept>  // invalid_argument, out_of_range
#include <string>     // getline, stod, stoi, stol, string

// Blackbody headers
#include "input_reader.hpp"
#include "../blackbody.hpp"         // enums
#include "../utils/exceptions.hpp"  // BlackbodyException

//--------------------------------------------------------------------------------------------------

// Input reader constructor
// Inputs:
//   input_file_: name of input file
InputReader::InputReader(const std::string input_file_)
  : input_file(input_file_) {}

//--------------------------------------------------------------------------------------------------

// Input reader read function
// Inputs: (none)
// Outputs: (none)
// Notes:
//   Keys absent from the file leave their values empty.
void InputReader::Read()
{
  // Open input file
  std::ifstream input_stream(input_file);
  if (not input_stream.is_open())
  {
    std::ostringstream message;
    message << "Could not open input file (" << input_file << ").";
    throw BlackbodyException(message.str().c_str());
  }

  // Process file line by line
  for (std::string line; std::getline(input_stream, line); )
    ReadLine(line);
  return;
}

//--------------------------------------------------------------------------------------------------

// Function for interpreting single line of input
// Inputs:
//   line: raw line, possibly with whitespace and comments
// Outputs: (none)
void InputReader::ReadLine(std::string line)
{
  // Remove spaces
  line.erase(std::remove_if(line.begin(), line.end(), RemoveableSpace), line.end());

  // Remove comments
  std::string::size_type pos = line.find('#');
  if (pos != std::string::npos)
    line.erase(pos);

  // Skip blank lines
  if (line.empty())
    return;

  // Split on '='
  pos = line.find('=');
  if (pos == std::string::npos)
    throw BlackbodyException("Invalid assignment in input file.");
  std::string key = line.substr(0, pos);
  std::string val = line.substr(pos + 1, line.size());

  try
  {
    // Store evaluation parameters
    if (key == "exponent_precision")
      exponent_precision = ReadExponentPrecision(val);
    else if (key == "temperature_epsilon")
      temperature_epsilon = std::stod(val);
    else if (key == "max_grid_elements")
      max_grid_elements = std::stol(val);

    // Store execution parameters
    else if (key == "num_threads")
      num_threads = std::stoi(val);
    else if (key == "verbose")
      verbose = ReadBool(val);

    // Handle unknown entry
    else
    {
      std::ostringstream message;
      message << "Unknown key (" << key << ") in input file.";
      throw BlackbodyException(message.str().c_str());
    }
  }
  catch (const std::invalid_argument &exception)
  {
    std::ostringstream message;
    message << "Invalid value (" << val << ") for key " << key << " in input file.";
    throw BlackbodyException(message.str().c_str());
  }
  catch (const std::out_of_range &exception)
  {
    std::ostringstream message;
    message << "Out-of-range value (" << val << ") for key " << key << " in input file.";
    throw BlackbodyException(message.str().c_str());
  }
  return;
}

//--------------------------------------------------------------------------------------------------

// Definition of what constitutes a space
// Inputs:
//   c: character to test
// Outputs:
//   returned value: true if c should be removed
bool InputReader::RemoveableSpace(unsigned char c)
{
  return std::isspace(c) != 0;
}

//--------------------------------------------------------------------------------------------------

// Function for interpreting strings as booleans
// Inputs:
//   string: string to be interpreted
// Outputs:
//   returned value: true or false
// Notes:
//   "true" evaluates to true, "false" to false, and anything else throws an exception.
bool InputReader::ReadBool(const std::string &string)
{
  if (string == "true")
    return true;
  else if (string == "false")
    return false;
  else
    throw BlackbodyException("Unknown string used for boolean value.");
}
