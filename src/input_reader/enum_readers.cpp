// Blackbody input reader - enum readers

// C++ headers
#include <string>  // string

// Blackbody headers
#include "input_reader.hpp"
#include "../blackbody.hpp"         // enums
#include "../utils/exceptions.hpp"  // BlackbodyException

//--------------------------------------------------------------------------------------------------

// Function for interpreting strings as ExponentPrecision enums
// Inputs:
//   string: string to be interpreted
// Outputs:
//   returned value: valid ExponentPrecision
// Notes:
//   Valid options:
//     "single": exponent argument formed in float, exponentiated in double
//     "double": exponent argument formed and exponentiated in double
ExponentPrecision InputReader::ReadExponentPrecision(const std::string &string)
{
  if (string == "single")
    return ExponentPrecision::single;
  else if (string == "double")
    return ExponentPrecision::full;
  else
    throw BlackbodyException("Unknown string used for ExponentPrecision value.");
}
