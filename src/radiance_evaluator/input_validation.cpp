// Blackbody radiance evaluator - input validation

// C++ headers
#include <climits>  // INT_MAX
#include <cmath>    // isfinite, isinf
#include <sstream>  // ostringstream

// Blackbody headers
#include "radiance_evaluator.hpp"
#include "../blackbody.hpp"         // SpectralVariable
#include "../utils/array.hpp"       // Array
#include "../utils/exceptions.hpp"  // BlackbodyException, BlackbodyResourceException

//--------------------------------------------------------------------------------------------------

// Function for checking spectral positions
// Inputs:
//   variable: whether positions are wavenumbers or wavelengths
//   position: spectral positions
// Outputs: (none)
// Notes:
//   Positions must form a scalar or 1D array of positive finite values.
void ValidatePosition(SpectralVariable variable, const Array<double> &position)
{
  const char *name = variable == SpectralVariable::wavenumber ? "Wavenumber" : "Wavelength";
  if (not position.allocated)
  {
    std::ostringstream message;
    message << name << " array has not been allocated.";
    throw BlackbodyException(message.str().c_str());
  }
  if (position.n_dim > 1)
  {
    std::ostringstream message;
    message << name << " must be a scalar or 1D array (given " << position.n_dim
        << " dimensions).";
    throw BlackbodyException(message.str().c_str());
  }
  for (long int n = 0; n < position.n_tot; n++)
  {
    double value = position.data[n];
    if (not std::isfinite(value) or value <= 0.0)
    {
      std::ostringstream message;
      message << name << " values must be positive and finite (index " << n << " is " << value
          << ").";
      throw BlackbodyException(message.str().c_str());
    }
  }
  return;
}

//--------------------------------------------------------------------------------------------------

// Function for checking temperatures
// Inputs:
//   temperature: temperatures
// Outputs: (none)
// Notes:
//   NaN temperatures are allowed and end up masked along with near-zero ones.
void ValidateTemperature(const Array<double> &temperature)
{
  if (not temperature.allocated)
    throw BlackbodyException("Temperature array has not been allocated.");
  if (temperature.n_dim > Array<double>::max_dims - 1)
  {
    std::ostringstream message;
    message << "Temperature array may have at most " << Array<double>::max_dims - 1
        << " dimensions (given " << temperature.n_dim << ").";
    throw BlackbodyException(message.str().c_str());
  }
  for (long int n = 0; n < temperature.n_tot; n++)
    if (std::isinf(temperature.data[n]))
    {
      std::ostringstream message;
      message << "Temperature values must not be infinite (index " << n << ").";
      throw BlackbodyException(message.str().c_str());
    }
  return;
}

//--------------------------------------------------------------------------------------------------

// Function for sizing radiance grid
// Inputs:
//   position: spectral positions
//   temperature: temperatures
//   options: evaluation options, including grid size limit
// Outputs:
//   returned value: number of (temperature, position) pairs
// Notes:
//   Throws BlackbodyResourceException rather than attempt a grid that exceeds the limit or the
//       index range of Array.
long int CountGridElements(const Array<double> &position, const Array<double> &temperature,
    const RadianceOptions &options)
{
  long int num_positions = position.n_tot;
  long int num_temperatures = temperature.n_tot;
  if (num_positions > INT_MAX or num_temperatures > INT_MAX
      or num_temperatures > options.max_grid_elements / num_positions)
  {
    std::ostringstream message;
    message << "Radiance grid of " << num_temperatures << " temperatures by " << num_positions
        << " spectral positions exceeds limit of " << options.max_grid_elements
        << " elements.";
    throw BlackbodyResourceException(message.str().c_str());
  }
  return num_positions * num_temperatures;
}
