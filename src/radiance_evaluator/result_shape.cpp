// Blackbody radiance evaluator - result shape selection

// Blackbody headers
#include "radiance_evaluator.hpp"
#include "../utils/array.hpp"       // Array
#include "../utils/exceptions.hpp"  // BlackbodyException

//--------------------------------------------------------------------------------------------------

// Function for selecting shape of radiance result
// Inputs:
//   position_scalar: flag indicating spectral position was given as scalar
//   num_positions: number of spectral positions (1 for scalar)
//   temperature_scalar: flag indicating temperature was given as scalar
//   temperature_n_dim: rank of temperature array (ignored if temperature_scalar)
//   temperature_shape: shape of temperature array, outermost first (ignored if
//       temperature_scalar)
// Outputs:
//   returned value: rank and shape of result, outermost first
// Notes:
//   Grid is always computed as (temperature, position); this only decides how it is presented:
//     single position, scalar temperature: scalar
//     single position, temperature array: temperature shape
//     multiple positions, scalar temperature: 1D spectrum
//     multiple positions, temperature array: temperature shape with spectral axis appended
//   A 1D position array of length 1 counts as a single position.
ResultShape SelectResultShape(bool position_scalar, int num_positions, bool temperature_scalar,
    int temperature_n_dim, const int *temperature_shape)
{
  if (num_positions <= 0)
    throw BlackbodyException("Spectral position array is empty.");
  if (position_scalar and num_positions != 1)
    throw BlackbodyException("Scalar spectral position must have exactly one value.");
  if (not temperature_scalar
      and (temperature_n_dim < 1 or temperature_n_dim > Array<double>::max_dims - 1))
    throw BlackbodyException("Temperature array has unsupported number of dimensions.");

  ResultShape result;
  if (temperature_scalar)
  {
    if (num_positions > 1)
    {
      result.n_dim = 1;
      result.shape[0] = num_positions;
    }
    return result;
  }
  result.n_dim = temperature_n_dim;
  for (int axis = 0; axis < temperature_n_dim; axis++)
    result.shape[axis] = temperature_shape[axis];
  if (num_positions > 1)
  {
    result.shape[temperature_n_dim] = num_positions;
    result.n_dim++;
  }
  return result;
}

//--------------------------------------------------------------------------------------------------

// Function for selecting shape of radiance result from input arrays
// Inputs:
//   position: wavenumbers or wavelengths
//   temperature: temperatures
// Outputs:
//   returned value: rank and shape of result, outermost first
ResultShape SelectResultShape(const Array<double> &position, const Array<double> &temperature)
{
  int temperature_shape[Array<double>::max_dims] = {};
  temperature.GetShape(temperature_shape);
  return SelectResultShape(position.IsScalar(), static_cast<int>(position.n_tot),
      temperature.IsScalar(), temperature.n_dim, temperature_shape);
}
