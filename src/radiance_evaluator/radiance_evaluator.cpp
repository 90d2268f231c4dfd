// Blackbody radiance evaluator

// C++ headers
#include <algorithm>  // max, min
#include <cmath>      // abs, expm1, pow
#include <iostream>   // cout
#include <limits>     // numeric_limits
#include <sstream>    // ostringstream

// Library headers
#include <omp.h>  // omp_get_wtime, pragmas

// Blackbody headers
#include "radiance_evaluator.hpp"
#include "../blackbody.hpp"                  // Physics, enums
#include "../input_reader/input_reader.hpp"  // InputReader
#include "../utils/array.hpp"                // Array
#include "../utils/exceptions.hpp"           // BlackbodyException, BlackbodyWarning

//--------------------------------------------------------------------------------------------------

// Radiance options constructor
// Inputs:
//   p_input_reader: pointer to object containing input parameters
// Notes:
//   Parameters missing from the input file keep their default values.
RadianceOptions::RadianceOptions(const InputReader *p_input_reader)
{
  exponent_precision = p_input_reader->exponent_precision.value_or(exponent_precision);
  temperature_epsilon = p_input_reader->temperature_epsilon.value_or(temperature_epsilon);
  max_grid_elements = p_input_reader->max_grid_elements.value_or(max_grid_elements);
  num_threads = p_input_reader->num_threads.value_or(num_threads);
  verbose = p_input_reader->verbose.value_or(verbose);
  Validate();
}

//--------------------------------------------------------------------------------------------------

// Function for checking option values
// Inputs: (none)
// Outputs: (none)
void RadianceOptions::Validate() const
{
  if (not (temperature_epsilon >= 0.0) or std::isinf(temperature_epsilon))
    throw BlackbodyException("Temperature threshold must be non-negative and finite.");
  if (max_grid_elements <= 0l)
    throw BlackbodyException("Grid size limit must be positive.");
  if (num_threads <= 0)
    throw BlackbodyException("Number of threads must be positive.");
  return;
}

//--------------------------------------------------------------------------------------------------

// Function for calculating spectral radiance as function of wavenumber
// Inputs:
//   wavenumber: scalar or 1D array of wavenumbers (m^-1)
//   temperature: scalar or array of temperatures (K)
//   options: evaluation options
// Outputs:
//   *p_diagnostics: counters for this evaluation, if pointer is not null
//   returned value: spectral radiance (W m^-2 sr^-1 (m^-1)^-1), shaped by SelectResultShape()
Array<double> RadianceByWavenumber(const Array<double> &wavenumber,
    const Array<double> &temperature, const RadianceOptions &options,
    RadianceDiagnostics *p_diagnostics)
{
  return EvaluateRadiance(SpectralVariable::wavenumber, wavenumber, temperature, options,
      p_diagnostics);
}

//--------------------------------------------------------------------------------------------------

// Function for calculating spectral radiance at one wavenumber and temperature
// Inputs:
//   wavenumber: wavenumber (m^-1)
//   temperature: temperature (K)
//   options: evaluation options
// Outputs:
//   *p_diagnostics: counters for this evaluation, if pointer is not null
//   returned value: spectral radiance (W m^-2 sr^-1 (m^-1)^-1), NaN if temperature is masked
double RadianceByWavenumber(double wavenumber, double temperature,
    const RadianceOptions &options, RadianceDiagnostics *p_diagnostics)
{
  Array<double> wavenumber_array;
  wavenumber_array.AllocateScalar();
  wavenumber_array(0) = wavenumber;
  Array<double> temperature_array;
  temperature_array.AllocateScalar();
  temperature_array(0) = temperature;
  Array<double> radiance = EvaluateRadiance(SpectralVariable::wavenumber, wavenumber_array,
      temperature_array, options, p_diagnostics);
  return radiance(0);
}

//--------------------------------------------------------------------------------------------------

// Function for calculating spectral radiance as function of wavelength
// Inputs:
//   wavelength: scalar or 1D array of wavelengths (m)
//   temperature: scalar or array of temperatures (K)
//   options: evaluation options
// Outputs:
//   *p_diagnostics: counters for this evaluation, if pointer is not null
//   returned value: spectral radiance (W m^-2 sr^-1 m^-1), shaped by SelectResultShape()
Array<double> RadianceByWavelength(const Array<double> &wavelength,
    const Array<double> &temperature, const RadianceOptions &options,
    RadianceDiagnostics *p_diagnostics)
{
  return EvaluateRadiance(SpectralVariable::wavelength, wavelength, temperature, options,
      p_diagnostics);
}

//--------------------------------------------------------------------------------------------------

// Function for calculating spectral radiance at one wavelength and temperature
// Inputs:
//   wavelength: wavelength (m)
//   temperature: temperature (K)
//   options: evaluation options
// Outputs:
//   *p_diagnostics: counters for this evaluation, if pointer is not null
//   returned value: spectral radiance (W m^-2 sr^-1 m^-1), NaN if temperature is masked
double RadianceByWavelength(double wavelength, double temperature,
    const RadianceOptions &options, RadianceDiagnostics *p_diagnostics)
{
  Array<double> wavelength_array;
  wavelength_array.AllocateScalar();
  wavelength_array(0) = wavelength;
  Array<double> temperature_array;
  temperature_array.AllocateScalar();
  temperature_array(0) = temperature;
  Array<double> radiance = EvaluateRadiance(SpectralVariable::wavelength, wavelength_array,
      temperature_array, options, p_diagnostics);
  return radiance(0);
}

//--------------------------------------------------------------------------------------------------

// Function for evaluating Planck function on grid of temperatures and spectral positions
// Inputs:
//   variable: whether positions are wavenumbers or wavelengths
//   position: scalar or 1D array of spectral positions
//   temperature: scalar or array of temperatures
//   options: evaluation options
// Outputs:
//   *p_diagnostics: counters for this evaluation, if pointer is not null
//   returned value: spectral radiance, shaped by SelectResultShape()
// Notes:
//   Writes radiance as numerator / (exp(exponent_factor / T) - 1), where numerator and
//       exponent_factor depend only on the spectral position:
//     wavenumber nu: numerator = 2 h c^2 nu^3, exponent_factor = h c nu / k
//     wavelength lambda: numerator = 2 h c^2 / lambda^5, exponent_factor = h c / (k lambda)
//   Temperatures with |T| <= temperature_epsilon are never inverted; their outputs are NaN.
//   With single exponent precision the exponent argument is formed in float; the exponential is
//       always taken in double.
//   Negative exponents are counted; the wavelength form warns about them.
Array<double> EvaluateRadiance(SpectralVariable variable, const Array<double> &position,
    const Array<double> &temperature, const RadianceOptions &options,
    RadianceDiagnostics *p_diagnostics)
{
  // Check inputs
  double time_start = omp_get_wtime();
  options.Validate();
  ValidatePosition(variable, position);
  ValidateTemperature(temperature);
  ResultShape result_shape = SelectResultShape(position, temperature);
  int num_positions = static_cast<int>(position.n_tot);

  // Allocate arrays
  Array<double> numerator;
  Array<double> exponent_factor;
  Array<double> inverse_temperature;
  Array<bool> temperature_valid;
  Array<double> radiance;
  long int num_grid = 0;
  try
  {
    num_grid = CountGridElements(position, temperature, options);
    int num_temperatures = static_cast<int>(temperature.n_tot);
    numerator.Allocate(num_positions);
    exponent_factor.Allocate(num_positions);
    inverse_temperature.Allocate(num_temperatures);
    temperature_valid.Allocate(num_temperatures);
    radiance.Allocate(num_temperatures, num_positions);
  }
  catch (const BlackbodyResourceException &exception)
  {
    std::ostringstream warning;
    warning << "Dimensions of radiance grid (" << temperature.n_tot << " temperatures by "
        << position.n_tot << " spectral positions) probably reached limit.";
    warning << "\nMake sure the radiance/brightness temperature lookup table has been created and"
        << " try running again.";
    BlackbodyWarning(warning.str().c_str());
    std::ostringstream message;
    message << "Could not allocate radiance grid of " << temperature.n_tot << " by "
        << position.n_tot << " elements; pre-tabulate radiance against brightness temperature"
        << " instead of evaluating the full grid.";
    throw BlackbodyResourceException(message.str().c_str());
  }
  int num_temperatures = inverse_temperature.n1;

  // Calculate factors depending on spectral position
  const double two_h_c2 = 2.0 * Physics::h * Physics::c * Physics::c;
  const double h_c_k = Physics::h * Physics::c / Physics::k_b;
  for (int s = 0; s < num_positions; s++)
  {
    double val = position(s);
    if (variable == SpectralVariable::wavenumber)
    {
      numerator(s) = two_h_c2 * val * val * val;
      exponent_factor(s) = h_c_k * val;
    }
    else
    {
      numerator(s) = two_h_c2 / std::pow(val, 5);
      exponent_factor(s) = h_c_k / val;
    }
  }

  // Invert temperatures not too close to zero
  long int num_valid_temperatures = 0;
  for (int t = 0; t < num_temperatures; t++)
  {
    double val = temperature.data[t];
    temperature_valid(t) = std::abs(val) > options.temperature_epsilon;
    inverse_temperature(t) = temperature_valid(t) ? 1.0 / val : 0.0;
    if (temperature_valid(t))
      num_valid_temperatures++;
  }

  // Report ranges of exponent factors
  if (options.verbose)
  {
    double factor_min = exponent_factor(0);
    double factor_max = exponent_factor(0);
    for (int s = 1; s < num_positions; s++)
    {
      factor_min = std::min(factor_min, exponent_factor(s));
      factor_max = std::max(factor_max, exponent_factor(s));
    }
    std::cout << "Exponent factor range: " << factor_min << " to " << factor_max << "\n";
    if (num_valid_temperatures > 0)
    {
      double inverse_min = std::numeric_limits<double>::infinity();
      double inverse_max = -std::numeric_limits<double>::infinity();
      for (int t = 0; t < num_temperatures; t++)
        if (temperature_valid(t))
        {
          inverse_min = std::min(inverse_min, inverse_temperature(t));
          inverse_max = std::max(inverse_max, inverse_temperature(t));
        }
      std::cout << "Inverse temperature range: " << inverse_min << " to " << inverse_max << "\n";
    }
    std::cout << "Masked temperatures: " << num_temperatures - num_valid_temperatures << "/"
        << num_temperatures << "\n";
  }

  // Evaluate grid
  const bool single_precision = options.exponent_precision == ExponentPrecision::single;
  long int num_masked = 0;
  long int num_dubious = 0;
  double exponent_min = std::numeric_limits<double>::infinity();
  double exponent_max = -std::numeric_limits<double>::infinity();
  radiance.SetNaN();
  #pragma omp parallel for schedule(static) num_threads(options.num_threads) \
      reduction(+: num_masked, num_dubious) reduction(min: exponent_min) \
      reduction(max: exponent_max)
  for (int t = 0; t < num_temperatures; t++)
  {
    // Leave entire row as NaN for invalid temperature
    if (not temperature_valid(t))
    {
      num_masked += num_positions;
      continue;
    }

    // Calculate radiance at each position
    for (int s = 0; s < num_positions; s++)
    {
      double exponent, denominator;
      if (single_precision)
      {
        float exponent_single = static_cast<float>(exponent_factor(s))
            * static_cast<float>(inverse_temperature(t));
        exponent = exponent_single;
        denominator = std::expm1(static_cast<double>(exponent_single));
      }
      else
      {
        exponent = exponent_factor(s) * inverse_temperature(t);
        denominator = std::expm1(exponent);
      }
      if (exponent < 0.0)
        num_dubious++;
      exponent_min = std::min(exponent_min, exponent);
      exponent_max = std::max(exponent_max, exponent);
      radiance(t,s) = numerator(s) / denominator;
    }
  }

  // Report exponent range
  if (options.verbose and num_masked < num_grid)
    std::cout << "Exponent range: " << exponent_min << " to " << exponent_max << "\n";

  // Warn about negative exponents
  if (variable == SpectralVariable::wavelength and num_dubious > 0)
  {
    std::ostringstream message;
    message << "Negative exponent in radiance calculation for " << num_dubious << "/" << num_grid
        << " grid entries; denominator might be zero or negative.";
    BlackbodyWarning(message.str().c_str());
  }

  // Record diagnostics
  if (p_diagnostics != nullptr)
  {
    p_diagnostics->num_grid = num_grid;
    p_diagnostics->num_masked = num_masked;
    p_diagnostics->num_dubious = num_dubious;
    if (num_masked < num_grid)
    {
      p_diagnostics->exponent_min = exponent_min;
      p_diagnostics->exponent_max = exponent_max;
    }
    else
    {
      p_diagnostics->exponent_min = std::numeric_limits<double>::quiet_NaN();
      p_diagnostics->exponent_max = std::numeric_limits<double>::quiet_NaN();
    }
    p_diagnostics->time_elapsed = omp_get_wtime() - time_start;
  }

  // Present grid in shape expected by caller
  radiance.Reshape(result_shape.n_dim, result_shape.shape);
  return radiance;
}
