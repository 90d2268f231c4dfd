// Blackbody radiance evaluator header

#ifndef RADIANCE_EVALUATOR_H_
#define RADIANCE_EVALUATOR_H_

// Blackbody headers
#include "../blackbody.hpp"                  // enums
#include "../input_reader/input_reader.hpp"  // InputReader
#include "../utils/array.hpp"                // Array

//--------------------------------------------------------------------------------------------------

// Options controlling a single evaluation
struct RadianceOptions
{
  // Constructors
  RadianceOptions() = default;
  explicit RadianceOptions(const InputReader *p_input_reader);

  // Data
  ExponentPrecision exponent_precision = ExponentPrecision::single;
  double temperature_epsilon = 1.0e-6;
  long int max_grid_elements = 1l << 28;
  int num_threads = 1;
  bool verbose = false;

  // Functions
  void Validate() const;
};

//--------------------------------------------------------------------------------------------------

// Counters describing a single evaluation
// Notes:
//   Exponent extrema cover unmasked grid entries only and are NaN if there are none.
struct RadianceDiagnostics
{
  long int num_grid = 0;
  long int num_masked = 0;
  long int num_dubious = 0;
  double exponent_min = 0.0;
  double exponent_max = 0.0;
  double time_elapsed = 0.0;
};

//--------------------------------------------------------------------------------------------------

// Output shape selected from input shapes
struct ResultShape
{
  int n_dim = 0;
  int shape[Array<double>::max_dims] = {};
};

//--------------------------------------------------------------------------------------------------

// Functions - radiance_evaluator.cpp
Array<double> RadianceByWavenumber(const Array<double> &wavenumber,
    const Array<double> &temperature, const RadianceOptions &options = RadianceOptions(),
    RadianceDiagnostics *p_diagnostics = nullptr);
double RadianceByWavenumber(double wavenumber, double temperature,
    const RadianceOptions &options = RadianceOptions(),
    RadianceDiagnostics *p_diagnostics = nullptr);
Array<double> RadianceByWavelength(const Array<double> &wavelength,
    const Array<double> &temperature, const RadianceOptions &options = RadianceOptions(),
    RadianceDiagnostics *p_diagnostics = nullptr);
double RadianceByWavelength(double wavelength, double temperature,
    const RadianceOptions &options = RadianceOptions(),
    RadianceDiagnostics *p_diagnostics = nullptr);
Array<double> EvaluateRadiance(SpectralVariable variable, const Array<double> &position,
    const Array<double> &temperature, const RadianceOptions &options,
    RadianceDiagnostics *p_diagnostics);

// Functions - result_shape.cpp
ResultShape SelectResultShape(bool position_scalar, int num_positions, bool temperature_scalar,
    int temperature_n_dim, const int *temperature_shape);
ResultShape SelectResultShape(const Array<double> &position, const Array<double> &temperature);

// Functions - input_validation.cpp
void ValidatePosition(SpectralVariable variable, const Array<double> &position);
void ValidateTemperature(const Array<double> &temperature);
long int CountGridElements(const Array<double> &position, const Array<double> &temperature,
    const RadianceOptions &options);

#endif
