// Blackbody main header

#ifndef BLACKBODY_H_
#define BLACKBODY_H_

// Physical constants (SI)
namespace Physics
{
  constexpr double c = 2.99792458e8;
  constexpr double h = 6.62606957e-34;
  constexpr double k_b = 1.3806488e-23;
}

// Scoped enumerations
enum struct ExponentPrecision {single, full};
enum struct SpectralVariable {wavenumber, wavelength};

#endif
