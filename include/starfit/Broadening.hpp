// Broadening.hpp
#pragma once
#include "Types.hpp"
#include "BasisBundle.hpp"

namespace starfit {

// below this vsini [km/s] the broadening kernel is narrower than a pixel
constexpr double kMinVsini = 0.2;

// relativistic Doppler factor sqrt((c+vz)/(c-vz)) applied to wavelengths
double doppler_factor(double vz_kms);

// Fourier transform of the rotational broadening kernel at |frequency| ss
Vector rotational_taper(const Vector& ss, double vsini_kms);

// broaden every row of the stacked basis (no threshold, vsini > 0)
Matrix rotational_broaden(const Matrix& rows, const Vector& ss, double vsini_kms);

// stacked basis broadened to vsini; ModelError for vsini < 0,
// unbroadened copy below kMinVsini
Matrix broaden_basis(const BasisBundle& basis, double vsini_kms);

} // namespace starfit
