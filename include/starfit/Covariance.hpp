#pragma once
#include "Types.hpp"
#include "Parameters.hpp"
#include <functional>
#include <vector>

namespace starfit {

using KernelFunc = std::function<double(double wl0, double wl1)>;

// |wl1 - wl0| expressed as a velocity [km/s]
double velocity_distance(double wl0, double wl1);

/* Hann-tapered Matern-3/2 kernel, amplitude amp^2, length l, zero
 * beyond r0 = 6 l                                                    */
KernelFunc make_k_func(const PhiParams& phi);

/* Gaussian "bad line" kernel centred on region.mu, zero if either
 * pixel is more than 4 sigma away from the centre                    */
KernelFunc make_k_func_region(const CovRegion& region);

/* Dense symmetric kernel matrix over wl (ascending).  Pairs further
 * apart than max_r [km/s] are left exactly zero.                     */
Matrix get_dense_C(const Vector& wl, const KernelFunc& k_func, double max_r);

Matrix get_region_C(const Vector& wl, const std::vector<CovRegion>& regions);

/* Full per-order covariance:
 *     C_GP(l, amp) + sum regions + sigAmp^2 diag(sigma^2)            */
Matrix build_data_covariance(const Vector& wl, const Vector& sigma,
                             const PhiParams& phi);

} // namespace starfit
