#pragma once

#include "Types.hpp"
#include <boost/math/interpolators/cardinal_quintic_b_spline.hpp>

namespace starfit {

/*
 * Degree-5 interpolating B-spline through samples that are uniform in
 * log(lambda).  Evaluation takes wavelengths; anything outside the
 * sampled range throws GridRangeError, there is no extrapolation.
 */
class LogQuinticSpline {
private:
    boost::math::interpolators::cardinal_quintic_b_spline<Real> spline_;
    Real t_min_, t_max_;

public:
    LogQuinticSpline(const Real* y, std::size_t n, Real log_wl0, Real log_step);

    Real wl_min() const;
    Real wl_max() const;

    Real operator()(Real wl) const;
    Vector operator()(const Vector& wl) const;
};

/* GridRangeError unless wl_out lies within the npix samples starting at
 * log_wl0 with spacing log_step                                       */
void check_support(Real log_wl0, Real log_step, Eigen::Index npix,
                   const Vector& wl_out);

/* Resample every row of `rows` (sampled at log_wl0 + i*log_step)
 * onto wl_out.  Result is rows.rows() x wl_out.size().               */
Matrix resample_rows(const Matrix& rows, Real log_wl0, Real log_step,
                     const Vector& wl_out);

} // namespace starfit
