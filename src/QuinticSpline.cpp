#include "starfit/QuinticSpline.hpp"
#include "starfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace starfit {

LogQuinticSpline::LogQuinticSpline(const Real* y, std::size_t n,
                                   Real log_wl0, Real log_step)
    : spline_(y, n, log_wl0, log_step),
      t_min_(log_wl0),
      t_max_(log_wl0 + static_cast<Real>(n - 1) * log_step)
{}

Real LogQuinticSpline::wl_min() const { return std::exp(t_min_); }
Real LogQuinticSpline::wl_max() const { return std::exp(t_max_); }

Real LogQuinticSpline::operator()(Real wl) const
{
    const Real t = std::log(wl);
    // a few ulps of slack for the log/exp round trip at the edges
    const Real slack = 4.0 * std::numeric_limits<Real>::epsilon() * std::abs(t);
    if (t < t_min_ - slack || t > t_max_ + slack) {
        std::ostringstream os;
        os << "wavelength " << wl << " outside spline support ["
           << wl_min() << ", " << wl_max() << "]";
        throw GridRangeError(os.str());
    }
    return spline_(std::clamp(t, t_min_, t_max_));
}

Vector LogQuinticSpline::operator()(const Vector& wl) const
{
    Vector out(wl.size());
    for (Eigen::Index i = 0; i < wl.size(); ++i)
        out[i] = operator()(wl[i]);
    return out;
}

/* ------------------------------------------------------------------ */
void check_support(Real log_wl0, Real log_step, Eigen::Index npix,
                   const Vector& wl_out)
{
    const Real lo = std::exp(log_wl0);
    const Real hi = std::exp(log_wl0 + static_cast<Real>(npix - 1) * log_step);
    if (wl_out.size() > 0 && (wl_out.minCoeff() < lo || wl_out.maxCoeff() > hi)) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(2)
           << "Data wl grid (" << wl_out.minCoeff() << "," << wl_out.maxCoeff()
           << ") must fit within the range of the model grid (" << lo << "," << hi << ")";
        throw GridRangeError(os.str());
    }
}

Matrix resample_rows(const Matrix& rows, Real log_wl0, Real log_step,
                     const Vector& wl_out)
{
    const Eigen::Index nrows = rows.rows();
    const Eigen::Index npix  = rows.cols();

    check_support(log_wl0, log_step, npix, wl_out);    // before any spline is built

    Matrix out(nrows, wl_out.size());
    std::exception_ptr failure;

    #pragma omp parallel
    {
        std::vector<Real> y(npix);

        #pragma omp for schedule(static)
        for (Eigen::Index r = 0; r < nrows; ++r) {
            try {
                for (Eigen::Index i = 0; i < npix; ++i) y[i] = rows(r, i);
                LogQuinticSpline spl(y.data(), y.size(), log_wl0, log_step);
                out.row(r) = spl(wl_out).transpose();
            } catch (...) {
                // exceptions may not leave the parallel region; rethrown below
                #pragma omp critical
                if (!failure) failure = std::current_exception();
            }
        }
    }
    if (failure) std::rethrow_exception(failure);
    return out;
}

} // namespace starfit
