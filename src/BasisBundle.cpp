#include "starfit/BasisBundle.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace starfit {

/* largest relative deviation from a constant log step we accept */
static constexpr double kLogStepTol = 1e-4;
/* the quintic spline needs at least this many nodes */
static constexpr Eigen::Index kMinPix = 8;

BasisBundle::BasisBundle(const PCABasis& basis)
{
    setup(basis, 0, basis.wl.size());
}

/* ------------------------------------------------------------------ *
 *  Smallest power of two larger than the number of basis pixels       *
 *  inside the data range (plus buffer), centred on the data.  If that *
 *  is not shorter than the basis, the whole basis is used.            *
 * ------------------------------------------------------------------ */
BasisBundle::BasisBundle(const PCABasis& basis, const Vector& wl_data,
                         double buffer_kms)
{
    if (wl_data.size() == 0)
        throw std::invalid_argument("BasisBundle: empty data wavelength grid");

    const Vector& wl = basis.wl;
    const Eigen::Index len_wl = wl.size();

    const double wl_min = wl_data.minCoeff() * (1.0 - buffer_kms / c_kms);
    const double wl_max = wl_data.maxCoeff() * (1.0 + buffer_kms / c_kms);

    const Eigen::Index len_data =
        static_cast<Eigen::Index>(((wl.array() > wl_min) && (wl.array() < wl_max)).count());

    Eigen::Index chunk = kMinPix;
    while (chunk <= len_data) chunk *= 2;
    if (chunk > len_wl) chunk = len_wl;

    Eigen::Index first = 0;
    if (chunk < len_wl) {
        const double center_wl = 0.5 * (wl_min + wl_max);
        Eigen::Index center_ind = 0;
        (wl.array() - center_wl).abs().minCoeff(&center_ind);
        first = std::clamp<Eigen::Index>(center_ind - chunk / 2, 0, len_wl - chunk);
    }
    setup(basis, first, chunk);
}

void BasisBundle::setup(const PCABasis& basis, Eigen::Index first, Eigen::Index n)
{
    if (n < kMinPix)
        throw std::invalid_argument("BasisBundle: need at least 8 high-resolution pixels");

    const int M = basis.ncomp();
    wl_ = basis.wl.segment(first, n);

    rows_.resize(M + 2, n);
    rows_.row(0) = basis.flux_mean.segment(first, n).transpose();
    rows_.row(1) = basis.flux_std.segment(first, n).transpose();
    rows_.bottomRows(M) = basis.eigenspectra.middleCols(first, n);

    /* ---------- log-uniform check --------------------------------- */
    log_wl0_  = std::log(wl_[0]);
    log_step_ = (std::log(wl_[n - 1]) - log_wl0_) / static_cast<double>(n - 1);
    if (!(log_step_ > 0.0))
        throw std::invalid_argument("BasisBundle: wavelengths must increase");

    for (Eigen::Index i = 1; i < n; ++i) {
        const double step = std::log(wl_[i] / wl_[i - 1]);
        if (std::abs(step - log_step_) > kLogStepTol * log_step_) {
            std::ostringstream os;
            os << "BasisBundle: wavelength grid is not log-uniform at pixel "
               << first + i << " (step " << step << " vs " << log_step_ << ")";
            throw std::invalid_argument(os.str());
        }
    }
    dv_ = c_kms * log_step_;

    /* ---------- |frequency| of every FFT bin [cycles / (km/s)] ----- */
    ss_.resize(n);
    for (Eigen::Index k = 0; k < n; ++k)
        ss_[k] = static_cast<double>(std::min(k, n - k)) / (static_cast<double>(n) * dv_);
}

} // namespace starfit
