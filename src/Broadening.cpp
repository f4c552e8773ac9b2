// Broadening.cpp
#include "starfit/Broadening.hpp"
#include "starfit/Errors.hpp"
#include <boost/math/special_functions/bessel.hpp>
#include <unsupported/Eigen/FFT>
#include <cmath>
#include <complex>
#include <sstream>
#include <vector>

namespace starfit {

double doppler_factor(double vz)
{
    if (!(std::abs(vz) < c_kms)) {
        std::ostringstream os;
        os << "radial velocity " << vz << " km/s is not physical";
        throw ModelError(os.str());
    }
    return std::sqrt((c_kms + vz) / (c_kms - vz));
}

/* ------------- rotation kernel in Fourier space ---------------------- *
 *   sb(u) = J1(u)/u - 3 cos(u)/(2u^2) + 3 sin(u)/(2u^3),  u = 2 pi vsini s
 * ---------------------------------------------------------------------- */
static inline double taper_at(double u)
{
    if (u == 0.0) return 1.0;                        // DC term
    if (u < 0.1) {                                   // closed form cancels here
        const double v = u * u;
        return 1.0 - v * (9.0 / 80.0 - v * (59.0 / 13440.0 - v * (1.0 / 18432.0 + 1.0 / 30240.0)));
    }

    const double u2 = u * u;
    return boost::math::cyl_bessel_j(1, u) / u
         - 3.0 * std::cos(u) / (2.0 * u2)
         + 3.0 * std::sin(u) / (2.0 * u2 * u);
}

Vector rotational_taper(const Vector& ss, double vsini)
{
    Vector sb(ss.size());
    for (Eigen::Index k = 0; k < ss.size(); ++k)
        sb[k] = taper_at(2.0 * M_PI * vsini * ss[k]);
    return sb;
}

Matrix rotational_broaden(const Matrix& rows, const Vector& ss, double vsini)
{
    const Eigen::Index nrows = rows.rows();
    const Eigen::Index npix  = rows.cols();
    if (ss.size() != npix)
        throw std::invalid_argument("rotational_broaden: frequency grid does not match basis");

    const Vector sb = rotational_taper(ss, vsini);
    Matrix out(nrows, npix);

    #pragma omp parallel
    {
        Eigen::FFT<double>                fft;    // plans are per object
        std::vector<double>               buf(npix);
        std::vector<std::complex<double>> spec;

        #pragma omp for schedule(static)
        for (Eigen::Index r = 0; r < nrows; ++r) {
            for (Eigen::Index i = 0; i < npix; ++i) buf[i] = rows(r, i);

            fft.fwd(spec, buf);                            // full spectrum
            for (Eigen::Index k = 0; k < npix; ++k) spec[k] *= sb[k];
            fft.inv(buf, spec);

            for (Eigen::Index i = 0; i < npix; ++i) out(r, i) = buf[i];
        }
    }
    return out;
}

Matrix broaden_basis(const BasisBundle& basis, double vsini)
{
    if (!(vsini >= 0.0)) {
        std::ostringstream os;
        os << "vsini must be non-negative, got " << vsini;
        throw ModelError(os.str());
    }
    if (vsini < kMinVsini)
        return basis.rows();

    return rotational_broaden(basis.rows(), basis.ss(), vsini);
}

} // namespace starfit
