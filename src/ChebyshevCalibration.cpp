#include "starfit/ChebyshevCalibration.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace starfit {

ChebyshevCalibration::ChebyshevCalibration(int npix, int npoly, bool fix_c0)
    : T_(std::max(npoly, 1), std::max(npix, 2)), fix_c0_(fix_c0)
{
    if (npoly < 1 || npix < 2)
        throw std::invalid_argument("ChebyshevCalibration: need npoly >= 1 and npix >= 2");

    const Vector x = Vector::LinSpaced(npix, -1.0, 1.0);
    T_.row(0).setOnes();
    if (npoly > 1) T_.row(1) = x.transpose();
    for (int i = 2; i < npoly; ++i)                       // T_i = 2x T_i-1 - T_i-2
        T_.row(i) = 2.0 * x.transpose().cwiseProduct(T_.row(i - 1)) - T_.row(i - 2);
}

Vector ChebyshevCalibration::evaluate(const Vector& cheb) const
{
    if (cheb.size() != nfree())
        throw std::invalid_argument("ChebyshevCalibration: expected " + std::to_string(nfree()) +
                                    " coefficients, got " + std::to_string(cheb.size()));

    if (!fix_c0_)
        return T_.transpose() * cheb;

    Vector k = T_.row(0).transpose();
    if (nfree() > 0)
        k.noalias() += T_.bottomRows(nfree()).transpose() * cheb;
    return k;
}

} // namespace starfit
