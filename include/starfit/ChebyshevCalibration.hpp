#pragma once
#include "Types.hpp"

namespace starfit {

/*
 * Multiplicative per-order calibration  k(x) = sum_i c_i T_i(x), with the
 * pixel index mapped onto x in [-1, 1].  With fix_c0 the zeroth
 * coefficient is held at 1 and evaluate() takes the remaining npoly-1.
 */
class ChebyshevCalibration {
public:
    ChebyshevCalibration(int npix, int npoly, bool fix_c0);

    Vector evaluate(const Vector& cheb) const;     // ← multiplicative factor

    int  npoly()  const { return static_cast<int>(T_.rows()); }
    bool fix_c0() const { return fix_c0_; }
    int  nfree()  const { return fix_c0_ ? npoly() - 1 : npoly(); }

private:
    Matrix T_;      // npoly x npix, T_i evaluated at every pixel
    bool   fix_c0_;
};

} // namespace starfit
