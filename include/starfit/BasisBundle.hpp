#pragma once
#include "Types.hpp"
#include "Emulator.hpp"

namespace starfit {

/*
 * Immutable per-order copy of the PCA basis on the (chunked)
 * high-resolution grid, stacked as
 *
 *      row 0        flux_mean
 *      row 1        flux_std
 *      row 2..M+1   eigenspectra
 *
 * together with the FFT frequency magnitudes used for broadening.
 * The wavelength grid must be uniform in log(lambda).
 */
class BasisBundle {
public:
    explicit BasisBundle(const PCABasis& basis);

    // chunk around the data range, padded by buffer_kms on both sides
    BasisBundle(const PCABasis& basis, const Vector& wl_data, double buffer_kms);

    const Vector& wl()   const { return wl_; }
    const Matrix& rows() const { return rows_; }
    const Vector& ss()   const { return ss_; }

    double dv()       const { return dv_; }          // km/s per pixel
    double log_wl0()  const { return log_wl0_; }
    double log_step() const { return log_step_; }

    int npix()  const { return static_cast<int>(wl_.size()); }
    int ncomp() const { return static_cast<int>(rows_.rows()) - 2; }

private:
    void setup(const PCABasis& basis, Eigen::Index first, Eigen::Index count);

    Vector wl_;
    Matrix rows_;
    Vector ss_;
    double dv_       = 0.0;
    double log_wl0_  = 0.0;
    double log_step_ = 0.0;
};

} // namespace starfit
