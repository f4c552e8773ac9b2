#pragma once
#include "Types.hpp"
#include "EmulatorCache.hpp"
#include "GridInterpolator.hpp"
#include <memory>
#include <string>
#include <vector>

namespace starfit {

/* PCA decomposition of the synthetic grid on its native
 * (log-uniform) high-resolution wavelength grid                      */
struct PCABasis {
    Vector wl;              // AA, npix
    Vector flux_mean;       // npix
    Vector flux_std;        // npix
    Matrix eigenspectra;    // M x npix

    int npix()  const { return static_cast<int>(wl.size()); }
    int ncomp() const { return static_cast<int>(eigenspectra.rows()); }
};

/*
 * Abstract emulator.  For a point in the grid parameter space it
 * returns the mean weight vector and the weight covariance of the
 * PCA eigenspectra.  Points outside the trained grid raise
 * OutOfGridError instead of being extrapolated.
 */
class Emulator {
public:
    virtual ~Emulator() = default;

    virtual const PCABasis& basis() const = 0;
    virtual int grid_dim() const = 0;

    int ncomp() const { return basis().ncomp(); }

    virtual EmulatorMatrixPtr interpolate(const Vector& grid_params) const = 0;

    // bolometric flux at grid_params, used for the luminosity ratio
    virtual double fbol(const Vector& grid_params) const = 0;
};

using EmulatorPtr = std::shared_ptr<const Emulator>;

/* ------------------------------------------------------------------ */
/*  Everything needed to set up the GP emulator                       */
/* ------------------------------------------------------------------ */
struct EmulatorData {
    PCABasis                 basis;
    std::vector<std::string> param_names;   // e.g. temp, logg, Z
    Matrix grid_points;     // ngrid x N
    Matrix weights;         // ngrid x M, PCA weights at the grid points
    Vector fbol;            // ngrid, may be empty (-> ratio 1)
    Vector amp;             // M, GP variance per eigenspectrum
    Matrix lengths;         // M x N, GP length scales
    double lambda_xi = 1.0; // precision of the reconstruction noise
};

/*
 * Gaussian-process emulator (one squared-exponential GP per PCA
 * component, coupled through the (E E^T)^-1 reconstruction noise term).
 * The big training covariance is factorised once in the constructor.
 */
class GPEmulator : public Emulator {
public:
    explicit GPEmulator(EmulatorData data, std::size_t cache_capacity = 256);

    const PCABasis& basis() const override { return data_.basis; }
    int grid_dim() const override { return static_cast<int>(data_.grid_points.cols()); }
    int ngrid() const { return static_cast<int>(data_.grid_points.rows()); }

    const std::vector<std::string>& param_names() const { return data_.param_names; }
    const Vector& min_params() const { return min_params_; }
    const Vector& max_params() const { return max_params_; }

    EmulatorMatrixPtr interpolate(const Vector& grid_params) const override;
    double fbol(const Vector& grid_params) const override;

    const EmulatorCache& cache() const { return cache_; }

private:
    void check_in_grid(const Vector& p) const;
    EmulatorMatrix compute(const Vector& p) const;
    double kernel(int comp, const Eigen::Ref<const Vector>& p0,
                  const Eigen::Ref<const Vector>& p1) const;

    EmulatorData data_;
    Vector       min_params_, max_params_;

    Eigen::LLT<Matrix> v11_llt_;   // (M*ngrid)^2
    Vector             alpha_;     // v11^-1 w_hat

    std::unique_ptr<GridInterpolator> fbol_interp_;
    mutable EmulatorCache cache_;
};

} // namespace starfit
