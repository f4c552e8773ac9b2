#include "starfit/Emulator.hpp"
#include "starfit/Errors.hpp"
#include <cmath>
#include <sstream>
#include <string>
#include <stdexcept>

namespace starfit {

/* ------------------------------------------------------------------ */
/*  construction: validate, factorise v11, pre-solve for the mean      */
/* ------------------------------------------------------------------ */
GPEmulator::GPEmulator(EmulatorData data, std::size_t cache_capacity)
    : data_(std::move(data))
    , cache_(cache_capacity)
{
    const PCABasis& b = data_.basis;
    const int M     = b.ncomp();
    const int ng    = ngrid();
    const int ndim  = grid_dim();

    if (b.flux_mean.size() != b.wl.size() || b.flux_std.size() != b.wl.size() ||
        b.eigenspectra.cols() != b.wl.size())
        throw std::invalid_argument("Emulator: PCA basis arrays differ in length");
    if (M == 0 || ng == 0 || ndim == 0)
        throw std::invalid_argument("Emulator: empty basis or grid");
    if (data_.weights.rows() != ng || data_.weights.cols() != M)
        throw std::invalid_argument("Emulator: weights must be ngrid x ncomp");
    if (data_.amp.size() != M || data_.lengths.rows() != M || data_.lengths.cols() != ndim)
        throw std::invalid_argument("Emulator: hyper-parameters do not match ncomp / grid dimension");
    if (data_.lambda_xi <= 0.0)
        throw std::invalid_argument("Emulator: lambda_xi must be positive");
    if (data_.fbol.size() != 0 && data_.fbol.size() != ng)
        throw std::invalid_argument("Emulator: fbol must have one value per grid point");

    min_params_ = data_.grid_points.colwise().minCoeff().transpose();
    max_params_ = data_.grid_points.colwise().maxCoeff().transpose();

    /* ---------- reconstruction noise  (E E^T)^-1 / lambda_xi ------- */
    const Matrix EEt  = b.eigenspectra * b.eigenspectra.transpose();
    const Matrix iEEt = EEt.ldlt().solve(Matrix::Identity(M, M));

    /* ---------- v11, block (k,j) of size ngrid x ngrid ------------- */
    const int   n = M * ng;
    Matrix      v11 = Matrix::Zero(n, n);
    for (int k = 0; k < M; ++k) {
        for (int i = 0; i < ng; ++i)
            for (int j = 0; j < ng; ++j)
                v11(k*ng + i, k*ng + j) = kernel(k, data_.grid_points.row(i).transpose(),
                                                    data_.grid_points.row(j).transpose());
        for (int j = 0; j < M; ++j)
            v11.block(k*ng, j*ng, ng, ng).diagonal().array() += iEEt(k, j) / data_.lambda_xi;
    }

    v11_llt_.compute(v11);
    if (v11_llt_.info() != Eigen::Success)
        throw std::runtime_error("Emulator: training covariance is not positive definite; "
                                 "check the GP hyper-parameters");

    /* ---------- w_hat stacked component by component --------------- */
    Vector w_hat(n);
    for (int k = 0; k < M; ++k)
        w_hat.segment(k*ng, ng) = data_.weights.col(k);
    alpha_ = v11_llt_.solve(w_hat);

    if (data_.fbol.size() != 0)
        fbol_interp_ = std::make_unique<GridInterpolator>(data_.grid_points, data_.fbol);
}

/* squared exponential in grid space, variance amp_k */
double GPEmulator::kernel(int comp, const Eigen::Ref<const Vector>& p0,
                          const Eigen::Ref<const Vector>& p1) const
{
    const auto   l  = data_.lengths.row(comp).transpose().array();
    const double r2 = ((p0.array() - p1.array()) / l).square().sum();
    return data_.amp[comp] * std::exp(-0.5 * r2);
}

void GPEmulator::check_in_grid(const Vector& p) const
{
    if (p.size() != grid_dim())
        throw std::invalid_argument("Emulator: expected " + std::to_string(grid_dim()) +
                                    " grid parameters, got " + std::to_string(p.size()));

    for (Eigen::Index d = 0; d < p.size(); ++d) {
        if (!(p[d] >= min_params_[d] && p[d] <= max_params_[d])) {
            std::ostringstream os;
            os << "Emulator: ";
            if (d < static_cast<Eigen::Index>(data_.param_names.size()))
                os << data_.param_names[d];
            else
                os << "parameter " << d;
            os << " = " << p[d] << " outside grid [" << min_params_[d]
               << ", " << max_params_[d] << "]";
            throw OutOfGridError(os.str());
        }
    }
}

/* ------------------------------------------------------------------ */
/*  conditional mean / covariance of the weights at p                 */
/* ------------------------------------------------------------------ */
EmulatorMatrix GPEmulator::compute(const Vector& p) const
{
    const int M  = ncomp();
    const int ng = ngrid();

    Matrix v12 = Matrix::Zero(M * ng, M);
    for (int k = 0; k < M; ++k)
        for (int i = 0; i < ng; ++i)
            v12(k*ng + i, k) = kernel(k, data_.grid_points.row(i).transpose(), p);

    EmulatorMatrix out;
    out.mus = v12.transpose() * alpha_;

    const Matrix W = v11_llt_.matrixL().solve(v12);
    out.C_GP = Matrix(data_.amp.asDiagonal()) - W.transpose() * W;
    out.C_GP = 0.5 * (out.C_GP + out.C_GP.transpose());
    return out;
}

EmulatorMatrixPtr GPEmulator::interpolate(const Vector& grid_params) const
{
    check_in_grid(grid_params);
    return cache_.insert_if_absent(grid_params, [&] { return compute(grid_params); });
}

double GPEmulator::fbol(const Vector& grid_params) const
{
    check_in_grid(grid_params);
    if (!fbol_interp_) return 1.0;
    return (*fbol_interp_)(grid_params);
}

} // namespace starfit
