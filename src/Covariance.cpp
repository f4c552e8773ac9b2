#include "starfit/Covariance.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace starfit {

namespace {
constexpr double kTaperLengths = 6.0;   // r0 = 6 l
constexpr double kRegionSigmas = 4.0;
const double     kSqrt3        = std::sqrt(3.0);
} // unnamed namespace

double velocity_distance(double wl0, double wl1)
{
    return 2.0 * c_kms * std::abs(wl1 - wl0) / (wl0 + wl1);
}

KernelFunc make_k_func(const PhiParams& phi)
{
    const double amp2 = phi.amp * phi.amp;
    const double l    = phi.l;
    const double r0   = kTaperLengths * l;

    return [amp2, l, r0](double wl0, double wl1) -> double {
        const double r = velocity_distance(wl0, wl1);
        if (r >= r0) return 0.0;
        const double taper = 0.5 + 0.5 * std::cos(M_PI * r / r0);
        const double x     = kSqrt3 * r / l;
        return taper * amp2 * (1.0 + x) * std::exp(-x);
    };
}

KernelFunc make_k_func_region(const CovRegion& region)
{
    const double a     = std::pow(10.0, region.logAmp);
    const double mu    = region.mu;
    const double sigma = region.sigma;
    const double rmax  = kRegionSigmas * sigma;

    return [a, mu, sigma, rmax](double wl0, double wl1) -> double {
        const double r0 = c_kms / mu * std::abs(wl0 - mu);
        const double r1 = c_kms / mu * std::abs(wl1 - mu);
        if (r0 > rmax || r1 > rmax) return 0.0;
        return a * std::exp(-0.5 * (r0 * r0 + r1 * r1) / (sigma * sigma));
    };
}

Matrix get_dense_C(const Vector& wl, const KernelFunc& k_func, double max_r)
{
    const Eigen::Index N = wl.size();
    if (!std::is_sorted(wl.data(), wl.data() + N))
        throw std::invalid_argument("get_dense_C: wavelengths must be ascending");

    Matrix C = Matrix::Zero(N, N);
    for (Eigen::Index i = 0; i < N; ++i) {
        for (Eigen::Index j = i; j < N; ++j) {
            // distance grows monotonically with j on an ascending grid
            if (velocity_distance(wl[i], wl[j]) > max_r) break;
            const double cov = k_func(wl[i], wl[j]);
            C(i, j) = cov;
            C(j, i) = cov;
        }
    }
    return C;
}

Matrix get_region_C(const Vector& wl, const std::vector<CovRegion>& regions)
{
    const Eigen::Index N = wl.size();
    Matrix C = Matrix::Zero(N, N);

    for (const auto& reg : regions) {
        if (!(reg.sigma > 0.0) || !(reg.mu > 0.0))
            throw std::invalid_argument("covariance region needs mu > 0 and sigma > 0");

        const KernelFunc k = make_k_func_region(reg);
        const double half  = kRegionSigmas * reg.sigma * reg.mu / c_kms;   // [AA]

        /* only pixels within reach of the line centre contribute */
        const double* first = wl.data();
        const double* last  = wl.data() + N;
        const Eigen::Index lo = std::lower_bound(first, last, reg.mu - half) - first;
        const Eigen::Index hi = std::upper_bound(first, last, reg.mu + half) - first;

        for (Eigen::Index i = lo; i < hi; ++i)
            for (Eigen::Index j = i; j < hi; ++j) {
                const double cov = k(wl[i], wl[j]);
                C(i, j) += cov;
                if (j != i) C(j, i) += cov;
            }
    }
    return C;
}

Matrix build_data_covariance(const Vector& wl, const Vector& sigma,
                             const PhiParams& phi)
{
    if (wl.size() != sigma.size())
        throw std::invalid_argument("build_data_covariance: wl / sigma size mismatch");

    Matrix C;
    if (phi.amp > 0.0)
        C = get_dense_C(wl, make_k_func(phi), kTaperLengths * phi.l);
    else
        C = Matrix::Zero(wl.size(), wl.size());

    if (!phi.regions.empty())
        C += get_region_C(wl, phi.regions);

    C.diagonal().array() += phi.sigAmp * phi.sigAmp * sigma.array().square();
    return C;
}

} // namespace starfit
