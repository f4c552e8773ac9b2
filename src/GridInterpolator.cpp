#include "starfit/GridInterpolator.hpp"
#include "starfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace starfit {

static constexpr double kAxisTol = 1e-9;

static bool same_node(double a, double b)
{
    return std::abs(a - b) <= kAxisTol * std::max(1.0, std::abs(a));
}

/* index of value v on a sorted axis (must be a node) */
static Eigen::Index node_index(const Vector& axis, double v)
{
    const double* first = axis.data();
    const double* last  = axis.data() + axis.size();
    const double* it    = std::lower_bound(first, last, v - kAxisTol * std::max(1.0, std::abs(v)));
    if (it == last || !same_node(*it, v))
        throw std::logic_error("GridInterpolator: point is not on its own axis");
    return static_cast<Eigen::Index>(it - first);
}

GridInterpolator::GridInterpolator(const Matrix& points, const Vector& values)
{
    if (points.rows() != values.size())
        throw std::invalid_argument("GridInterpolator: points / values size mismatch");
    if (points.rows() == 0)
        throw std::invalid_argument("GridInterpolator: empty grid");

    const Eigen::Index ndim = points.cols();

    /* ---------- unique sorted coordinates per axis ---------------- */
    for (Eigen::Index d = 0; d < ndim; ++d) {
        std::vector<double> v(points.col(d).data(),
                              points.col(d).data() + points.rows());
        std::sort(v.begin(), v.end());
        v.erase(std::unique(v.begin(), v.end(), same_node), v.end());
        axes_.emplace_back(Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size())));
    }

    /* ---------- row-major strides over the full hyper-cube -------- */
    strides_.assign(ndim, 1);
    Eigen::Index total = 1;
    for (Eigen::Index d = ndim - 1; d >= 0; --d) {
        strides_[d] = total;
        total      *= axes_[d].size();
    }

    table_ = Vector::Constant(total, std::numeric_limits<double>::quiet_NaN());
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        Eigen::Index flat = 0;
        for (Eigen::Index d = 0; d < ndim; ++d)
            flat += strides_[d] * node_index(axes_[d], points(i, d));
        table_[flat] = values[i];
    }
}

double GridInterpolator::operator()(const Vector& p) const
{
    const Eigen::Index ndim = static_cast<Eigen::Index>(axes_.size());
    if (p.size() != ndim)
        throw std::invalid_argument("GridInterpolator: wrong parameter dimension");

    /* ---------- bracket every axis -------------------------------- */
    std::vector<Eigen::Index> lo(ndim), hi(ndim);
    std::vector<double>       a_hi(ndim);

    for (Eigen::Index d = 0; d < ndim; ++d) {
        const Vector& grid = axes_[d];
        const double  x    = p[d];

        if (x < grid[0] || x > grid[grid.size() - 1]) {
            std::ostringstream os;
            os << "parameter " << d << " = " << x << " outside grid ["
               << grid[0] << ", " << grid[grid.size() - 1] << "]";
            throw OutOfGridError(os.str());
        }
        if (grid.size() == 1) {                  // constant axis
            lo[d] = hi[d] = 0;
            a_hi[d] = 0.0;
            continue;
        }

        auto it = std::lower_bound(grid.data(), grid.data() + grid.size(), x);
        Eigen::Index h = static_cast<Eigen::Index>(it - grid.data());
        if (h == 0) h = 1;
        lo[d]   = h - 1;
        hi[d]   = h;
        a_hi[d] = (x - grid[lo[d]]) / (grid[hi[d]] - grid[lo[d]]);
    }

    /* ---------- weighted sum over the 2^N corners ----------------- */
    double out = 0.0;
    const unsigned ncorner = 1u << ndim;
    for (unsigned c = 0; c < ncorner; ++c) {
        double       w    = 1.0;
        Eigen::Index flat = 0;
        for (Eigen::Index d = 0; d < ndim; ++d) {
            const bool up = (c >> d) & 1u;
            w    *= up ? a_hi[d] : 1.0 - a_hi[d];
            flat += strides_[d] * (up ? hi[d] : lo[d]);
        }
        if (w == 0.0) continue;
        if (std::isnan(table_[flat]))
            throw OutOfGridError("grid corner not tabulated");
        out += w * table_[flat];
    }
    return out;
}

} // namespace starfit
