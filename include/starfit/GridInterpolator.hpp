#pragma once
#include "Types.hpp"
#include <vector>

namespace starfit {

/*
 * Multilinear interpolation of a scalar tabulated on a regular grid.
 * The grid is given as a list of points (ngrid x N); the axes are the
 * sorted unique coordinates along each dimension.  Combinations that
 * are not tabulated stay NaN and may not be touched by a query.
 */
class GridInterpolator {
public:
    GridInterpolator(const Matrix& points, const Vector& values);

    double operator()(const Vector& p) const;

    const std::vector<Vector>& axes() const { return axes_; }

private:
    std::vector<Vector>       axes_;
    std::vector<Eigen::Index> strides_;
    Vector                    table_;
};

} // namespace starfit
