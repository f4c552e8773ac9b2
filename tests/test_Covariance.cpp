#include <gtest/gtest.h>
#include "starfit/ChebyshevCalibration.hpp"
#include "starfit/Covariance.hpp"

#include <cmath>

using namespace starfit;

class CovarianceTest : public ::testing::Test {
    protected:
        void SetUp() override {
            wl = Vector::LinSpaced(300, 5000.0, 5030.0);   // ~6 km/s per pixel
            phi.amp    = 0.3;
            phi.l      = 15.0;
            phi.sigAmp = 1.2;
        }
        Vector    wl;
        PhiParams phi;
};

TEST_F(CovarianceTest, NothingBeyondSixLengths) {
    const Matrix C = get_dense_C(wl, make_k_func(phi), 6.0 * phi.l);
    int checked = 0;
    for (Eigen::Index i = 0; i < wl.size(); ++i)
        for (Eigen::Index j = 0; j < wl.size(); ++j)
            if (velocity_distance(wl[i], wl[j]) >= 6.0 * phi.l) {
                EXPECT_EQ(C(i, j), 0.0);
                ++checked;
            }
    EXPECT_GT(checked, 0);
}

TEST_F(CovarianceTest, KernelShape) {
    const KernelFunc k = make_k_func(phi);
    EXPECT_DOUBLE_EQ(k(5010.0, 5010.0), phi.amp * phi.amp);

    // monotonically decreasing with separation
    double last = k(5010.0, 5010.0);
    for (double d = 0.01; d < 1.5; d += 0.05) {
        const double v = k(5010.0, 5010.0 + d);
        EXPECT_LE(v, last);
        EXPECT_GE(v, 0.0);
        last = v;
    }
    EXPECT_EQ(k(5010.0, 5011.6), 0.0);       // ~96 km/s > 90 km/s
}

TEST_F(CovarianceTest, DenseMatrixIsSymmetric) {
    const Matrix C = get_dense_C(wl, make_k_func(phi), 6.0 * phi.l);
    EXPECT_TRUE(C.isApprox(C.transpose(), 0.0));
    EXPECT_NEAR(C(10, 10), phi.amp * phi.amp, 1e-15);
}

TEST_F(CovarianceTest, UnsortedWavelengthsRejected) {
    Vector bad = wl;
    std::swap(bad[3], bad[4]);
    EXPECT_THROW(get_dense_C(bad, make_k_func(phi), 90.0), std::invalid_argument);
}

TEST_F(CovarianceTest, RegionKernelIsLocal) {
    CovRegion reg;
    reg.logAmp = -2.0;
    reg.mu     = 5015.0;
    reg.sigma  = 10.0;          // km/s, 4 sigma = 0.67 AA
    const Matrix C = get_region_C(wl, {reg});

    const double reach = 4.0 * reg.sigma * reg.mu / c_kms;
    for (Eigen::Index i = 0; i < wl.size(); ++i)
        for (Eigen::Index j = 0; j < wl.size(); ++j) {
            if (std::abs(wl[i] - reg.mu) > reach || std::abs(wl[j] - reg.mu) > reach)
                EXPECT_EQ(C(i, j), 0.0);
        }
    EXPECT_TRUE(C.isApprox(C.transpose()));

    Eigen::Index centre = 0;
    (wl.array() - reg.mu).abs().minCoeff(&centre);
    EXPECT_GT(C(centre, centre), 0.9 * std::pow(10.0, reg.logAmp));

    reg.sigma = 0.0;
    EXPECT_THROW(get_region_C(wl, {reg}), std::invalid_argument);
}

TEST_F(CovarianceTest, DataCovarianceWithoutGP) {
    const Vector sigma = Vector::LinSpaced(wl.size(), 0.01, 0.02);
    phi.amp = 0.0;
    const Matrix C = build_data_covariance(wl, sigma, phi);

    Matrix expect = Matrix::Zero(wl.size(), wl.size());
    expect.diagonal() = (phi.sigAmp * sigma.array()).square().matrix();
    EXPECT_TRUE(C.isApprox(expect, 1e-14));
}

TEST_F(CovarianceTest, DataCovarianceAddsAllTerms) {
    const Vector sigma = Vector::Constant(wl.size(), 0.02);
    CovRegion reg{-3.0, 5020.0, 20.0};
    phi.regions = {reg};

    const Matrix C = build_data_covariance(wl, sigma, phi);
    Matrix expect = get_dense_C(wl, make_k_func(phi), 6.0 * phi.l)
                  + get_region_C(wl, phi.regions);
    expect.diagonal().array() += phi.sigAmp * phi.sigAmp * 0.02 * 0.02;
    EXPECT_TRUE(C.isApprox(expect, 1e-14));
}

/* ---------------------------------------------------------------- */

TEST(ChebyshevTest, FixedC0WithZeroCoefficientsIsOne) {
    ChebyshevCalibration cheb(40, 4, true);
    EXPECT_EQ(cheb.nfree(), 3);
    const Vector k = cheb.evaluate(Vector::Zero(3));
    EXPECT_TRUE(k.isApprox(Vector::Ones(40)));
}

TEST(ChebyshevTest, PolynomialValuesAtTheEdges) {
    ChebyshevCalibration cheb(11, 4, false);
    Vector c(4);
    c << 1.0, 0.1, 0.2, 0.3;
    const Vector k = cheb.evaluate(c);
    // T_i(1) = 1, T_i(-1) = (-1)^i, T_i(0) = 1, 0, -1, 0
    EXPECT_NEAR(k[10], 1.6, 1e-14);
    EXPECT_NEAR(k[0], 1.0 - 0.1 + 0.2 - 0.3, 1e-14);
    EXPECT_NEAR(k[5], 1.0 - 0.2, 1e-14);
}

TEST(ChebyshevTest, WrongCoefficientCountThrows) {
    ChebyshevCalibration cheb(20, 4, true);
    EXPECT_THROW(cheb.evaluate(Vector::Zero(4)), std::invalid_argument);
    EXPECT_THROW(ChebyshevCalibration(20, 0, true), std::invalid_argument);
}
