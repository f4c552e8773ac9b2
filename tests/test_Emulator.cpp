#include <gtest/gtest.h>
#include "starfit/Emulator.hpp"
#include "starfit/EmulatorCache.hpp"
#include "starfit/Errors.hpp"
#include "starfit/GridInterpolator.hpp"
#include "TestHelpers.hpp"

#include <cmath>

using namespace starfit;

class EmulatorTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() { emu = test::make_emulator(); }
        static void TearDownTestSuite() { emu.reset(); }
        static std::shared_ptr<const GPEmulator> emu;

        static Vector point(double t, double g) {
            Vector p(2);
            p << t, g;
            return p;
        }
};
std::shared_ptr<const GPEmulator> EmulatorTest::emu;

TEST_F(EmulatorTest, Dimensions) {
    EXPECT_EQ(emu->grid_dim(), 2);
    EXPECT_EQ(emu->ncomp(), 2);
    EXPECT_EQ(emu->ngrid(), 6);
    EXPECT_EQ(emu->basis().npix(), 2048);
    EXPECT_DOUBLE_EQ(emu->min_params()[0], 5000.0);
    EXPECT_DOUBLE_EQ(emu->max_params()[1], 4.5);
}

TEST_F(EmulatorTest, ReproducesTrainingWeights) {
    const EmulatorData d = test::make_emulator_data();
    for (int i = 0; i < d.grid_points.rows(); ++i) {
        const auto m = emu->interpolate(d.grid_points.row(i).transpose());
        for (int k = 0; k < 2; ++k)
            EXPECT_NEAR(m->mus[k], d.weights(i, k), 1e-4) << "grid point " << i;
        // the GP is pinned down at its training points
        EXPECT_LT(m->C_GP.diagonal().maxCoeff(), 1e-2 * d.amp[0]);
    }
}

TEST_F(EmulatorTest, CovarianceIsSymmetricAndBounded) {
    const auto m = emu->interpolate(point(5730.0, 4.13));
    ASSERT_EQ(m->C_GP.rows(), 2);
    EXPECT_TRUE(m->C_GP.isApprox(m->C_GP.transpose(), 0.0));
    for (int k = 0; k < 2; ++k) {
        EXPECT_GE(m->C_GP(k, k), -1e-12);
        EXPECT_LE(m->C_GP(k, k), 1e-4 + 1e-12);
    }
    // between the neighbouring training values 0 (5500 K) and 1 (6000 K)
    EXPECT_GT(m->mus[0], 0.0);
    EXPECT_LT(m->mus[0], 1.0);
}

TEST_F(EmulatorTest, OutOfGridThrows) {
    EXPECT_THROW(emu->interpolate(point(6100.0, 4.2)), OutOfGridError);
    EXPECT_THROW(emu->interpolate(point(5500.0, 3.9)), OutOfGridError);
    EXPECT_THROW(emu->interpolate(point(std::nan(""), 4.2)), OutOfGridError);
    EXPECT_THROW(emu->fbol(point(4900.0, 4.2)), OutOfGridError);
    EXPECT_THROW(emu->interpolate(Vector::Constant(3, 4.2)), std::invalid_argument);
}

TEST_F(EmulatorTest, OutOfGridIsAModelError) {
    try {
        emu->interpolate(point(7000.0, 4.2));
        FAIL() << "expected OutOfGridError";
    } catch (const ModelError& e) {
        EXPECT_NE(std::string(e.what()).find("temp"), std::string::npos);
    }
}

TEST_F(EmulatorTest, RepeatedQueriesHitTheCache) {
    const Vector p = point(5321.0, 4.31);
    const auto a = emu->interpolate(p);
    const auto b = emu->interpolate(p);
    EXPECT_EQ(a.get(), b.get());

    auto uncached = std::make_shared<const GPEmulator>(test::make_emulator_data(), 0);
    const auto c = uncached->interpolate(p);
    const auto d = uncached->interpolate(p);
    EXPECT_NE(c.get(), d.get());
    EXPECT_TRUE(c->mus.isApprox(a->mus));
    EXPECT_EQ(uncached->cache().size(), 0u);
}

TEST_F(EmulatorTest, BolometricFluxIsInterpolated) {
    // tabulated (t / 5500)^4, linear in between
    EXPECT_NEAR(emu->fbol(point(5500.0, 4.0)), 1.0, 1e-12);
    const double lo = std::pow(5000.0 / 5500.0, 4), hi = 1.0;
    EXPECT_NEAR(emu->fbol(point(5250.0, 4.2)), 0.5 * (lo + hi), 1e-12);
}

TEST_F(EmulatorTest, RejectsInconsistentInput) {
    EmulatorData d = test::make_emulator_data();
    d.weights.conservativeResize(5, 2);
    EXPECT_THROW(GPEmulator{d}, std::invalid_argument);

    d = test::make_emulator_data();
    d.lambda_xi = 0.0;
    EXPECT_THROW(GPEmulator{d}, std::invalid_argument);
}

/* ---------------------------------------------------------------- */

TEST(EmulatorCacheTest, EvictsLeastRecentlyUsed) {
    EmulatorCache cache(2);
    int calls = 0;
    auto make = [&] { ++calls; return EmulatorMatrix{Vector::Ones(1), Matrix::Identity(1, 1)}; };

    const Vector a = Vector::Constant(2, 1.0);
    const Vector b = Vector::Constant(2, 2.0);
    const Vector c = Vector::Constant(2, 3.0);

    cache.insert_if_absent(a, make);
    cache.insert_if_absent(b, make);
    EXPECT_EQ(calls, 2);
    EXPECT_NE(cache.try_get(a), nullptr);      // a is now most recent
    cache.insert_if_absent(c, make);           // evicts b
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.try_get(b), nullptr);
    EXPECT_NE(cache.try_get(a), nullptr);
    EXPECT_NE(cache.try_get(c), nullptr);

    cache.insert_if_absent(a, make);
    EXPECT_EQ(calls, 3);

    cache.set_capacity(1);
    EXPECT_EQ(cache.size(), 1u);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EmulatorCacheTest, SignedZeroHashesAlike) {
    Vector p(2), q(2);
    p << 0.0, 1.0;
    q << -0.0, 1.0;
    EXPECT_EQ(EmulatorCache::hash(p), EmulatorCache::hash(q));
}

/* ---------------------------------------------------------------- */

TEST(GridInterpolatorTest, MultilinearOnARegularGrid) {
    Matrix pts(4, 2);
    pts << 0, 0,
           1, 0,
           0, 2,
           1, 2;
    Vector v(4);
    v << 1, 2, 3, 5;
    GridInterpolator gi(pts, v);

    Vector p(2);
    p << 0.5, 1.0;
    EXPECT_NEAR(gi(p), 0.25 * (1 + 2 + 3 + 5), 1e-14);
    p << 1.0, 2.0;
    EXPECT_NEAR(gi(p), 5.0, 1e-14);
    p << 1.5, 1.0;
    EXPECT_THROW(gi(p), OutOfGridError);
}

TEST(GridInterpolatorTest, MissingCornerThrows) {
    Matrix pts(3, 2);
    pts << 0, 0,
           1, 0,
           0, 1;
    GridInterpolator gi(pts, Vector::Ones(3));

    Vector p(2);
    p << 0.0, 0.5;                  // only touches tabulated corners
    EXPECT_NEAR(gi(p), 1.0, 1e-14);
    p << 0.5, 0.5;
    EXPECT_THROW(gi(p), OutOfGridError);
}
