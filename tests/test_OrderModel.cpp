#include <gtest/gtest.h>
#include "starfit/Covariance.hpp"
#include "starfit/Errors.hpp"
#include "starfit/OrderModel.hpp"
#include "TestHelpers.hpp"

#include <cmath>
#include <filesystem>
#include <limits>

using namespace starfit;
namespace fs = std::filesystem;

static const double kNegInf = -std::numeric_limits<double>::infinity();

/*
 * The data of this fixture are the model itself at the true parameters,
 * so the residual vanishes at the truth.
 */
class OrderModelTest : public ::testing::Test {
    protected:
        static void SetUpTestSuite() {
            emu = test::make_emulator();

            auto flat = test::make_data();
            OrderModel seed(emu, flat, 0, 23, test::quiet_options());
            seed.initialize(test::truth_theta(), test::truth_phi());

            auto noiseless = std::make_shared<DataSpectrum>(*flat);
            noiseless->orders[0].fl = seed.mean_model();
            data = noiseless;
        }
        static void TearDownTestSuite() { emu.reset(); data.reset(); }

        void SetUp() override {
            model = std::make_unique<OrderModel>(emu, data, 0, 23, test::quiet_options());
            model->initialize(theta, phi);
        }

        static std::shared_ptr<const GPEmulator> emu;
        static DataSpectrumPtr                   data;

        ThetaParams theta = test::truth_theta();
        PhiParams   phi   = test::truth_phi();
        std::unique_ptr<OrderModel> model;
};
std::shared_ptr<const GPEmulator> OrderModelTest::emu;
DataSpectrumPtr                   OrderModelTest::data;

TEST_F(OrderModelTest, UpdatesBeforeInitializeAreProgrammerErrors) {
    OrderModel fresh(emu, data, 0, 23, test::quiet_options());
    EXPECT_EQ(fresh.state(), OrderModel::State::Uninitialized);
    EXPECT_THROW(fresh.update_theta(theta), std::logic_error);
    EXPECT_THROW(fresh.update_phi(phi), std::logic_error);
    EXPECT_THROW(fresh.log_probability(theta, phi), std::logic_error);
    EXPECT_THROW(fresh.evaluate_current(), std::logic_error);
    EXPECT_EQ(model->state(), OrderModel::State::Ready);
}

TEST_F(OrderModelTest, ModelLivesOnTheDataGrid) {
    EXPECT_EQ(model->data().npix(), 50);
    EXPECT_EQ(model->mean_model().size(), 50);
    for (const auto& c : model->derived().stars) {
        EXPECT_EQ(c.flux_mean.size(), 50);
        EXPECT_EQ(c.eigenspectra.rows(), 2);
        EXPECT_EQ(c.eigenspectra.cols(), 50);
        EXPECT_NEAR(c.Omega, 0.5, 1e-12);
    }
    EXPECT_NEAR(model->residuals().cwiseAbs().maxCoeff(), 0.0, 1e-12);
}

TEST_F(OrderModelTest, LuminosityRatio) {
    // fbol = (t / 5500)^4 on the grid, linear in between
    const double f6000 = std::pow(6000.0 / 5500.0, 4);
    EXPECT_NEAR(model->derived().qq, 1.0 + 0.6 * (f6000 - 1.0), 1e-12);
}

TEST_F(OrderModelTest, NegativeVsiniAlwaysRejects) {
    for (int s = 0; s < 2; ++s) {
        ThetaParams bad = theta;
        bad.stars[s].vsini = -0.1;
        EXPECT_EQ(model->update_theta(bad), StepStatus::Rejected);
        EXPECT_EQ(model->log_probability(bad, phi), kNegInf);

        // whatever else the proposal contains
        bad.stars[1 - s].grid[0] = 9999.0;
        bad.stars[1 - s].vz      = 1e6;
        EXPECT_EQ(model->log_probability(bad, phi), kNegInf);
    }
}

TEST_F(OrderModelTest, DomainFailuresReject) {
    ThetaParams out_of_grid = theta;
    out_of_grid.stars[1].grid[0] = 6500.0;
    EXPECT_EQ(model->log_probability(out_of_grid, phi), kNegInf);

    ThetaParams too_fast = theta;
    too_fast.stars[0].vz = 2000.0;          // data no longer covered by the shifted grid
    EXPECT_EQ(model->log_probability(too_fast, phi), kNegInf);

    ThetaParams nan_theta = theta;
    nan_theta.stars[0].logOmega = std::nan("");
    EXPECT_EQ(model->log_probability(nan_theta, phi), kNegInf);
}

TEST_F(OrderModelTest, SecondStarFailuresRejectAndKeepState) {
    const double before = model->lnprob();
    const Vector mean   = model->mean_model();

    ThetaParams bad = theta;
    bad.stars[1].grid[1] = 3.5;                 // logg below the grid
    EXPECT_EQ(model->update_theta(bad), StepStatus::Rejected);

    bad = theta;
    bad.stars[1].vz = -2000.0;                  // data off the shifted grid
    EXPECT_EQ(model->update_theta(bad), StepStatus::Rejected);

    bad = theta;
    bad.stars[1].vz = c_kms;
    EXPECT_EQ(model->update_theta(bad), StepStatus::Rejected);

    EXPECT_EQ(model->lnprob(), before);
    EXPECT_TRUE(model->mean_model() == mean);
    EXPECT_EQ(model->evaluate_current(), before);
}

TEST_F(OrderModelTest, WrongGridDimensionIsProgrammerError) {
    ThetaParams bad = theta;
    bad.stars[0].grid = Vector::Constant(3, 1.0);
    EXPECT_THROW(model->update_theta(bad), std::invalid_argument);
}

TEST_F(OrderModelTest, SoftPriorBoundaryRejectsWithoutThrowing) {
    PhiParams p = phi;
    p.sigAmp = 0.0;
    EXPECT_EQ(model->update_phi(p), StepStatus::Rejected);
    EXPECT_EQ(model->log_probability(theta, p), kNegInf);

    p = phi;
    p.amp = -0.01;
    EXPECT_EQ(model->log_probability(theta, p), kNegInf);

    p = phi;
    p.l = 0.0;
    EXPECT_EQ(model->log_probability(theta, p), kNegInf);

    p = phi;
    p.amp = 0.0;                            // diagonal-only noise is fine
    EXPECT_TRUE(std::isfinite(model->log_probability(theta, p)));
}

TEST_F(OrderModelTest, Deterministic) {
    const double a = model->log_probability(theta, phi);

    ThetaParams other = theta;
    other.stars[0].vz    += 3.0;
    other.stars[1].vsini += 4.0;
    PhiParams other_phi = phi;
    other_phi.amp = 0.005;
    const double b = model->log_probability(other, other_phi);
    EXPECT_TRUE(std::isfinite(b));

    const double c = model->log_probability(theta, phi);
    EXPECT_DOUBLE_EQ(a, c);
    EXPECT_DOUBLE_EQ(model->log_probability(other, other_phi), b);
}

TEST_F(OrderModelTest, RejectionKeepsThePreviousState) {
    ThetaParams a = theta;
    a.stars[0].vz += 2.0;
    const double lnp_a = model->log_probability(a, phi);
    const Vector mean_a = model->mean_model();

    ThetaParams bad = theta;
    bad.stars[1].vsini = -3.0;
    EXPECT_EQ(model->log_probability(bad, phi), kNegInf);

    PhiParams bad_phi = phi;
    bad_phi.sigAmp = -1.0;
    EXPECT_EQ(model->log_probability(a, bad_phi), kNegInf);

    EXPECT_DOUBLE_EQ(model->lnprob(), lnp_a);
    EXPECT_DOUBLE_EQ(model->evaluate_current(), lnp_a);
    EXPECT_DOUBLE_EQ(model->theta().stars[0].vz, a.stars[0].vz);
    EXPECT_TRUE(model->mean_model() == mean_a);

    // the next accepted step behaves as if the rejections never happened
    ThetaParams next = theta;
    next.stars[1].vz += 1.0;
    const double lnp_next = model->log_probability(next, phi);

    OrderModel clean(emu, data, 0, 23, test::quiet_options());
    clean.initialize(a, phi);
    EXPECT_DOUBLE_EQ(clean.log_probability(next, phi), lnp_next);
}

TEST_F(OrderModelTest, RevertRestoresTheLastAcceptedState) {
    const double lnp0 = model->log_probability(theta, phi);

    ThetaParams b = theta;
    b.stars[0].vsini = 25.0;
    PhiParams b_phi = phi;
    b_phi.cheb[0] = 0.03;
    const double lnp_b = model->log_probability(b, b_phi);
    EXPECT_NE(lnp_b, lnp0);

    ASSERT_TRUE(model->can_revert());
    model->revert();
    EXPECT_DOUBLE_EQ(model->lnprob(), lnp0);
    EXPECT_DOUBLE_EQ(model->evaluate_current(), lnp0);
    EXPECT_DOUBLE_EQ(model->theta().stars[0].vsini, theta.stars[0].vsini);
    EXPECT_DOUBLE_EQ(model->phi().cheb[0], phi.cheb[0]);

    EXPECT_FALSE(model->can_revert());
    EXPECT_THROW(model->revert(), std::logic_error);
}

TEST_F(OrderModelTest, SingleGroupUpdates) {
    const double full = model->log_probability(theta, phi);

    PhiParams p = phi;
    p.amp = 0.002;
    const double lnp_phi = model->log_probability_phi(p);
    EXPECT_DOUBLE_EQ(model->theta().stars[0].vz, theta.stars[0].vz);
    EXPECT_DOUBLE_EQ(model->phi().amp, 0.002);

    model->revert();
    EXPECT_DOUBLE_EQ(model->evaluate_current(), full);

    ThetaParams t = theta;
    t.stars[1].vz += 4.0;
    const double lnp_theta = model->log_probability_theta(t);
    EXPECT_DOUBLE_EQ(model->phi().amp, phi.amp);

    OrderModel other(emu, data, 0, 23, test::quiet_options());
    other.initialize(theta, p);
    EXPECT_DOUBLE_EQ(other.evaluate_current(), lnp_phi);
    other.initialize(t, phi);
    EXPECT_DOUBLE_EQ(other.evaluate_current(), lnp_theta);
}

TEST_F(OrderModelTest, PhiFileRoundTrip) {
    PhiParams p = phi;
    p.amp     = 0.004;
    p.l       = 18.25;
    p.sigAmp  = 1.0 / 3.0;
    p.cheb[1] = -0.0123456789012345;
    p.regions = { CovRegion{-4.5, 5025.1, 12.0} };

    const double lnp = model->log_probability(theta, p);
    const Matrix data_mat = model->covariance().data_mat;
    const Vector k        = model->covariance().k;

    const fs::path path = fs::temp_directory_path() / "starfit_phi_roundtrip.json";
    p.save(path.string());
    const PhiParams loaded = PhiParams::load(path.string());
    fs::remove(path);

    EXPECT_EQ(loaded.spectrum_id, p.spectrum_id);
    EXPECT_EQ(loaded.order, p.order);
    EXPECT_EQ(loaded.regions.size(), 1u);

    OrderModel reloaded(emu, data, 0, 23, test::quiet_options());
    reloaded.initialize(theta, loaded);
    EXPECT_TRUE(reloaded.covariance().data_mat == data_mat);
    EXPECT_TRUE(reloaded.covariance().k == k);
    EXPECT_EQ(reloaded.lnprob(), lnp);
}

TEST_F(OrderModelTest, CovarianceRegionsAreNotSampled) {
    PhiParams p = phi;
    p.amp     = 0.004;
    p.l       = 1.0;
    p.regions = { CovRegion{-3.0, 5025.0, 50.0} };

    ASSERT_TRUE(std::isfinite(model->log_probability(theta, p)));
    const CovarianceState& cov = model->covariance();
    EXPECT_TRUE(cov.phi.regions.empty());

    const Vector& wl = model->data().wl;
    for (Eigen::Index i = 0; i < wl.size(); ++i)
        for (Eigen::Index j = 0; j < wl.size(); ++j)
            if (velocity_distance(wl[i], wl[j]) > 6.0 * p.l)
                EXPECT_EQ(cov.data_mat(i, j), 0.0) << i << ", " << j;

    // identical to the same Phi without regions
    PhiParams plain = p;
    plain.regions.clear();
    OrderModel other(emu, data, 0, 23, test::quiet_options());
    other.initialize(theta, plain);
    EXPECT_TRUE(other.covariance().data_mat == cov.data_mat);
    EXPECT_EQ(other.lnprob(), model->lnprob());
}

TEST_F(OrderModelTest, TruthBeatsPerturbations) {
    const double truth = model->log_probability(theta, phi);
    ASSERT_TRUE(std::isfinite(truth));

    std::vector<std::pair<std::string, ThetaParams>> thetas;
    auto add = [&](const std::string& name, auto&& edit) {
        ThetaParams t = theta;
        edit(t);
        thetas.emplace_back(name, t);
    };
    add("vz1 +10",       [](ThetaParams& t) { t.stars[0].vz += 10.0; });
    add("vz1 -10",       [](ThetaParams& t) { t.stars[0].vz -= 10.0; });
    add("vz2 +10",       [](ThetaParams& t) { t.stars[1].vz += 10.0; });
    add("vsini1 40",     [](ThetaParams& t) { t.stars[0].vsini = 40.0; });
    add("vsini2 50",     [](ThetaParams& t) { t.stars[1].vsini = 50.0; });
    add("logOmega1",     [](ThetaParams& t) { t.stars[0].logOmega += 0.05; });
    add("logOmega2",     [](ThetaParams& t) { t.stars[1].logOmega -= 0.05; });
    add("temp1 5900",    [](ThetaParams& t) { t.stars[0].grid[0] = 5900.0; });

    for (const auto& [name, t] : thetas) {
        const double lnp = model->log_probability(t, phi);
        EXPECT_LT(lnp, truth - 4.5) << name;
    }

    std::vector<std::pair<std::string, PhiParams>> phis;
    PhiParams p = phi;
    p.cheb[0] += 0.05;
    phis.emplace_back("c1", p);
    p = phi;
    p.cheb[2] -= 0.05;
    phis.emplace_back("c3", p);
    p = phi;
    p.sigAmp = 2.0;
    phis.emplace_back("sigAmp", p);

    for (const auto& [name, q] : phis) {
        const double lnp = model->log_probability(theta, q);
        EXPECT_LT(lnp, truth - 4.5) << name;
    }

    EXPECT_DOUBLE_EQ(model->log_probability(theta, phi), truth);
}

TEST_F(OrderModelTest, MaskedPixelsAreDropped) {
    auto masked = std::make_shared<DataSpectrum>(*data);
    auto& mask = masked->orders[0].mask;
    for (std::size_t i = 0; i < mask.size(); i += 5) mask[i] = 0;

    OrderModel m(emu, masked, 0, 23, test::quiet_options());
    EXPECT_EQ(m.data().npix(), 40);
    m.initialize(theta, phi);
    EXPECT_EQ(m.mean_model().size(), 40);
    EXPECT_TRUE(std::isfinite(m.lnprob()));
}

TEST_F(OrderModelTest, UnknownOrderIsRejectedAtConstruction) {
    EXPECT_THROW(OrderModel(emu, data, 0, 99, test::quiet_options()), std::invalid_argument);
}
