#include <gtest/gtest.h>
#include "starfit/DataSpectrum.hpp"
#include "starfit/JsonUtils.hpp"
#include "starfit/RunConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace starfit;
namespace fs = std::filesystem;

class DataSpectrumTest : public ::testing::Test {
    protected:
        void SetUp() override {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            dir = fs::temp_directory_path() / (std::string("starfit_data_") + info->name());
            fs::create_directories(dir);
        }
        void TearDown() override { fs::remove_all(dir); }

        fs::path write(const std::string& name, const std::string& text) {
            const fs::path p = dir / name;
            std::ofstream(p) << text;
            return p;
        }

        fs::path dir;
};

TEST_F(DataSpectrumTest, LoadAsciiGroupsOrders) {
    const auto p = write("obs.txt",
        "# order wl fl sigma mask\n"
        "23 5001.0 1.00 0.01 1\n"
        "23 5000.5 0.90 0.01 1\n"
        "\n"
        "24 5100.0 0.80 0.02 0\n"
        "24 5100.5 0.85 0.02 1\n"
        "23 5001.5 0.95 0.01 0\n");

    const DataSpectrum ds = load_data_spectrum(p.string());
    EXPECT_EQ(ds.name, "obs");
    ASSERT_EQ(ds.orders.size(), 2u);

    const OrderSpectrum& o23 = ds.by_order(23);
    ASSERT_EQ(o23.npix(), 3);
    EXPECT_DOUBLE_EQ(o23.wl[0], 5000.5);      // sorted by wavelength
    EXPECT_DOUBLE_EQ(o23.fl[0], 0.90);
    EXPECT_EQ(o23.n_used(), 2);

    const OrderSpectrum m = o23.masked();
    ASSERT_EQ(m.npix(), 2);
    EXPECT_DOUBLE_EQ(m.wl[1], 5001.0);

    EXPECT_EQ(ds.index_of(24), 1u);
    EXPECT_THROW(ds.by_order(25), std::invalid_argument);
}

TEST_F(DataSpectrumTest, BadFilesAreErrors) {
    EXPECT_THROW(load_data_spectrum((dir / "missing.txt").string()), std::runtime_error);
    EXPECT_THROW(load_data_ascii(write("empty.txt", "# nothing\n").string()), std::runtime_error);
    EXPECT_THROW(load_data_ascii(write("dup.txt", "1 5000 1 0.1 1\n1 5000 1 0.1 1\n").string()),
                 std::runtime_error);
    EXPECT_THROW(load_data_ascii(write("sig.txt", "1 5000 1 0.0 1\n1 5001 1 0.1 1\n").string()),
                 std::runtime_error);
    // zero sigma on a masked pixel is fine
    EXPECT_NO_THROW(load_data_ascii(write("ok.txt", "1 5000 1 0.0 0\n1 5001 1 0.1 1\n").string()));
}

TEST_F(DataSpectrumTest, MaskLengthMismatch) {
    OrderSpectrum o;
    o.wl = Vector::LinSpaced(4, 1.0, 4.0);
    o.fl = o.sigma = Vector::Ones(4);
    o.mask = {1, 1};
    EXPECT_THROW(o.masked(), std::invalid_argument);
}

/* ---------------------------------------------------------------- */

TEST(JsonUtilsTest, ExpandsEnvironmentVariables) {
    setenv("STARFIT_TEST_DIR", "/data/run1", 1);
    nlohmann::json j = { {"emulator", "${STARFIT_TEST_DIR}/emu.fits"},
                         {"data", {"${STARFIT_TEST_DIR}/a.fits", "b.fits"}},
                         {"walkers", 40} };
    expand_env(j);
    EXPECT_EQ(j["emulator"], "/data/run1/emu.fits");
    EXPECT_EQ(j["data"][0], "/data/run1/a.fits");
    EXPECT_EQ(j["data"][1], "b.fits");
    EXPECT_EQ(j["walkers"], 40);
}

TEST(JsonUtilsTest, MissingFileThrows) {
    EXPECT_THROW(load_json("/nonexistent/starfit.json"), std::runtime_error);
}

/* ---------------------------------------------------------------- */

static nlohmann::json minimal_config()
{
    const nlohmann::json star = { {"grid", {5500.0, 4.3}}, {"vz", 0.0},
                                  {"vsini", 5.0}, {"logOmega", 0.0} };
    return { {"emulator", "emu.fits"}, {"data", {"obs.fits"}}, {"orders", {22, 23}},
             {"Theta", {{"star1", star}, {"star2", star}}},
             {"Theta_jump", {{"star1", star}, {"star2", star}}} };
}

TEST(RunConfigTest, DefaultsAndOverrides) {
    nlohmann::json j = minimal_config();
    j["outdir"] = "/tmp/run";
    j["Phi_jump"] = { {"l", 2.0} };

    const RunConfig rc = RunConfig::from_json(j);
    EXPECT_EQ(rc.orders.size(), 2u);
    EXPECT_EQ(rc.cheb_degree, 4);
    EXPECT_TRUE(rc.fix_c0);
    EXPECT_DOUBLE_EQ(rc.buffer_kms, 300.0);
    EXPECT_DOUBLE_EQ(rc.phi_jump.l, 2.0);
    EXPECT_DOUBLE_EQ(rc.phi_jump.sigAmp, 0.01);
    EXPECT_EQ(rc.diagnostics_dir, "/tmp/run/diagnostics");
    EXPECT_DOUBLE_EQ(rc.theta.stars[1].vsini, 5.0);
}

TEST(RunConfigTest, MissingKeysAreReported) {
    nlohmann::json j = minimal_config();
    j.erase("Theta");
    EXPECT_THROW(RunConfig::from_json(j), std::runtime_error);

    j = minimal_config();
    j["orders"] = nlohmann::json::array();
    EXPECT_THROW(RunConfig::from_json(j), std::runtime_error);
}

TEST(RunConfigTest, PhiFallsBackToWhiteNoise) {
    nlohmann::json j = minimal_config();
    j["phi_dir"] = "/nonexistent";
    const RunConfig rc = RunConfig::from_json(j);

    EXPECT_EQ(rc.phi_path(0, 23), "/nonexistent/s0_o23phi.json");
    const PhiParams phi = rc.load_phi(0, 23);
    EXPECT_EQ(phi.order, 23);
    EXPECT_EQ(phi.cheb.size(), 3);
    EXPECT_TRUE(phi.cheb.isZero());
    EXPECT_DOUBLE_EQ(phi.sigAmp, 1.0);
    EXPECT_DOUBLE_EQ(phi.amp, 0.0);
}

TEST_F(DataSpectrumTest, StoredPhiIsPickedUp) {
    PhiParams stored;
    stored.order  = 22;
    stored.cheb   = Vector::Constant(3, 0.01);
    stored.sigAmp = 1.3;
    stored.amp    = 0.02;
    stored.l      = 15.0;
    stored.save((dir / "s0_o22phi.json").string());

    nlohmann::json j = minimal_config();
    j["phi_dir"] = dir.string();
    const PhiParams phi = RunConfig::from_json(j).load_phi(0, 22);
    EXPECT_DOUBLE_EQ(phi.sigAmp, 1.3);
    EXPECT_DOUBLE_EQ(phi.l, 15.0);
    EXPECT_EQ(phi.cheb, stored.cheb);
}
