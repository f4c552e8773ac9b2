#pragma once
#include "Types.hpp"
#include "Parameters.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace starfit {

/* widths of the Phi block used for the initial walker ball */
struct PhiJump {
    double sigAmp = 0.01;
    double amp    = 0.001;
    double l      = 0.5;
};

struct RunConfig {
    std::string              emulator;
    std::vector<std::string> data;
    std::vector<int>         orders;
    int                      cheb_degree = 4;   // number of Chebyshev terms
    bool                     fix_c0      = true;
    std::string              phi_dir;           // s<id>_o<order>phi.json live here
    double                   buffer_kms  = 300.0;

    ThetaParams              theta;             // start point
    ThetaParams              theta_jump;        // ball widths
    PhiJump                  phi_jump;
    double                   cheb_jump   = 0.005;

    int                      walkers     = 0;
    std::uint64_t            seed        = 42;
    int                      samples     = 0;
    int                      incremental_save = 0;
    std::string              outdir      = "output";
    std::string              diagnostics_dir;   // default <outdir>/diagnostics
    std::size_t              emulator_cache = 256;
    bool                     debug       = false;

    static RunConfig from_json(const nlohmann::json& j);

    /* phi file of one order: <phi_dir>/s<id>_o<order>phi.json */
    std::string phi_path(int spectrum_id, int order) const;

    /* stored Phi, or a white-noise default if no file exists */
    PhiParams load_phi(int spectrum_id, int order) const;
};

} // namespace starfit
