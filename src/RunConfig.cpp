#include "starfit/RunConfig.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace starfit {

RunConfig RunConfig::from_json(const nlohmann::json& j)
{
    RunConfig c;
    try {
        c.emulator = j.at("emulator").get<std::string>();
        c.data     = j.at("data").get<std::vector<std::string>>();
        c.orders   = j.at("orders").get<std::vector<int>>();
        c.theta    = ThetaParams::from_json(j.at("Theta"));
        c.theta_jump = ThetaParams::from_json(j.at("Theta_jump"));

        c.cheb_degree = j.value("cheb_degree", c.cheb_degree);
        c.fix_c0      = j.value("fix_c0", c.fix_c0);
        c.phi_dir     = j.value("phi_dir", c.phi_dir);
        c.buffer_kms  = j.value("buffer_kms", c.buffer_kms);
        c.cheb_jump   = j.value("cheb_jump", c.cheb_jump);

        if (j.contains("Phi_jump")) {
            const auto& pj = j.at("Phi_jump");
            c.phi_jump.sigAmp = pj.value("sigAmp", c.phi_jump.sigAmp);
            c.phi_jump.amp    = pj.value("amp", c.phi_jump.amp);
            c.phi_jump.l      = pj.value("l", c.phi_jump.l);
        }

        c.walkers          = j.value("walkers", c.walkers);
        c.seed             = j.value("seed", c.seed);
        c.samples          = j.value("samples", c.samples);
        c.incremental_save = j.value("incremental_save", c.incremental_save);
        c.outdir           = j.value("outdir", c.outdir);
        c.diagnostics_dir  = j.value("diagnostics_dir", (fs::path(c.outdir) / "diagnostics").string());
        c.emulator_cache   = j.value("emulator_cache", c.emulator_cache);
        c.debug            = j.value("debug", c.debug);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
    }

    if (c.data.empty())
        throw std::runtime_error("Invalid configuration: no data files");
    if (c.orders.empty())
        throw std::runtime_error("Invalid configuration: no orders");
    if (c.cheb_degree < 1)
        throw std::runtime_error("Invalid configuration: cheb_degree must be at least 1");
    return c;
}

std::string RunConfig::phi_path(int spectrum_id, int order) const
{
    const std::string name = "s" + std::to_string(spectrum_id) + "_o" +
                             std::to_string(order) + "phi.json";
    return (fs::path(phi_dir) / name).string();
}

PhiParams RunConfig::load_phi(int spectrum_id, int order) const
{
    const std::string path = phi_path(spectrum_id, order);
    if (fs::exists(path)) {
        PhiParams phi = PhiParams::load(path);
        if (phi.fix_c0 != fix_c0)
            throw std::runtime_error("'" + path + "': fix_c0 differs from the configuration");
        if (!phi.regions.empty())
            std::cerr << "[Config] warning: " << path << ": " << phi.regions.size()
                      << " covariance regions are ignored while sampling\n";
        return phi;
    }

    std::cerr << "[Config] warning: " << path << " not found, starting from white noise\n";
    PhiParams phi;
    phi.spectrum_id = spectrum_id;
    phi.order       = order;
    phi.fix_c0      = fix_c0;
    phi.cheb        = Vector::Zero(fix_c0 ? cheb_degree - 1 : cheb_degree);
    if (!fix_c0) phi.cheb[0] = 1.0;
    return phi;
}

} // namespace starfit
