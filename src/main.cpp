#include "starfit/DataSpectrum.hpp"
#include "starfit/EmulatorIO.hpp"
#include "starfit/EnsembleSampler.hpp"
#include "starfit/JsonUtils.hpp"
#include "starfit/MultiOrderModel.hpp"
#include "starfit/RunConfig.hpp"
#include <cxxopts.hpp>
#include <Eigen/Core>
#include <omp.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;
using namespace starfit;

/* ball widths in the flat layout, built from the configured jumps */
static Vector jump_vector(const RunConfig& rc, const MultiOrderModel& model)
{
    std::vector<PhiParams> jumps;
    for (std::size_t i = 0; i < model.n_orders(); ++i) {
        PhiParams j = model.order_model(i).phi();
        j.cheb   = Vector::Constant(j.cheb.size(), rc.cheb_jump);
        j.sigAmp = rc.phi_jump.sigAmp;
        j.amp    = rc.phi_jump.amp;
        j.l      = rc.phi_jump.l;
        jumps.push_back(std::move(j));
    }
    return model.layout().encode(rc.theta_jump, jumps);
}

/* best sample of the chain as Theta + per-order Phi files */
static void write_best(const RunConfig& rc, MultiOrderModel& model,
                       const EnsembleSampler& sampler)
{
    Eigen::Index best = 0;
    sampler.lnprobs().maxCoeff(&best);
    const Vector flat = sampler.chain().row(best).transpose();

    const ParameterLayout& layout = model.layout();
    nlohmann::json j = layout.decode_theta(flat).to_json();
    j["lnprob"] = sampler.lnprobs()[best];
    save_json(j, (fs::path(rc.outdir) / "best_theta.json").string());

    for (std::size_t i = 0; i < model.n_orders(); ++i) {
        const OrderModel& om = model.order_model(i);
        const PhiParams phi = layout.decode_phi(flat, static_cast<int>(i));
        phi.save((fs::path(rc.outdir) / ("s" + std::to_string(om.spectrum_id()) + "_o" +
                                         std::to_string(om.order()) + "phi.json")).string());
    }
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("starfit", "Two-star spectral fitting with a Gaussian-process emulator");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("samples", "Number of sampler steps (overrides config)", cxxopts::value<int>())
            ("incremental-save", "Checkpoint the chain every N steps", cxxopts::value<int>())
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("debug", "Verbose per-order output")
            ("evaluate", "Print lnprob at the start point and exit")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("config")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        auto cfg_json = load_json(cli["config"].as<std::string>());
        expand_env(cfg_json);
        RunConfig rc = RunConfig::from_json(cfg_json);

        if (cli.count("samples"))          rc.samples = cli["samples"].as<int>();
        if (cli.count("incremental-save")) rc.incremental_save = cli["incremental-save"].as<int>();
        if (cli.count("debug"))            rc.debug = true;

        /* orders run side by side on the pool, OpenMP gets the rest */
        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
        nthreads = std::max(1, nthreads);

        const std::size_t n_orders = rc.data.size() * rc.orders.size();
        const int pool_threads = std::max(1, std::min(nthreads, static_cast<int>(n_orders)));
        const int omp_threads  = std::max(1, nthreads / pool_threads);
        omp_set_num_threads(omp_threads);
        Eigen::setNbThreads(omp_threads);

        /* ---------------- load everything once ------------------------ */
        auto emulator = load_emulator(rc.emulator, rc.emulator_cache);

        std::vector<DataSpectrumPtr> spectra;
        for (const auto& path : rc.data)
            spectra.push_back(std::make_shared<const DataSpectrum>(load_data_spectrum(path)));

        std::vector<OrderSetup> setups;
        for (int s = 0; s < static_cast<int>(spectra.size()); ++s)
            for (int order : rc.orders)
                setups.push_back({s, order, rc.load_phi(s, order)});

        OrderModelOptions mo;
        mo.npoly           = rc.cheb_degree;
        mo.fix_c0          = rc.fix_c0;
        mo.buffer_kms      = rc.buffer_kms;
        mo.diagnostics_dir = rc.diagnostics_dir;
        mo.debug           = rc.debug;
        mo.omp_threads     = omp_threads;

        MultiOrderModel model(emulator, spectra, setups, mo,
                              static_cast<unsigned>(pool_threads));
        model.initialize(rc.theta);

        const Vector p0   = model.current_vector();
        const double lnp0 = model.log_probability(p0);
        std::cout << "[Fit] lnprob at the start point: " << lnp0 << '\n';
        if (cli.count("evaluate")) return 0;

        if (rc.samples <= 0)
            throw std::runtime_error("No samples requested (config 'samples' or --samples)");

        /* ---------------- sample ------------------------------------- */
        SamplerOptions so;
        so.walkers          = rc.walkers;
        so.seed             = rc.seed;
        so.incremental_save = rc.incremental_save;
        so.outdir           = rc.outdir;
        so.names            = model.layout().names(emulator->param_names());

        EnsembleSampler sampler(model.layout().size(),
                                [&model](const Vector& p) { return model.log_probability(p); },
                                so);
        const Matrix ball = sampler.sample_ball(p0, jump_vector(rc, model));

        std::cout << "[Fit] " << sampler.walkers() << " walkers, " << rc.samples
                  << " steps\n";
        sampler.run(ball, rc.samples);

        fs::create_directories(rc.outdir);
        sampler.write_chain((fs::path(rc.outdir) / "chain.txt").string());
        write_best(rc, model, sampler);

        std::cout << "[Fit] acceptance fraction " << sampler.acceptance_fraction() << '\n'
                  << "\nSampling completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int hours = duration / 3600;
    int minutes = (duration % 3600) / 60;
    int seconds = duration % 60;

    std::cout << "\nTook: ";
    if (hours > 0) std::cout << hours << "h ";
    if (minutes > 0 || hours > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}
