#include "starfit/EnsembleSampler.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace fs = std::filesystem;

namespace starfit {

EnsembleSampler::EnsembleSampler(int ndim, LogProb lnprob, SamplerOptions opts)
    : ndim_(ndim)
    , lnprob_(std::move(lnprob))
    , opts_(std::move(opts))
    , nwalkers_(opts_.walkers > 0 ? opts_.walkers : 2 * ndim)
    , rng_(opts_.seed)
{
    if (ndim_ <= 0)
        throw std::invalid_argument("EnsembleSampler: ndim must be positive");
    if (nwalkers_ < 2)
        throw std::invalid_argument("EnsembleSampler: need at least two walkers");
    if (!(opts_.a > 1.0))
        throw std::invalid_argument("EnsembleSampler: stretch scale a must exceed 1");
    if (nwalkers_ < 2 * ndim_)
        std::cerr << "[Sampler] warning: " << nwalkers_ << " walkers for " << ndim_
                  << " dimensions, at least " << 2 * ndim_ << " recommended\n";
}

Matrix EnsembleSampler::sample_ball(const Vector& p0, const Vector& widths)
{
    if (p0.size() != ndim_ || widths.size() != ndim_)
        throw std::invalid_argument("sample_ball: start and widths must have ndim entries");

    std::normal_distribution<double> gauss(0.0, 1.0);
    Matrix ball(nwalkers_, ndim_);
    for (int w = 0; w < nwalkers_; ++w)
        for (int d = 0; d < ndim_; ++d)
            ball(w, d) = p0[d] + widths[d] * gauss(rng_);
    return ball;
}

/* ------------------------------------------------------------------ */
void EnsembleSampler::run(const Matrix& start, int nsteps)
{
    if (start.rows() != nwalkers_ || start.cols() != ndim_)
        throw std::invalid_argument("EnsembleSampler::run: start must be walkers x ndim");
    if (nsteps < 0)
        throw std::invalid_argument("EnsembleSampler::run: negative number of steps");

    Matrix pos = start;
    Vector lnp(nwalkers_);
    int    n_finite = 0;
    for (int w = 0; w < nwalkers_; ++w) {
        lnp[w] = lnprob_(pos.row(w).transpose());
        if (std::isfinite(lnp[w])) ++n_finite;
    }
    if (n_finite == 0)
        throw std::runtime_error("EnsembleSampler: no walker starts with finite probability");
    if (n_finite < nwalkers_)
        std::cerr << "[Sampler] warning: " << nwalkers_ - n_finite
                  << " walkers start outside the prior\n";

    chain_.resize(static_cast<Eigen::Index>(nsteps) * nwalkers_, ndim_);
    chain_lnp_.resize(static_cast<Eigen::Index>(nsteps) * nwalkers_);
    steps_done_ = 0;
    accepted_ = proposed_ = 0;

    std::uniform_real_distribution<double> unif(0.0, 1.0);
    std::uniform_int_distribution<int>     other(0, nwalkers_ - 2);
    const double a = opts_.a;

    for (int step = 0; step < nsteps; ++step) {
        for (int k = 0; k < nwalkers_; ++k) {
            int j = other(rng_);
            if (j >= k) ++j;                            // any walker but k

            /* z ~ g(z) = 1/sqrt(z) on [1/a, a] */
            const double z = std::pow((a - 1.0) * unif(rng_) + 1.0, 2) / a;
            const Vector y = pos.row(j).transpose()
                           + z * (pos.row(k) - pos.row(j)).transpose();

            const double lnp_y  = lnprob_(y);
            const double log_q  = (ndim_ - 1) * std::log(z) + lnp_y - lnp[k];
            ++proposed_;
            if (std::log(unif(rng_)) < log_q) {
                pos.row(k) = y.transpose();
                lnp[k]     = lnp_y;
                ++accepted_;
            }
        }

        const Eigen::Index row = static_cast<Eigen::Index>(step) * nwalkers_;
        chain_.middleRows(row, nwalkers_) = pos;
        chain_lnp_.segment(row, nwalkers_) = lnp;
        steps_done_ = step + 1;

        if (opts_.incremental_save > 0 && steps_done_ % opts_.incremental_save == 0) {
            std::cout << "[Sampler] " << steps_done_ << "/" << nsteps << " = "
                      << std::fixed << std::setprecision(1)
                      << 100.0 * steps_done_ / nsteps << "%, acceptance "
                      << std::setprecision(3) << acceptance_fraction()
                      << std::defaultfloat << '\n';
            checkpoint();
        }
    }
}

double EnsembleSampler::acceptance_fraction() const
{
    return proposed_ > 0 ? static_cast<double>(accepted_) / static_cast<double>(proposed_) : 0.0;
}

void EnsembleSampler::write_chain(const std::string& path) const
{
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Cannot write '" + path + "'");

    out << "# step walker lnprob";
    for (int d = 0; d < ndim_; ++d)
        out << ' ' << (d < static_cast<int>(opts_.names.size())
                       ? opts_.names[static_cast<std::size_t>(d)]
                       : "x" + std::to_string(d));
    out << '\n' << std::setprecision(std::numeric_limits<double>::max_digits10);

    for (int s = 0; s < steps_done_; ++s)
        for (int w = 0; w < nwalkers_; ++w) {
            const Eigen::Index row = static_cast<Eigen::Index>(s) * nwalkers_ + w;
            out << s << ' ' << w << ' ' << chain_lnp_[row];
            for (int d = 0; d < ndim_; ++d) out << ' ' << chain_(row, d);
            out << '\n';
        }
    if (!out) throw std::runtime_error("Error while writing '" + path + "'");
}

/* write to a temporary and rename, so a crash never leaves half a file */
void EnsembleSampler::checkpoint() const
{
    fs::create_directories(opts_.outdir);
    const fs::path final_path = fs::path(opts_.outdir) / "chain_checkpoint.txt";
    const fs::path tmp_path   = fs::path(opts_.outdir) / "chain_checkpoint.txt.tmp";
    write_chain(tmp_path.string());
    fs::rename(tmp_path, final_path);
}

} // namespace starfit
