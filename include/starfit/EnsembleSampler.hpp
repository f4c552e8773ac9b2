#pragma once
#include "Types.hpp"
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace starfit {

struct SamplerOptions {
    int           walkers          = 0;       // 0 -> 2 * ndim
    std::uint64_t seed             = 42;
    double        a                = 2.0;     // stretch scale
    int           incremental_save = 0;       // 0 -> only at the end
    std::string   outdir           = "output";
    std::vector<std::string> names;           // column names for the chain file
};

/*
 * Affine-invariant ensemble sampler (Goodman & Weare 2010, stretch
 * move).  Walkers are updated one after another against the current
 * positions of all others.
 */
class EnsembleSampler {
public:
    using LogProb = std::function<double(const Vector&)>;

    EnsembleSampler(int ndim, LogProb lnprob, SamplerOptions opts);

    /* Gaussian ball around p0, one row per walker */
    Matrix sample_ball(const Vector& p0, const Vector& widths);

    /* nsteps stretch moves per walker, starting from `start` */
    void run(const Matrix& start, int nsteps);

    int ndim()    const { return ndim_; }
    int walkers() const { return nwalkers_; }
    int steps()   const { return steps_done_; }

    /* row (step * walkers + walker) */
    const Matrix& chain()   const { return chain_; }
    const Vector& lnprobs() const { return chain_lnp_; }

    double acceptance_fraction() const;

    /* plain text table: step walker lnprob params... */
    void write_chain(const std::string& path) const;

private:
    void checkpoint() const;

    int             ndim_;
    LogProb         lnprob_;
    SamplerOptions  opts_;
    int             nwalkers_;
    std::mt19937_64 rng_;

    Matrix chain_;
    Vector chain_lnp_;
    int    steps_done_ = 0;
    long   accepted_   = 0;
    long   proposed_   = 0;
};

} // namespace starfit
