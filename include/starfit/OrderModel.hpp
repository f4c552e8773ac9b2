#pragma once
#include "Types.hpp"
#include "BasisBundle.hpp"
#include "ChebyshevCalibration.hpp"
#include "DataSpectrum.hpp"
#include "Emulator.hpp"
#include "Likelihood.hpp"
#include "Parameters.hpp"
#include <string>

namespace starfit {

struct OrderModelOptions {
    int         npoly      = 4;       // Chebyshev terms incl. c0
    bool        fix_c0     = true;
    double      buffer_kms = 300.0;   // padding of the high-res chunk
    bool        chunk      = true;    // false: broaden the whole basis
    int         omp_threads = 0;      // OpenMP team of the FFT/spline loops, 0 = default
    std::string diagnostics_dir;      // Cholesky failures are dumped here
    bool        debug      = false;
};

enum class StepStatus { Ready, Rejected };

/* both stars on the data grid, plus what they were computed from */
struct DerivedState {
    ThetaParams   theta;
    ComponentPair stars;
    double        qq = 1.0;     // Fbol(star 2) / Fbol(star 1)
};

struct CovarianceState {
    PhiParams phi;
    Vector    k;                // Chebyshev calibration, N
    Matrix    data_mat;         // N x N
};

/*
 * Forward model and likelihood of one echelle order.
 *
 * The model keeps a committed (current) DerivedState/CovarianceState
 * and one spare slot of each.  Proposals are computed into the spare
 * slot; an accepted evaluation swaps the two, so after a commit the
 * spare slot holds the previous accepted state and revert() can swap
 * it back.  A rejected proposal never touches the current slots.
 */
class OrderModel {
public:
    enum class State { Uninitialized, Ready };

    OrderModel(EmulatorPtr emulator, DataSpectrumPtr spectrum,
               int spectrum_id, int order, OrderModelOptions opts = {});

    void initialize(const ThetaParams& theta, const PhiParams& phi);

    /* stage a proposal; Rejected leaves the committed state alone */
    StepStatus update_theta(const ThetaParams& theta);
    StepStatus update_phi(const PhiParams& phi);

    /* update, evaluate and commit; -inf on rejection */
    double log_probability(const ThetaParams& theta, const PhiParams& phi);
    double log_probability_theta(const ThetaParams& theta);
    double log_probability_phi(const PhiParams& phi);

    /* undo the last commit, valid until the next update */
    void revert();
    bool can_revert() const { return last_commit_.theta || last_commit_.phi; }

    double evaluate_current() const;
    double lnprob() const { return lnprob_; }

    Vector mean_model() const;
    Vector residuals() const;

    State state() const { return state_; }
    int spectrum_id() const { return spectrum_id_; }
    int order() const { return order_; }
    const std::string& tag() const { return tag_; }

    const ThetaParams&     theta()      const { return current_derived_.theta; }
    const PhiParams&       phi()        const { return current_cov_.phi; }
    const DerivedState&    derived()    const { return current_derived_; }
    const CovarianceState& covariance() const { return current_cov_; }
    const OrderSpectrum&   data()       const { return data_; }
    const BasisBundle&     basis()      const { return basis_; }
    const ChebyshevCalibration& chebyshev() const { return cheb_; }

    void set_debug(bool on) { opts_.debug = on; }

private:
    void require_ready(const char* what) const;

    void compute_derived(const ThetaParams& theta, DerivedState& out) const;
    bool compute_covariance(const PhiParams& phi, CovarianceState& out) const;

    double evaluate(const DerivedState& d, const CovarianceState& c) const;
    void   commit(bool theta, bool phi, double lnp);
    void   discard();

    EmulatorPtr          emulator_;
    DataSpectrumPtr      spectrum_;
    int                  spectrum_id_;
    int                  order_;
    OrderModelOptions    opts_;
    std::string          tag_;

    OrderSpectrum        data_;      // masked pixels only
    BasisBundle          basis_;
    ChebyshevCalibration cheb_;

    State state_ = State::Uninitialized;

    DerivedState    current_derived_, staged_derived_;
    CovarianceState current_cov_,     staged_cov_;
    bool theta_staged_ = false;
    bool phi_staged_   = false;

    struct CommitFlags { bool theta = false; bool phi = false; };
    CommitFlags last_commit_;

    double lnprob_      = 0.0;
    double lnprob_last_ = 0.0;
};

} // namespace starfit
