#include "starfit/OrderModel.hpp"
#include "starfit/Broadening.hpp"
#include "starfit/Covariance.hpp"
#include "starfit/Errors.hpp"
#include "starfit/QuinticSpline.hpp"
#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace starfit {

static constexpr double kNegInf = -std::numeric_limits<double>::infinity();

/* ---------------- construction helpers ------------------------------- */
static OrderSpectrum masked_order(const DataSpectrumPtr& spectrum, int order)
{
    if (!spectrum)
        throw std::invalid_argument("OrderModel: no data spectrum");
    OrderSpectrum o = spectrum->by_order(order).masked();
    if (o.npix() == 0)
        throw std::invalid_argument("OrderModel: order " + std::to_string(order) +
                                    " has no unmasked pixels");
    return o;
}

static BasisBundle make_bundle(const EmulatorPtr& emulator, const Vector& wl,
                               const OrderModelOptions& opts)
{
    if (!emulator)
        throw std::invalid_argument("OrderModel: no emulator");
    return opts.chunk ? BasisBundle(emulator->basis(), wl, opts.buffer_kms)
                      : BasisBundle(emulator->basis());
}

OrderModel::OrderModel(EmulatorPtr emulator, DataSpectrumPtr spectrum,
                       int spectrum_id, int order, OrderModelOptions opts)
    : emulator_(std::move(emulator))
    , spectrum_(std::move(spectrum))
    , spectrum_id_(spectrum_id)
    , order_(order)
    , opts_(std::move(opts))
    , tag_("[Order " + std::to_string(spectrum_id) + "/" + std::to_string(order) + "]")
    , data_(masked_order(spectrum_, order))
    , basis_(make_bundle(emulator_, data_.wl, opts_))
    , cheb_(static_cast<int>(data_.npix()), opts_.npoly, opts_.fix_c0)
{
    if (opts_.debug)
        std::cout << tag_ << " " << data_.npix() << " pixels, high-res chunk "
                  << basis_.npix() << " px (dv = " << basis_.dv() << " km/s)\n";
}

void OrderModel::require_ready(const char* what) const
{
    if (state_ != State::Ready)
        throw std::logic_error(tag_ + " " + what + " called before initialize()");
}

/* ===================================================================== */
/*  Theta -> both stars on the data grid.  Domain failures throw         */
/*  ModelError; `out` is scratch space until the caller commits it.      */
/* ===================================================================== */
void OrderModel::compute_derived(const ThetaParams& theta, DerivedState& out) const
{
    const int M = basis_.ncomp();

    /* validation and emulator queries for both stars before any FFT */
    std::array<double, ThetaParams::kNStars> fbol{}, shift{};
    for (int s = 0; s < ThetaParams::kNStars; ++s) {
        const StarParams& star = theta.stars[s];
        if (star.grid.size() != emulator_->grid_dim())
            throw std::invalid_argument(tag_ + " star " + std::to_string(s + 1) + " has " +
                                        std::to_string(star.grid.size()) +
                                        " grid parameters, emulator expects " +
                                        std::to_string(emulator_->grid_dim()));
        if (!(star.vsini >= 0.0))
            throw ModelError("vsini of star " + std::to_string(s + 1) + " must be non-negative");
        if (!std::isfinite(star.logOmega) || !std::isfinite(std::pow(10.0, star.logOmega)))
            throw ModelError("logOmega of star " + std::to_string(s + 1) + " is not finite");
        shift[s] = std::log(doppler_factor(star.vz));
        check_support(basis_.log_wl0() + shift[s], basis_.log_step(), basis_.npix(), data_.wl);

        out.stars[s].emu = emulator_->interpolate(star.grid);      // OutOfGridError
        fbol[s]          = emulator_->fbol(star.grid);
    }

    for (int s = 0; s < ThetaParams::kNStars; ++s) {
        const StarParams& star = theta.stars[s];
        ComponentModel&   comp = out.stars[s];

        const Matrix broadened = broaden_basis(basis_, star.vsini);
        const Matrix resampled = resample_rows(broadened, basis_.log_wl0() + shift[s],
                                               basis_.log_step(), data_.wl);

        comp.Omega        = std::pow(10.0, star.logOmega);
        comp.flux_mean    = comp.Omega * resampled.row(0).transpose();
        comp.flux_std     = comp.Omega * resampled.row(1).transpose();
        comp.eigenspectra = resampled.bottomRows(M);
    }

    out.qq    = fbol[1] / fbol[0];
    out.theta = theta;
}

/* ---------------------------------------------------------------------- */
/*  reason for a soft prior rejection, nullptr if Phi is admissible        */
/* ---------------------------------------------------------------------- */
static const char* phi_outside_prior(const PhiParams& phi)
{
    if (!(phi.sigAmp > 0.0))       return "sigAmp <= 0";
    if (!(phi.amp >= 0.0))         return "amp < 0";
    if (!(phi.l > 0.0))            return "l <= 0";
    if (!std::isfinite(phi.amp) || !std::isfinite(phi.l) || !std::isfinite(phi.sigAmp))
        return "non-finite kernel parameter";
    if (!phi.cheb.allFinite())     return "non-finite Chebyshev coefficient";
    return nullptr;
}

bool OrderModel::compute_covariance(const PhiParams& phi, CovarianceState& out) const
{
    if (phi.fix_c0 != cheb_.fix_c0())
        throw std::invalid_argument(tag_ + " Phi fix_c0 does not match the model");

    if (const char* why = phi_outside_prior(phi)) {
        if (opts_.debug)
            std::cout << tag_ << " Phi rejected (" << why << "): " << phi << "\n";
        return false;
    }

    /* covariance regions are never part of the sampled covariance */
    out.phi = phi;
    out.phi.regions.clear();
    out.k        = cheb_.evaluate(out.phi.cheb);
    out.data_mat = build_data_covariance(data_.wl, data_.sigma, out.phi);
    return true;
}

double OrderModel::evaluate(const DerivedState& d, const CovarianceState& c) const
{
    FailureDump dump;
    dump.directory = opts_.diagnostics_dir;
    dump.tag       = "CC_s" + std::to_string(spectrum_id_) + "_o" + std::to_string(order_);
    dump.context   = [&] {
        return nlohmann::json{ {"spectrum_id", spectrum_id_},
                               {"order",       order_},
                               {"Theta",       d.theta.to_json()},
                               {"Phi",         c.phi.to_json()} };
    };

    try {
        const LikelihoodResult r = evaluate_lnprob(data_.fl, c.k, d.stars, c.data_mat, &dump);
        if (opts_.debug)
            std::cout << tag_ << " lnprob " << r.lnprob << " (chi2 " << r.chi2
                      << ", logdet " << r.logdet << ")\n";
        return r.lnprob;
    } catch (const CholeskyError&) {
        std::cerr << tag_ << " Cholesky failure at\n  Theta " << d.theta
                  << "\n  Phi   " << c.phi << "\n";
        throw;
    }
}

/* ===================================================================== */
void OrderModel::initialize(const ThetaParams& theta, const PhiParams& phi)
{
    try {
        compute_derived(theta, current_derived_);
    } catch (const ModelError& e) {
        throw std::invalid_argument(tag_ + " initial Theta rejected: " + e.what());
    }
    if (!compute_covariance(phi, current_cov_))
        throw std::invalid_argument(tag_ + " initial Phi outside the prior");

    lnprob_      = evaluate(current_derived_, current_cov_);
    lnprob_last_ = lnprob_;
    state_       = State::Ready;
    last_commit_ = CommitFlags{};
    theta_staged_ = phi_staged_ = false;

    std::cout << tag_ << " initialised, lnprob = " << lnprob_ << "\n";
}

StepStatus OrderModel::update_theta(const ThetaParams& theta)
{
    require_ready("update_theta");
    last_commit_  = CommitFlags{};   // the spare slot gets overwritten
    theta_staged_ = false;
    try {
        compute_derived(theta, staged_derived_);
    } catch (const ModelError& e) {
        std::cerr << tag_ << " warning: Theta rejected: " << e.what() << "\n";
        return StepStatus::Rejected;
    }
    theta_staged_ = true;
    return StepStatus::Ready;
}

StepStatus OrderModel::update_phi(const PhiParams& phi)
{
    require_ready("update_phi");
    last_commit_ = CommitFlags{};
    phi_staged_  = compute_covariance(phi, staged_cov_);
    return phi_staged_ ? StepStatus::Ready : StepStatus::Rejected;
}

void OrderModel::commit(bool theta, bool phi, double lnp)
{
    if (theta) std::swap(current_derived_, staged_derived_);
    if (phi)   std::swap(current_cov_, staged_cov_);
    last_commit_.theta = theta;
    last_commit_.phi   = phi;
    lnprob_last_ = lnprob_;
    lnprob_      = lnp;
    theta_staged_ = phi_staged_ = false;
}

void OrderModel::discard()
{
    theta_staged_ = phi_staged_ = false;
}

/* ---------------------------------------------------------------------- */
double OrderModel::log_probability(const ThetaParams& theta, const PhiParams& phi)
{
    require_ready("log_probability");
    if (update_theta(theta) == StepStatus::Rejected ||
        update_phi(phi)     == StepStatus::Rejected) {
        discard();
        return kNegInf;
    }
    const double lnp = evaluate(staged_derived_, staged_cov_);
    commit(true, true, lnp);
    return lnp;
}

double OrderModel::log_probability_theta(const ThetaParams& theta)
{
    require_ready("log_probability_theta");
    if (update_theta(theta) == StepStatus::Rejected) {
        discard();
        return kNegInf;
    }
    const double lnp = evaluate(staged_derived_, current_cov_);
    commit(true, false, lnp);
    return lnp;
}

double OrderModel::log_probability_phi(const PhiParams& phi)
{
    require_ready("log_probability_phi");
    if (update_phi(phi) == StepStatus::Rejected) {
        discard();
        return kNegInf;
    }
    const double lnp = evaluate(current_derived_, staged_cov_);
    commit(false, true, lnp);
    return lnp;
}

void OrderModel::revert()
{
    require_ready("revert");
    if (!can_revert())
        throw std::logic_error(tag_ + " revert() without a preceding accepted step");

    if (last_commit_.theta) std::swap(current_derived_, staged_derived_);
    if (last_commit_.phi)   std::swap(current_cov_, staged_cov_);
    std::swap(lnprob_, lnprob_last_);
    last_commit_ = CommitFlags{};

    if (opts_.debug)
        std::cout << tag_ << " reverted to lnprob " << lnprob_ << "\n";
}

double OrderModel::evaluate_current() const
{
    require_ready("evaluate_current");
    return evaluate(current_derived_, current_cov_);
}

Vector OrderModel::mean_model() const
{
    require_ready("mean_model");
    Vector model = Vector::Zero(data_.npix());
    for (const auto& comp : current_derived_.stars)
        model += component_mean(current_cov_.k, comp);
    return model;
}

Vector OrderModel::residuals() const
{
    return data_.fl - mean_model();
}

} // namespace starfit
