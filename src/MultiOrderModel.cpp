#include "starfit/MultiOrderModel.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <omp.h>
#include <stdexcept>

namespace starfit {

MultiOrderModel::MultiOrderModel(EmulatorPtr emulator,
                                 std::vector<DataSpectrumPtr> spectra,
                                 std::vector<OrderSetup> orders,
                                 OrderModelOptions opts,
                                 unsigned nthreads)
    : emulator_(std::move(emulator))
    , spectra_(std::move(spectra))
    , setups_(std::move(orders))
    , pool_(std::clamp<unsigned>(nthreads, 1u,
                                 static_cast<unsigned>(std::max<std::size_t>(1, setups_.size()))),
            [n = opts.omp_threads] { if (n > 0) omp_set_num_threads(n); })
{
    if (!emulator_)
        throw std::invalid_argument("MultiOrderModel: no emulator");
    if (setups_.empty())
        throw std::invalid_argument("MultiOrderModel: no orders to fit");

    std::vector<ParameterLayout::OrderSlot> slots;
    for (const auto& s : setups_) {
        if (s.spectrum_id < 0 || s.spectrum_id >= static_cast<int>(spectra_.size()))
            throw std::invalid_argument("MultiOrderModel: spectrum id " +
                                        std::to_string(s.spectrum_id) + " out of range");

        models_.push_back(std::make_unique<OrderModel>(
            emulator_, spectra_[static_cast<std::size_t>(s.spectrum_id)],
            s.spectrum_id, s.order, opts));

        ParameterLayout::OrderSlot slot;
        slot.spectrum_id = s.spectrum_id;
        slot.order       = s.order;
        slot.fix_c0      = opts.fix_c0;
        slot.ncheb       = models_.back()->chebyshev().nfree();
        slots.push_back(slot);
    }
    layout_.build(emulator_->grid_dim(), slots);

    std::cout << "[Model] " << models_.size() << " orders, " << layout_.size()
              << " parameters, " << pool_.size() << " worker threads";
    if (opts.omp_threads > 0) std::cout << " x " << opts.omp_threads << " OpenMP";
    std::cout << '\n';
}

void MultiOrderModel::initialize(const ThetaParams& theta)
{
    for (std::size_t i = 0; i < models_.size(); ++i)
        models_[i]->initialize(theta, setups_[i].phi);
    initialized_ = true;
}

/* ------------------------------------------------------------------ */
/*  map over orders, reduce by summation                              */
/* ------------------------------------------------------------------ */
double MultiOrderModel::log_probability(const Vector& flat)
{
    if (!initialized_)
        throw std::logic_error("MultiOrderModel::log_probability called before initialize()");

    const ThetaParams theta = layout_.decode_theta(flat);

    const std::vector<double> lnps = pool_.map(models_.size(), [&](std::size_t i) {
        const PhiParams phi = layout_.decode_phi(flat, static_cast<int>(i));
        return models_[i]->log_probability(theta, phi);
    });

    double sum = 0.0;
    for (double lnp : lnps) {
        if (lnp == -std::numeric_limits<double>::infinity()) return lnp;
        sum += lnp;
    }
    return sum;
}

Vector MultiOrderModel::current_vector() const
{
    if (!initialized_)
        throw std::logic_error("MultiOrderModel::current_vector called before initialize()");

    std::vector<PhiParams> phis;
    for (const auto& m : models_) phis.push_back(m->phi());
    return layout_.encode(models_.front()->theta(), phis);
}

} // namespace starfit
