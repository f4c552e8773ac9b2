#pragma once
#include "Types.hpp"
#include "DataSpectrum.hpp"
#include "Emulator.hpp"
#include "OrderModel.hpp"
#include "ParameterLayout.hpp"
#include "Parameters.hpp"
#include "ThreadPool.hpp"
#include <memory>
#include <vector>

namespace starfit {

/* which order of which spectrum, and its starting nuisance parameters */
struct OrderSetup {
    int       spectrum_id = 0;
    int       order       = 0;
    PhiParams phi;
};

/*
 * All orders of all spectra.  Theta is shared, Phi is per order.  A
 * sampler call decodes the flat vector, evaluates every order on the
 * pool and returns the sum of the per-order log-probabilities.
 */
class MultiOrderModel {
public:
    MultiOrderModel(EmulatorPtr emulator,
                    std::vector<DataSpectrumPtr> spectra,
                    std::vector<OrderSetup> orders,
                    OrderModelOptions opts,
                    unsigned nthreads = 1);

    void initialize(const ThetaParams& theta);

    double log_probability(const Vector& flat);

    /* flat vector of the committed state of every order */
    Vector current_vector() const;

    const ParameterLayout& layout() const { return layout_; }
    std::size_t n_orders() const { return models_.size(); }
    OrderModel&       order_model(std::size_t i)       { return *models_.at(i); }
    const OrderModel& order_model(std::size_t i) const { return *models_.at(i); }

private:
    EmulatorPtr                              emulator_;
    std::vector<DataSpectrumPtr>             spectra_;
    std::vector<OrderSetup>                  setups_;
    std::vector<std::unique_ptr<OrderModel>> models_;
    ParameterLayout                          layout_;
    ThreadPool                               pool_;
    bool                                     initialized_ = false;
};

} // namespace starfit
