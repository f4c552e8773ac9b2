#pragma once
/*
 * Maps the flat vector the ensemble sampler walks on to the structured
 * parameters of the model:
 *
 *      [ grid1 (N), vz1, vsini1, logOmega1,
 *        grid2 (N), vz2, vsini2, logOmega2,
 *        { cheb (ncheb), sigAmp, amp, l }  for every order ]
 *
 * Theta is shared by all orders, every order has its own Phi block.
 * Covariance regions are not part of the sampled Phi; decoded Phi
 * blocks never carry any.
 */

#include "Types.hpp"
#include "Parameters.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace starfit {

class ParameterLayout {
public:
    struct OrderSlot {
        int  spectrum_id = 0;
        int  order       = 0;
        bool fix_c0      = true;
        int  ncheb       = 0;     // free Chebyshev coefficients
        int  offset      = 0;     // first index of the Phi block
    };

    ParameterLayout() = default;

    void build(int grid_dim, const std::vector<OrderSlot>& orders)
    {
        if (grid_dim <= 0)
            throw std::invalid_argument("ParameterLayout: grid dimension must be positive");
        grid_dim_ = grid_dim;
        orders_   = orders;

        int pos = theta_size();
        for (auto& o : orders_) {
            o.offset = pos;
            pos += o.ncheb + 3;
        }
        total_ = pos;
    }

    int grid_dim()   const { return grid_dim_; }
    int star_size()  const { return grid_dim_ + 3; }
    int theta_size() const { return ThetaParams::kNStars * star_size(); }
    int size()       const { return total_; }
    int n_orders()   const { return static_cast<int>(orders_.size()); }

    const OrderSlot& slot(int o) const { return orders_.at(static_cast<std::size_t>(o)); }

    ThetaParams decode_theta(const Vector& flat) const
    {
        check(flat);
        ThetaParams t;
        for (int s = 0; s < ThetaParams::kNStars; ++s) {
            const int b = s * star_size();
            t.stars[s].grid     = flat.segment(b, grid_dim_);
            t.stars[s].vz       = flat[b + grid_dim_];
            t.stars[s].vsini    = flat[b + grid_dim_ + 1];
            t.stars[s].logOmega = flat[b + grid_dim_ + 2];
        }
        return t;
    }

    PhiParams decode_phi(const Vector& flat, int o) const
    {
        check(flat);
        const OrderSlot& s = slot(o);
        return PhiParams::from_array(flat.segment(s.offset, s.ncheb + 3),
                                     s.spectrum_id, s.order, s.fix_c0);
    }

    Vector encode(const ThetaParams& theta, const std::vector<PhiParams>& phis) const
    {
        if (static_cast<int>(phis.size()) != n_orders())
            throw std::invalid_argument("ParameterLayout: one Phi per order expected");

        Vector flat(total_);
        for (int s = 0; s < ThetaParams::kNStars; ++s) {
            const StarParams& st = theta.stars[s];
            if (st.grid.size() != grid_dim_)
                throw std::invalid_argument("ParameterLayout: grid dimension mismatch");
            const int b = s * star_size();
            flat.segment(b, grid_dim_) = st.grid;
            flat[b + grid_dim_]     = st.vz;
            flat[b + grid_dim_ + 1] = st.vsini;
            flat[b + grid_dim_ + 2] = st.logOmega;
        }
        for (int o = 0; o < n_orders(); ++o) {
            const OrderSlot& s = slot(o);
            const Vector a = phis[static_cast<std::size_t>(o)].to_array();
            if (a.size() != s.ncheb + 3)
                throw std::invalid_argument("ParameterLayout: Phi of order " +
                                            std::to_string(s.order) +
                                            " has the wrong number of coefficients");
            flat.segment(s.offset, a.size()) = a;
        }
        return flat;
    }

    /* column names for chain files */
    std::vector<std::string> names(const std::vector<std::string>& grid_names) const
    {
        std::vector<std::string> out;
        out.reserve(static_cast<std::size_t>(total_));
        for (int s = 1; s <= ThetaParams::kNStars; ++s) {
            const std::string k = std::to_string(s);
            for (int d = 0; d < grid_dim_; ++d)
                out.push_back((d < static_cast<int>(grid_names.size())
                               ? grid_names[static_cast<std::size_t>(d)]
                               : "p" + std::to_string(d)) + k);
            out.push_back("vz" + k);
            out.push_back("vsini" + k);
            out.push_back("logOmega" + k);
        }
        for (const auto& o : orders_) {
            const std::string k = "_" + std::to_string(o.spectrum_id) + "_" + std::to_string(o.order);
            const int c0 = o.fix_c0 ? 1 : 0;
            for (int c = 0; c < o.ncheb; ++c)
                out.push_back("c" + std::to_string(c + c0) + k);
            out.push_back("sigAmp" + k);
            out.push_back("amp" + k);
            out.push_back("l" + k);
        }
        return out;
    }

private:
    void check(const Vector& flat) const
    {
        if (flat.size() != total_)
            throw std::invalid_argument("ParameterLayout: expected " + std::to_string(total_) +
                                        " parameters, got " + std::to_string(flat.size()));
    }

    int grid_dim_ = 0;
    int total_    = 0;
    std::vector<OrderSlot> orders_;
};

} // namespace starfit
