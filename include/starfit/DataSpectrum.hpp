#pragma once
#include "Types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace starfit {

/* one echelle order of an observed spectrum */
struct OrderSpectrum {
    int              order = 0;     // echelle order number
    Vector           wl;            // Å, ascending
    Vector           fl;
    Vector           sigma;
    std::vector<int> mask;          // 1 = use pixel

    Eigen::Index npix() const { return wl.size(); }
    Eigen::Index n_used() const;

    /* only the pixels with mask != 0 (mask of the result is all ones) */
    OrderSpectrum masked() const;
};

struct DataSpectrum {
    std::string                name;
    std::vector<OrderSpectrum> orders;

    /* index into orders for an echelle order number, throws if absent */
    std::size_t index_of(int order) const;
    const OrderSpectrum& by_order(int order) const { return orders[index_of(order)]; }
};

using DataSpectrumPtr = std::shared_ptr<const DataSpectrum>;

/* FITS or ASCII, picked from the extension */
DataSpectrum load_data_spectrum(const std::string& path);

/* `order wl fl sigma mask` per line, '#' comments */
DataSpectrum load_data_ascii(const std::string& path);

/* binary table, one row per order: order, wl[], fl[], sigma[], mask[] */
DataSpectrum load_data_fits(const std::string& path);

} // namespace starfit
