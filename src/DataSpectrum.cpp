#include "starfit/DataSpectrum.hpp"
#include <CCfits/CCfits>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <valarray>

namespace fs = std::filesystem;

namespace starfit {

Eigen::Index OrderSpectrum::n_used() const
{
    return static_cast<Eigen::Index>(std::count_if(mask.begin(), mask.end(),
                                                   [](int m) { return m != 0; }));
}

OrderSpectrum OrderSpectrum::masked() const
{
    if (static_cast<Eigen::Index>(mask.size()) != npix() ||
        fl.size() != npix() || sigma.size() != npix())
        throw std::invalid_argument("OrderSpectrum: wl, fl, sigma and mask differ in length");

    OrderSpectrum out;
    out.order = order;
    const Eigen::Index n = n_used();
    out.wl.resize(n); out.fl.resize(n); out.sigma.resize(n);
    out.mask.assign(static_cast<std::size_t>(n), 1);

    Eigen::Index j = 0;
    for (Eigen::Index i = 0; i < npix(); ++i) {
        if (!mask[static_cast<std::size_t>(i)]) continue;
        out.wl[j] = wl[i]; out.fl[j] = fl[i]; out.sigma[j] = sigma[i];
        ++j;
    }
    return out;
}

std::size_t DataSpectrum::index_of(int order) const
{
    for (std::size_t i = 0; i < orders.size(); ++i)
        if (orders[i].order == order) return i;
    throw std::invalid_argument("Spectrum '" + name + "' has no order " +
                                std::to_string(order));
}

/* ------------------------------------------------------------------ */
static void validate(const OrderSpectrum& o, const std::string& src)
{
    const std::string where = src + " order " + std::to_string(o.order);
    if (o.npix() == 0)
        throw std::runtime_error(where + ": no pixels");
    if (o.fl.size() != o.npix() || o.sigma.size() != o.npix() ||
        static_cast<Eigen::Index>(o.mask.size()) != o.npix())
        throw std::runtime_error(where + ": column lengths differ");
    for (Eigen::Index i = 1; i < o.npix(); ++i)
        if (!(o.wl[i] > o.wl[i - 1]))
            throw std::runtime_error(where + ": wavelengths not strictly ascending");
    for (Eigen::Index i = 0; i < o.npix(); ++i)
        if (o.mask[static_cast<std::size_t>(i)] && !(o.sigma[i] > 0.0))
            throw std::runtime_error(where + ": non-positive sigma on an unmasked pixel");
}

/* ================================================================== */
DataSpectrum load_data_ascii(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open '" + path + "'");

    struct Row { double wl, fl, sigma; int mask; };
    std::map<int, std::vector<Row>> by_order;

    std::string line;
    while (std::getline(in, line)) {
        auto it = std::find_if_not(line.begin(), line.end(), ::isspace);
        if (it == line.end() || *it == '#') continue;

        std::istringstream ss(line);
        int order; Row r;
        if (!(ss >> order >> r.wl >> r.fl >> r.sigma >> r.mask)) continue;
        by_order[order].push_back(r);
    }
    if (by_order.empty())
        throw std::runtime_error("File '" + path + "' contains no valid data");

    DataSpectrum ds;
    ds.name = fs::path(path).stem().string();
    for (auto& [order, rows] : by_order) {
        std::stable_sort(rows.begin(), rows.end(),
                         [](const Row& a, const Row& b) { return a.wl < b.wl; });
        OrderSpectrum o;
        o.order = order;
        const auto n = static_cast<Eigen::Index>(rows.size());
        o.wl.resize(n); o.fl.resize(n); o.sigma.resize(n);
        o.mask.resize(rows.size());
        for (Eigen::Index i = 0; i < n; ++i) {
            const Row& r = rows[static_cast<std::size_t>(i)];
            o.wl[i] = r.wl; o.fl[i] = r.fl; o.sigma[i] = r.sigma;
            o.mask[static_cast<std::size_t>(i)] = r.mask != 0;
        }
        validate(o, path);
        ds.orders.push_back(std::move(o));
    }
    return ds;
}

/* ================================================================== */
template <typename T>
static Vector row_vector(CCfits::ExtHDU& ext, const std::string& name, long row)
{
    std::valarray<T> buf;
    ext.column(name).read(buf, row);
    Vector v(static_cast<Eigen::Index>(buf.size()));
    for (std::size_t i = 0; i < buf.size(); ++i)
        v[static_cast<Eigen::Index>(i)] = static_cast<double>(buf[i]);
    return v;
}

DataSpectrum load_data_fits(const std::string& path)
{
    CCfits::FITS f(path, CCfits::Read);
    CCfits::ExtHDU& ext = f.extension(1);
    const long nrows = ext.rows();
    if (nrows <= 0)
        throw std::runtime_error("File '" + path + "' contains no orders");

    std::vector<int> orders;
    ext.column("order").read(orders, 1, nrows);

    DataSpectrum ds;
    ds.name = fs::path(path).stem().string();
    for (long row = 1; row <= nrows; ++row) {
        OrderSpectrum o;
        o.order = orders[static_cast<std::size_t>(row - 1)];
        o.wl    = row_vector<double>(ext, "wl", row);
        o.fl    = row_vector<double>(ext, "fl", row);
        o.sigma = row_vector<double>(ext, "sigma", row);
        const Vector m = row_vector<int>(ext, "mask", row);
        o.mask.resize(static_cast<std::size_t>(m.size()));
        for (Eigen::Index i = 0; i < m.size(); ++i)
            o.mask[static_cast<std::size_t>(i)] = m[i] != 0.0;
        validate(o, path);
        ds.orders.push_back(std::move(o));
    }
    return ds;
}

DataSpectrum load_data_spectrum(const std::string& path)
{
    if (!fs::exists(path))
        throw std::runtime_error("Data file '" + path + "' not found.");

    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    DataSpectrum ds = (ext == ".fits" || ext == ".fit" || ext == ".fts")
                      ? load_data_fits(path)
                      : load_data_ascii(path);

    std::cout << "[Data] " << ds.name << ": " << ds.orders.size() << " orders\n";
    return ds;
}

} // namespace starfit
