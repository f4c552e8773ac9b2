#include "starfit/EmulatorIO.hpp"
#include <CCfits/CCfits>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace starfit {

static Vector read_scalar_column(CCfits::ExtHDU& ext, const std::string& name)
{
    if (!ext.column().count(name))
        throw std::runtime_error("Emulator: extension " + ext.name() +
                                 " lacks column '" + name + "'");
    std::vector<Real> buf;
    ext.column(name).read(buf, 1, ext.rows());
    return Eigen::Map<const Vector>(buf.data(), static_cast<Eigen::Index>(buf.size()));
}

/* number of columns called <prefix>0, <prefix>1, ... */
static int count_indexed(CCfits::ExtHDU& ext, const std::string& prefix)
{
    int n = 0;
    while (ext.column().count(prefix + std::to_string(n))) ++n;
    return n;
}

EmulatorData read_emulator_fits(const std::string& path)
{
    if (!fs::exists(path))
        throw std::runtime_error("Emulator file '" + path + "' not found.");

    CCfits::FITS f(path, CCfits::Read);
    EmulatorData d;

    /* ---------------- PCA basis ------------------------------------ */
    CCfits::ExtHDU& basis = f.extension("BASIS");
    int M = 0;
    basis.readKey("NCOMP", M);
    if (M <= 0 || count_indexed(basis, "eig") < M)
        throw std::runtime_error("Emulator: BASIS must carry NCOMP eigenspectra");

    d.basis.wl        = read_scalar_column(basis, "wl");
    d.basis.flux_mean = read_scalar_column(basis, "flux_mean");
    d.basis.flux_std  = read_scalar_column(basis, "flux_std");
    d.basis.eigenspectra.resize(M, d.basis.wl.size());
    for (int k = 0; k < M; ++k)
        d.basis.eigenspectra.row(k) = read_scalar_column(basis, "eig" + std::to_string(k)).transpose();

    /* ---------------- training grid -------------------------------- */
    CCfits::ExtHDU& grid = f.extension("GRID");
    const int N = count_indexed(grid, "p");
    if (N == 0)
        throw std::runtime_error("Emulator: GRID has no parameter columns");
    if (count_indexed(grid, "w") != M)
        throw std::runtime_error("Emulator: GRID must have one weight column per component");

    d.grid_points.resize(grid.rows(), N);
    for (int dim = 0; dim < N; ++dim) {
        d.grid_points.col(dim) = read_scalar_column(grid, "p" + std::to_string(dim));

        std::string name = "p" + std::to_string(dim);
        try {
            grid.readKey("PNAME" + std::to_string(dim), name);
        } catch (const CCfits::HDU::NoSuchKeyword&) {
            // unnamed axis, keep the column name
        }
        d.param_names.push_back(name);
    }
    d.weights.resize(grid.rows(), M);
    for (int k = 0; k < M; ++k)
        d.weights.col(k) = read_scalar_column(grid, "w" + std::to_string(k));
    if (grid.column().count("fbol"))
        d.fbol = read_scalar_column(grid, "fbol");

    /* ---------------- GP hyper-parameters -------------------------- */
    CCfits::ExtHDU& hyper = f.extension("HYPER");
    if (hyper.rows() != M)
        throw std::runtime_error("Emulator: HYPER must have one row per component");
    hyper.readKey("LAMXI", d.lambda_xi);

    d.amp = read_scalar_column(hyper, "amp");
    d.lengths.resize(M, N);
    for (int dim = 0; dim < N; ++dim)
        d.lengths.col(dim) = read_scalar_column(hyper, "l" + std::to_string(dim));

    return d;
}

std::shared_ptr<const GPEmulator> load_emulator(const std::string& path,
                                                std::size_t cache_capacity)
{
    auto emu = std::make_shared<const GPEmulator>(read_emulator_fits(path), cache_capacity);
    std::cout << "[Emulator] " << path << ": " << emu->ncomp() << " components, "
              << emu->ngrid() << " grid points, " << emu->basis().npix()
              << " pixels\n";
    return emu;
}

} // namespace starfit
