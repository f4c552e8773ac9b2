#pragma once
#include "Emulator.hpp"
#include <memory>
#include <string>

namespace starfit {

/*
 * Emulator file layout (FITS, binary-table extensions):
 *
 *   BASIS   columns wl, flux_mean, flux_std, eig0..eig{M-1}   key NCOMP
 *   GRID    columns p0..p{N-1}, w0..w{M-1}, optional fbol     keys PNAME<d>
 *   HYPER   one row per component, columns amp, l0..l{N-1}   key LAMXI
 */
EmulatorData read_emulator_fits(const std::string& path);

std::shared_ptr<const GPEmulator> load_emulator(const std::string& path,
                                                std::size_t cache_capacity = 256);

} // namespace starfit
