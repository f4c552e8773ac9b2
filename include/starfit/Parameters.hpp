#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <string>
#include <vector>
#include <iosfwd>

namespace starfit {

/* ------------------------------------------------------------------ */
/*  Theta : physical parameters, one block per star                   */
/* ------------------------------------------------------------------ */
struct StarParams {
    Vector grid;            // emulator grid coordinates (teff, logg, Z, ...)
    double vz       = 0.0;  // radial velocity   [km/s]
    double vsini    = 0.0;  // rotational broadening [km/s]
    double logOmega = 0.0;  // log10 flux scaling
};

struct ThetaParams {
    static constexpr int kNStars = 2;
    std::array<StarParams, kNStars> stars;

    nlohmann::json to_json() const;
    static ThetaParams from_json(const nlohmann::json& j);
};

/* ------------------------------------------------------------------ */
/*  Phi : per-order nuisance parameters                               */
/* ------------------------------------------------------------------ */
struct CovRegion {
    double logAmp = 0.0;    // log10 of the region kernel amplitude
    double mu     = 0.0;    // line centre [AA]
    double sigma  = 0.0;    // width [km/s]
};

struct PhiParams {
    int    spectrum_id = 0;
    int    order       = 0;
    bool   fix_c0      = true;
    Vector cheb;             // c1..c(n-1) if fix_c0, else c0..c(n-1)
    double sigAmp      = 1.0;
    double amp         = 0.0;
    double l           = 20.0;   // [km/s]
    std::vector<CovRegion> regions;

    /* flat form used by the sampler: cheb..., sigAmp, amp, l */
    Vector to_array() const;
    static PhiParams from_array(const Vector& p, int spectrum_id,
                                int order, bool fix_c0);

    nlohmann::json to_json() const;
    static PhiParams from_json(const nlohmann::json& j);

    void save(const std::string& path) const;
    static PhiParams load(const std::string& path);
};

std::ostream& operator<<(std::ostream& os, const StarParams& p);
std::ostream& operator<<(std::ostream& os, const ThetaParams& p);
std::ostream& operator<<(std::ostream& os, const PhiParams& p);

} // namespace starfit
