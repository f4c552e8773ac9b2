#include "starfit/Parameters.hpp"
#include "starfit/JsonUtils.hpp"
#include <ostream>
#include <stdexcept>

namespace starfit {

/* ------------------------------------------------------------------ */
/*  Theta                                                             */
/* ------------------------------------------------------------------ */
static nlohmann::json star_to_json(const StarParams& s)
{
    return { {"grid",     vector_to_json(s.grid)},
             {"vz",       s.vz},
             {"vsini",    s.vsini},
             {"logOmega", s.logOmega} };
}

static StarParams star_from_json(const nlohmann::json& j)
{
    StarParams s;
    s.grid     = vector_from_json(j.at("grid"));
    s.vz       = j.at("vz").get<double>();
    s.vsini    = j.at("vsini").get<double>();
    s.logOmega = j.at("logOmega").get<double>();
    return s;
}

nlohmann::json ThetaParams::to_json() const
{
    nlohmann::json j;
    j["star1"] = star_to_json(stars[0]);
    j["star2"] = star_to_json(stars[1]);
    return j;
}

ThetaParams ThetaParams::from_json(const nlohmann::json& j)
{
    ThetaParams t;
    t.stars[0] = star_from_json(j.at("star1"));
    t.stars[1] = star_from_json(j.at("star2"));
    if (t.stars[0].grid.size() != t.stars[1].grid.size())
        throw std::invalid_argument("Theta: both stars need the same grid dimension");
    return t;
}

/* ------------------------------------------------------------------ */
/*  Phi                                                               */
/* ------------------------------------------------------------------ */
Vector PhiParams::to_array() const
{
    Vector p(cheb.size() + 3);
    p.head(cheb.size()) = cheb;
    p[cheb.size()]     = sigAmp;
    p[cheb.size() + 1] = amp;
    p[cheb.size() + 2] = l;
    return p;
}

PhiParams PhiParams::from_array(const Vector& p, int spectrum_id,
                                int order, bool fix_c0)
{
    if (p.size() < 3)
        throw std::invalid_argument("Phi array needs at least sigAmp, amp, l");

    const Eigen::Index ncheb = p.size() - 3;
    PhiParams phi;
    phi.spectrum_id = spectrum_id;
    phi.order       = order;
    phi.fix_c0      = fix_c0;
    phi.cheb        = p.head(ncheb);
    phi.sigAmp      = p[ncheb];
    phi.amp         = p[ncheb + 1];
    phi.l           = p[ncheb + 2];
    return phi;
}

nlohmann::json PhiParams::to_json() const
{
    nlohmann::json j;
    j["spectrum_id"] = spectrum_id;
    j["order"]       = order;
    j["fix_c0"]      = fix_c0;
    j["cheb"]        = vector_to_json(cheb);
    j["sigAmp"]      = sigAmp;
    j["amp"]         = amp;
    j["l"]           = l;

    nlohmann::json regs = nlohmann::json::array();
    for (const auto& r : regions)
        regs.push_back({ {"logAmp", r.logAmp}, {"mu", r.mu}, {"sigma", r.sigma} });
    j["regions"] = regs;
    return j;
}

PhiParams PhiParams::from_json(const nlohmann::json& j)
{
    PhiParams phi;
    phi.spectrum_id = j.at("spectrum_id").get<int>();
    phi.order       = j.at("order").get<int>();
    phi.fix_c0      = j.at("fix_c0").get<bool>();
    phi.cheb        = vector_from_json(j.at("cheb"));
    phi.sigAmp      = j.at("sigAmp").get<double>();
    phi.amp         = j.at("amp").get<double>();
    phi.l           = j.at("l").get<double>();

    if (j.contains("regions") && !j["regions"].is_null()) {
        for (const auto& r : j["regions"]) {
            phi.regions.push_back({ r.at("logAmp").get<double>(),
                                    r.at("mu").get<double>(),
                                    r.at("sigma").get<double>() });
        }
    }
    return phi;
}

void PhiParams::save(const std::string& path) const
{
    save_json(to_json(), path);
}

PhiParams PhiParams::load(const std::string& path)
{
    return from_json(load_json(path));
}

/* ------------------------------------------------------------------ */
/*  printing (debug output)                                           */
/* ------------------------------------------------------------------ */
std::ostream& operator<<(std::ostream& os, const StarParams& p)
{
    os << "grid=[";
    for (Eigen::Index i = 0; i < p.grid.size(); ++i)
        os << (i ? ", " : "") << p.grid[i];
    return os << "] vz=" << p.vz << " vsini=" << p.vsini
              << " logOmega=" << p.logOmega;
}

std::ostream& operator<<(std::ostream& os, const ThetaParams& p)
{
    return os << "{" << p.stars[0] << " | " << p.stars[1] << "}";
}

std::ostream& operator<<(std::ostream& os, const PhiParams& p)
{
    os << "spectrum " << p.spectrum_id << " order " << p.order << " cheb=[";
    for (Eigen::Index i = 0; i < p.cheb.size(); ++i)
        os << (i ? ", " : "") << p.cheb[i];
    os << "] sigAmp=" << p.sigAmp << " amp=" << p.amp << " l=" << p.l;
    if (!p.regions.empty()) os << " regions=" << p.regions.size();
    return os;
}

} // namespace starfit
