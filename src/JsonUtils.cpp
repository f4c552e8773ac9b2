#include "starfit/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace starfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");
    nlohmann::json j;
    f >> j;
    return j;
}

void save_json(const nlohmann::json& j, const std::string& path)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f << j.dump(2) << '\n';      // nlohmann prints round-trip-exact doubles
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

Vector vector_from_json(const nlohmann::json& j)
{
    const auto v = j.get<std::vector<double>>();
    return Eigen::Map<const Vector>(v.data(), static_cast<Eigen::Index>(v.size()));
}

nlohmann::json vector_to_json(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

} // namespace starfit
