#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace starfit {
nlohmann::json load_json(const std::string& path);
void save_json(const nlohmann::json& j, const std::string& path);
void expand_env(nlohmann::json& j);

Vector vector_from_json(const nlohmann::json& j);
nlohmann::json vector_to_json(const Vector& v);
} // namespace starfit
