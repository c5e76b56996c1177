#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace funfold {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

/* numeric arrays <-> Eigen */
Vector vector_from_json(const nlohmann::json& j, const std::string& what);
Matrix matrix_from_json(const nlohmann::json& j, const std::string& what);
nlohmann::json to_json(const Vector& v);
nlohmann::json to_json(const Matrix& M);
} // namespace funfold
