#include "funfold/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace funfold {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open JSON file: " + path);
    nlohmann::json j;
    f >> j;
    return j;
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

Vector vector_from_json(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_array())
        throw std::runtime_error("'" + what + "' has to be an array of numbers");
    Vector v(static_cast<int>(j.size()));
    for (std::size_t i = 0; i < j.size(); ++i)
        v[static_cast<int>(i)] = j[i].get<double>();
    return v;
}

Matrix matrix_from_json(const nlohmann::json& j, const std::string& what)
{
    if (!j.is_array() || j.empty() || !j[0].is_array())
        throw std::runtime_error("'" + what + "' has to be a non-empty array of rows");

    const std::size_t rows = j.size();
    const std::size_t cols = j[0].size();
    Matrix M(static_cast<int>(rows), static_cast<int>(cols));
    for (std::size_t r = 0; r < rows; ++r) {
        if (!j[r].is_array() || j[r].size() != cols)
            throw std::runtime_error("'" + what + "': row " + std::to_string(r) +
                                     " has the wrong length");
        for (std::size_t c = 0; c < cols; ++c)
            M(static_cast<int>(r), static_cast<int>(c)) = j[r][c].get<double>();
    }
    return M;
}

nlohmann::json to_json(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

nlohmann::json to_json(const Matrix& M)
{
    nlohmann::json rows = nlohmann::json::array();
    for (int r = 0; r < M.rows(); ++r) {
        const Vector row = M.row(r).transpose();
        rows.push_back(to_json(row));
    }
    return rows;
}

} // namespace funfold
