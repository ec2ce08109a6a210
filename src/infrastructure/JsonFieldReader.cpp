/**
 * @file JsonFieldReader.cpp
 * @brief Implementation of JsonFieldReader.
 */

#include "infrastructure/JsonFieldReader.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace trialguard::infrastructure {

using json = nlohmann::json;

JsonFieldReader::JsonFieldReader(const json& object, std::string path, std::vector<std::string>& errors)
    : m_object(object), m_path(std::move(path)), m_errors(errors) {}

const json* JsonFieldReader::find(const char* key) const {
    if (!m_object.is_object()) return nullptr;
    auto it = m_object.find(key);
    if (it == m_object.end() || it->is_null()) return nullptr;
    return &(*it);
}

bool JsonFieldReader::has(const char* key) const {
    return find(key) != nullptr;
}

void JsonFieldReader::fail(const char* key, const std::string& reason) const {
    std::string field = m_path.empty() ? std::string(key) : m_path + "." + key;
    m_errors.push_back(field + ": " + reason);
}

std::string JsonFieldReader::string(const char* key, const std::string& fallback) const {
    auto value = optionalString(key);
    return value ? *value : fallback;
}

std::optional<std::string> JsonFieldReader::optionalString(const char* key) const {
    const json* value = find(key);
    if (!value) return std::nullopt;
    if (!value->is_string()) {
        fail(key, "expected string");
        return std::nullopt;
    }
    return value->get<std::string>();
}

std::optional<long long> JsonFieldReader::readIntegral(const char* key) const {
    const json* value = find(key);
    if (!value) return std::nullopt;
    if (value->is_number_integer()) {
        return value->get<long long>();
    }
    // Accept 120.0 but not 120.5.
    if (value->is_number_float()) {
        const double d = value->get<double>();
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e18) {
            return static_cast<long long>(d);
        }
    }
    fail(key, "expected integer");
    return std::nullopt;
}

int JsonFieldReader::integer(const char* key, int fallback) const {
    auto value = optionalInteger(key);
    return value ? *value : fallback;
}

std::optional<int> JsonFieldReader::optionalInteger(const char* key) const {
    auto value = readIntegral(key);
    if (!value) return std::nullopt;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        fail(key, "integer out of range");
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

double JsonFieldReader::number(const char* key, double fallback) const {
    auto value = optionalNumber(key);
    return value ? *value : fallback;
}

std::optional<double> JsonFieldReader::optionalNumber(const char* key) const {
    const json* value = find(key);
    if (!value) return std::nullopt;
    if (!value->is_number()) {
        fail(key, "expected number");
        return std::nullopt;
    }
    return value->get<double>();
}

bool JsonFieldReader::boolean(const char* key, bool fallback) const {
    const json* value = find(key);
    if (!value) return fallback;
    if (!value->is_boolean()) {
        fail(key, "expected boolean");
        return fallback;
    }
    return value->get<bool>();
}

std::vector<std::string> JsonFieldReader::stringList(const char* key) const {
    std::vector<std::string> result;
    const json* value = find(key);
    if (!value) return result;
    if (!value->is_array()) {
        fail(key, "expected array of strings");
        return result;
    }
    for (const auto& item : *value) {
        if (!item.is_string()) {
            fail(key, "expected array of strings");
            return {};
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

JsonFieldReader JsonFieldReader::child(const char* key) const {
    static const json kEmptyObject = json::object();
    std::string childPath = m_path.empty() ? std::string(key) : m_path + "." + key;
    const json* value = find(key);
    if (!value) {
        return JsonFieldReader(kEmptyObject, childPath, m_errors);
    }
    if (!value->is_object()) {
        fail(key, "expected object");
        return JsonFieldReader(kEmptyObject, childPath, m_errors);
    }
    return JsonFieldReader(*value, childPath, m_errors);
}

const json* JsonFieldReader::array(const char* key) const {
    const json* value = find(key);
    if (!value) return nullptr;
    if (!value->is_array()) {
        fail(key, "expected array");
        return nullptr;
    }
    return value;
}

} // namespace trialguard::infrastructure
