/**
 * @file JsonFieldReader.hpp
 * @brief Lenient typed accessors over a JSON object that record type errors instead of coercing.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace trialguard::infrastructure {

/**
 * @class JsonFieldReader
 * @brief Reads fields of one JSON object on behalf of a boundary adapter.
 *
 * A missing or null field yields the caller's default. A field that is present
 * with the wrong type yields the default too, and appends "<path>.<key>: <reason>"
 * to the shared error list so the adapter can reject the whole document.
 */
class JsonFieldReader {
public:
    JsonFieldReader(const nlohmann::json& object, std::string path, std::vector<std::string>& errors);

    /** @brief True if @p key is present and not null. */
    bool has(const char* key) const;

    std::string string(const char* key, const std::string& fallback = "") const;
    std::optional<std::string> optionalString(const char* key) const;

    int integer(const char* key, int fallback = 0) const;
    std::optional<int> optionalInteger(const char* key) const;

    double number(const char* key, double fallback) const;
    std::optional<double> optionalNumber(const char* key) const;

    bool boolean(const char* key, bool fallback = false) const;

    std::vector<std::string> stringList(const char* key) const;

    /** @brief Nested object reader; an absent section reads as an empty object. */
    JsonFieldReader child(const char* key) const;

    /** @brief Raw access for arrays of objects. Returns nullptr when absent or not an array. */
    const nlohmann::json* array(const char* key) const;

    /**
     * @brief Reads a closed enumeration from its string label.
     * @param parse Callable `std::optional<T>(const std::string&)`.
     */
    template <typename T, typename Parser>
    std::optional<T> enumeration(const char* key, Parser parse) const {
        auto label = optionalString(key);
        if (!label) return std::nullopt;
        auto value = parse(*label);
        if (!value) {
            fail(key, "unrecognized value '" + *label + "'");
        }
        return value;
    }

    /** @brief Records an error against @p key. */
    void fail(const char* key, const std::string& reason) const;

    const std::string& path() const { return m_path; }

private:
    const nlohmann::json* find(const char* key) const;
    std::optional<long long> readIntegral(const char* key) const;

    const nlohmann::json& m_object;
    std::string m_path;
    std::vector<std::string>& m_errors;
};

} // namespace trialguard::infrastructure
