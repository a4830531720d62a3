/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "semjson/canonical_json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace semjson::canonical {

namespace {

using value_t = Value::value_t;

constexpr double kInt64Bound = 9'223'372'036'854'775'808.0;

/**
 * @brief Drop the '+' sign and leading zeros of an exponent ("1e+07" -> "1e7")
 */
[[nodiscard]] std::string minimize_exponent(std::string text)
{
    const auto e = text.find_first_of("eE");
    if (e == std::string::npos) {
        return text;
    }
    std::string mantissa = text.substr(0, e);
    std::string_view exponent = std::string_view(text).substr(e + 1);
    bool negative = false;
    if (!exponent.empty() && (exponent.front() == '+' || exponent.front() == '-')) {
        negative = exponent.front() == '-';
        exponent.remove_prefix(1);
    }
    while (exponent.size() > 1 && exponent.front() == '0') {
        exponent.remove_prefix(1);
    }
    return mantissa + "e" + (negative ? "-" : "") + std::string(exponent);
}

[[nodiscard]] semjson::Result<std::string> format_float(double d)
{
    if (!std::isfinite(d)) {
        return std::unexpected(
            Error::make("NonFiniteNumber", "NaN and infinity have no JSON representation"));
    }
    if (std::trunc(d) == d && d >= -kInt64Bound && d < kInt64Bound) {
        return std::to_string(static_cast<std::int64_t>(d));
    }
    // nlohmann::json prints the shortest text that reads back as the same double
    return minimize_exponent(Value(d).dump());
}

[[nodiscard]] semjson::VoidResult append_string(std::string& out, const std::string& s)
{
    try {
        out += Value(s).dump(-1, ' ', false, Value::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("EncodeError", ex.what()));
    }
    return {};
}

[[nodiscard]] semjson::VoidResult append_canonical(std::string& out, const Value& v);

[[nodiscard]] semjson::VoidResult append_object(std::string& out, const Value& object)
{
    // Get entries and sort them by key bytes
    const auto& entries = object.get_ref<const Value::object_t&>();
    std::vector<const Value::object_t::value_type*> sorted;
    sorted.reserve(entries.size());
    for (const auto& entry : entries) {
        sorted.push_back(&entry);
    }
    std::ranges::sort(sorted, std::less<>{}, [](const auto* entry) -> const std::string& {
        return entry->first;
    });

    out += '{';
    bool first = true;
    for (const auto* entry : sorted) {
        if (!first) {
            out += ',';
        }
        first = false;
        if (auto result = append_string(out, entry->first); !result) {
            return result;
        }
        out += ':';
        if (auto result = append_canonical(out, entry->second); !result) {
            return result;
        }
    }
    out += '}';
    return {};
}

[[nodiscard]] semjson::VoidResult append_array(std::string& out, const Value& array)
{
    out += '[';
    bool first = true;
    for (const auto& elem : array) {
        if (!first) {
            out += ',';
        }
        first = false;
        if (auto result = append_canonical(out, elem); !result) {
            return result;
        }
    }
    out += ']';
    return {};
}

semjson::VoidResult append_canonical(std::string& out, const Value& v)
{
    switch (v.type()) {
        case value_t::null:
            out += "null";
            return {};
        case value_t::boolean:
            out += v.get<bool>() ? "true" : "false";
            return {};
        case value_t::number_integer:
            out += std::to_string(v.get<std::int64_t>());
            return {};
        case value_t::number_unsigned:
            out += std::to_string(v.get<std::uint64_t>());
            return {};
        case value_t::number_float: {
            auto text = format_float(v.get<double>());
            if (!text) {
                return std::unexpected(text.error());
            }
            out += *text;
            return {};
        }
        case value_t::string:
            return append_string(out, v.get_ref<const std::string&>());
        case value_t::array:
            return append_array(out, v);
        case value_t::object:
            return append_object(out, v);
        case value_t::binary:
        case value_t::discarded:
            break;
    }
    return std::unexpected(
        Error::make("EncodeError", std::string("Value has no JSON text form: ") + v.type_name()));
}

}  // namespace

semjson::Result<std::string> canonicalize(std::string_view text, const value::ParseOptions& options)
{
    auto parsed = value::parse(text, options);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return canonicalize_value(*parsed);
}

semjson::Result<std::string> canonicalize_value(const Value& v)
{
    std::string out;
    if (auto result = append_canonical(out, v); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

}  // namespace semjson::canonical
