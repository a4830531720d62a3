/**
 * @file equality.cpp
 * @brief Deep equality over normalized trees and text-level semantic equality
 */

#include "semjson/equality.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace semjson::equality {

namespace {

using value_t = Value::value_t;

// 2^63 and 2^64 as doubles; both are exactly representable.
constexpr double kInt64Bound = 9'223'372'036'854'775'808.0;
constexpr double kUint64Bound = 18'446'744'073'709'551'616.0;

/**
 * @brief Exact comparison of a floating value against an integer value
 *
 * The double is never rounded to the integer or vice versa, which keeps
 * number equality transitive (2^53 + 1 does not equal 2^53 through 2^53.0).
 */
[[nodiscard]] bool float_equals_integer(double d, const Value& integer)
{
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return false;
    }
    if (integer.type() == value_t::number_unsigned) {
        if (d < 0.0 || d >= kUint64Bound) {
            return false;
        }
        return static_cast<std::uint64_t>(d) == integer.get<std::uint64_t>();
    }
    if (d < -kInt64Bound || d >= kInt64Bound) {
        return false;
    }
    return static_cast<std::int64_t>(d) == integer.get<std::int64_t>();
}

[[nodiscard]] bool integers_equal(const Value& a, const Value& b)
{
    const bool a_unsigned = a.type() == value_t::number_unsigned;
    const bool b_unsigned = b.type() == value_t::number_unsigned;
    if (a_unsigned && b_unsigned) {
        return a.get<std::uint64_t>() == b.get<std::uint64_t>();
    }
    if (a_unsigned) {
        return std::cmp_equal(a.get<std::uint64_t>(), b.get<std::int64_t>());
    }
    if (b_unsigned) {
        return std::cmp_equal(a.get<std::int64_t>(), b.get<std::uint64_t>());
    }
    return a.get<std::int64_t>() == b.get<std::int64_t>();
}

[[nodiscard]] bool numbers_equal(const Value& a, const Value& b)
{
    const bool a_float = a.is_number_float();
    const bool b_float = b.is_number_float();
    if (a_float && b_float) {
        return a.get<double>() == b.get<double>();
    }
    if (a_float) {
        return float_equals_integer(a.get<double>(), b);
    }
    if (b_float) {
        return float_equals_integer(b.get<double>(), a);
    }
    return integers_equal(a, b);
}

// object_t is ordered by key, so equal objects line up entry by entry.
[[nodiscard]] bool objects_equal(const Value& a, const Value& b)
{
    const auto& lhs = a.get_ref<const Value::object_t&>();
    const auto& rhs = b.get_ref<const Value::object_t&>();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto r = rhs.begin();
    for (const auto& [key, child] : lhs) {
        if (key != r->first || !values_equal(child, r->second)) {
            return false;
        }
        ++r;
    }
    return true;
}

[[nodiscard]] Error with_side(Error error, std::string_view side)
{
    error.message = std::string(side) + ": " + error.message;
    return error;
}

}  // namespace

bool values_equal(const Value& a, const Value& b)
{
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
        case value_t::null:
        case value_t::discarded:
            return true;
        case value_t::boolean:
            return a.get<bool>() == b.get<bool>();
        case value_t::string:
            return a.get_ref<const std::string&>() == b.get_ref<const std::string&>();
        case value_t::binary:
            return a == b;
        case value_t::object:
            return objects_equal(a, b);
        case value_t::array:
            return arrays_equal(a, b);
        case value_t::number_integer:
        case value_t::number_unsigned:
        case value_t::number_float:
            return numbers_equal(a, b);
    }
    return false;
}

bool equal(const semjson::Normalized& a, const semjson::Normalized& b)
{
    if (!a || !b) {
        return !a && !b;
    }
    return values_equal(*a, *b);
}

semjson::Result<bool> compare_texts(std::string_view a,
                                    std::string_view b,
                                    const normalize::NormalizationPolicy& policy,
                                    const value::ParseOptions& options)
{
    auto left = value::parse(a, options);
    if (!left) {
        return std::unexpected(with_side(std::move(left.error()), "left"));
    }
    auto right = value::parse(b, options);
    if (!right) {
        return std::unexpected(with_side(std::move(right.error()), "right"));
    }
    return equal(normalize::normalize(*left, policy), normalize::normalize(*right, policy));
}

bool semantic_equal(std::string_view a,
                    std::string_view b,
                    const normalize::NormalizationPolicy& policy,
                    const value::ParseOptions& options)
{
    return compare_texts(a, b, policy, options).value_or(false);
}

SemanticComparator::SemanticComparator(normalize::NormalizationPolicy policy,
                                       value::ParseOptions options)
    : m_policy(std::move(policy))
    , m_options(options)
{}

bool SemanticComparator::semantic_equal(std::string_view a, std::string_view b) const
{
    return equality::semantic_equal(a, b, m_policy, m_options);
}

semjson::Result<bool> SemanticComparator::compare_texts(std::string_view a,
                                                        std::string_view b) const
{
    return equality::compare_texts(a, b, m_policy, m_options);
}

}  // namespace semjson::equality
