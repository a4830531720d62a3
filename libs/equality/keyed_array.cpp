/**
 * @file keyed_array.cpp
 * @brief Order-insensitive comparison of keyed arrays
 *
 * Parameter lists and similar collections are maps serialized as arrays of
 * objects carrying a "key" field; their element order is an API detail.
 * Arrays without that shape (coordinates, pipelines) stay order-sensitive.
 */

#include "semjson/equality.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace semjson::equality {

namespace {

[[nodiscard]] const Value& key_of(const Value& element)
{
    return element.at(std::string{kKeyField});
}

[[nodiscard]] bool has_scalar_key(const Value& element)
{
    if (!element.is_object()) {
        return false;
    }
    auto it = element.find(std::string{kKeyField});
    return it != element.end() && value::is_scalar(*it);
}

// Greedy matching is exact here: values_equal is an equivalence relation, so
// any unmatched equal partner is interchangeable with the one taken.
[[nodiscard]] bool keyed_multisets_equal(const Value::array_t& lhs, const Value::array_t& rhs)
{
    std::vector<bool> matched(rhs.size(), false);
    for (const auto& element : lhs) {
        const Value& key = key_of(element);
        bool found = false;
        for (std::size_t i = 0; i < rhs.size(); ++i) {
            if (matched[i] || !values_equal(key, key_of(rhs[i]))) {
                continue;
            }
            if (values_equal(element, rhs[i])) {
                matched[i] = true;
                found = true;
                break;
            }
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

}  // namespace

bool is_keyed_array(const Value& v)
{
    if (!v.is_array()) {
        return false;
    }
    return std::ranges::all_of(v.get_ref<const Value::array_t&>(), has_scalar_key);
}

bool arrays_equal(const Value& a, const Value& b)
{
    if (!a.is_array() || !b.is_array()) {
        return false;
    }
    const auto& lhs = a.get_ref<const Value::array_t&>();
    const auto& rhs = b.get_ref<const Value::array_t&>();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    if (is_keyed_array(a) && is_keyed_array(b)) {
        return keyed_multisets_equal(lhs, rhs);
    }
    return std::ranges::equal(lhs, rhs, values_equal);
}

}  // namespace semjson::equality
