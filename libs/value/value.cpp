/**
 * @file value.cpp
 * @brief JSON value model on top of nlohmann::json
 *
 * The nesting limit is enforced from the parser callback, so an over-deep
 * document is rejected as soon as the limit is crossed instead of after the
 * whole tree has been built.
 */

#include "semjson/value.hpp"

#include <algorithm>
#include <string>

namespace semjson::value {

namespace {

// Thrown from the parser callback and caught in parse(); never escapes.
struct DepthLimitReached
{
    std::size_t depth;
};

[[nodiscard]] bool opens_container(Value::parse_event_t event) noexcept
{
    return event == Value::parse_event_t::object_start
           || event == Value::parse_event_t::array_start;
}

}  // namespace

semjson::Result<Value> parse(std::string_view text, const ParseOptions& options)
{
    const std::size_t max_depth = std::min(options.max_depth, kMaxSupportedDepth);

    // `depth` counts the containers already open around the event.
    const Value::parser_callback_t guard =
        [max_depth](int depth, Value::parse_event_t event, Value& /*parsed*/) {
            if (opens_container(event)) {
                const auto level = static_cast<std::size_t>(depth) + 1UZ;
                if (level > max_depth) {
                    throw DepthLimitReached{level};
                }
            }
            return true;
        };

    try {
        return Value::parse(text.begin(), text.end(), guard, /*allow_exceptions=*/true,
                            /*ignore_comments=*/false);
    } catch (const DepthLimitReached& limit) {
        return std::unexpected(
            Error::make(kDepthExceededCode,
                        "JSON nesting depth " + std::to_string(limit.depth)
                            + " exceeds the limit of " + std::to_string(max_depth)));
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make_at(kParseErrorCode, ex.what(), ex.byte));
    } catch (const nlohmann::json::exception& ex) {
        // e.g. out_of_range.406 for number literals that overflow a double
        return std::unexpected(Error::make(kParseErrorCode, ex.what()));
    }
}

std::string render(const Value& v)
{
    return v.dump(-1, ' ', false, Value::error_handler_t::replace);
}

bool is_scalar(const Value& v) noexcept
{
    return v.is_boolean() || v.is_number() || v.is_string();
}

}  // namespace semjson::value
