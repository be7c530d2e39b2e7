#pragma once

#include "simdjson.h"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace optgate::json {

    // Function: parse
    // Description: Parses a JSON document with simdjson's DOM API, copying into a
    //              reusable padded buffer (simdjson requirement) to avoid allocation.
    // Inputs: parser - owns the resulting DOM; the element is valid until its next parse.
    // Outputs: simdjson::SUCCESS or the parse error.
    inline simdjson::error_code parse(simdjson::dom::parser& parser, std::string_view text, simdjson::dom::element& out) {
        static thread_local std::vector<char> buffer;
        if (buffer.size() < text.size() + simdjson::SIMDJSON_PADDING) {
            buffer.resize(text.size() + simdjson::SIMDJSON_PADDING);
        }
        std::memcpy(buffer.data(), text.data(), text.size());
        std::memset(buffer.data() + text.size(), 0, simdjson::SIMDJSON_PADDING);
        return parser.parse(buffer.data(), text.size(), false).get(out);
    }

    // Numbers, or strings holding a number ("150.25"). Empty strings, null and
    // everything else give nullopt.
    inline std::optional<double> as_number(simdjson::dom::element value) {
        switch (value.type()) {
            case simdjson::dom::element_type::DOUBLE: {
                double d = 0.0;
                if (value.get(d) != simdjson::SUCCESS) return std::nullopt;
                return d;
            }
            case simdjson::dom::element_type::INT64: {
                int64_t i = 0;
                if (value.get(i) != simdjson::SUCCESS) return std::nullopt;
                return static_cast<double>(i);
            }
            case simdjson::dom::element_type::UINT64: {
                uint64_t u = 0;
                if (value.get(u) != simdjson::SUCCESS) return std::nullopt;
                return static_cast<double>(u);
            }
            case simdjson::dom::element_type::STRING: {
                std::string_view text;
                if (value.get(text) != simdjson::SUCCESS || text.empty()) return std::nullopt;
                std::string buf(text);
                char* end = nullptr;
                double d = std::strtod(buf.c_str(), &end);
                if (end == buf.c_str() || !std::isfinite(d)) return std::nullopt;
                return d;
            }
            default:
                return std::nullopt;
        }
    }

    // Strings as-is, numbers rendered as text. Empty strings give nullopt.
    inline std::optional<std::string> as_string(simdjson::dom::element value) {
        switch (value.type()) {
            case simdjson::dom::element_type::STRING: {
                std::string_view text;
                if (value.get(text) != simdjson::SUCCESS || text.empty()) return std::nullopt;
                return std::string(text);
            }
            case simdjson::dom::element_type::INT64:
            case simdjson::dom::element_type::UINT64:
            case simdjson::dom::element_type::DOUBLE: {
                auto number = as_number(value);
                if (!number) return std::nullopt;
                if (*number == std::floor(*number) && std::fabs(*number) < 1e15) {
                    return std::to_string(static_cast<int64_t>(*number));
                }
                return std::to_string(*number);
            }
            default:
                return std::nullopt;
        }
    }

    inline std::optional<simdjson::dom::element> field(simdjson::dom::object object, std::string_view key) {
        simdjson::dom::element value;
        if (object[key].get(value) != simdjson::SUCCESS) return std::nullopt;
        if (value.is_null()) return std::nullopt;
        return value;
    }

    inline std::optional<std::string> string_field(simdjson::dom::object object, std::string_view key) {
        auto value = field(object, key);
        if (!value) return std::nullopt;
        return as_string(*value);
    }

    inline std::optional<double> number_field(simdjson::dom::object object, std::string_view key) {
        auto value = field(object, key);
        if (!value) return std::nullopt;
        return as_number(*value);
    }

    // Element rendered back to compact JSON text.
    inline std::string to_text(simdjson::dom::element value) {
        return simdjson::to_string(value);
    }

}
