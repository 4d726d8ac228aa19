#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace arbiter::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS)
     *
     * Deterministic serialization used as the hash preimage for ledger entries.
     * Two documents with the same logical content produce the same bytes no
     * matter how their objects were built; any change at any depth changes them.
     *
     * - Object members sorted by the UTF-16 code units of their names, recursively
     * - No insignificant whitespace
     * - Minimal string escaping with lowercase \u00xx for control characters
     * - Numbers in ECMAScript shortest round-trip form (integral values without
     *   a fraction, exponent form outside [1e-6, 1e21))
     */
    class RFC8785Canonicalizer
    {
    public:
        /**
         * Canonicalize a JSON value.
         * Non-finite numbers have no JSON representation and are rejected.
         */
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /**
         * Parse JSON text and canonicalize it
         */
        static Result<std::string> canonicalize_string(const std::string &json_str);

        /** True if the value contains NaN or an infinity at any depth */
        static bool contains_non_finite(const nlohmann::json &value);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);

        static void serialize_string(const std::string &str, std::string &output);

        static Result<void> serialize_number(const nlohmann::json &num, std::string &output);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output);

        /** Member-name ordering: UTF-16 code unit comparison of UTF-8 input */
        static bool utf16_less(const std::string &a, const std::string &b);
    };

    /** Well-formed UTF-8: no overlong forms, surrogates or code points above U+10FFFF */
    bool is_valid_utf8(std::string_view text);

    /** Absent or null member -> nullopt; a non-string value throws nlohmann::json::type_error */
    std::optional<std::string> optional_string(const nlohmann::json &j, const char *key);

    nlohmann::json nullable(const std::optional<std::string> &value);

} // namespace arbiter::json
