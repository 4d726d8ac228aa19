#include "arbiter/json_canonicalization.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <vector>

namespace arbiter::json
{

    namespace
    {
        std::u16string to_utf16_units(const std::string &s)
        {
            std::u16string out;
            out.reserve(s.size());
            std::size_t i = 0;
            while (i < s.size())
            {
                auto lead = static_cast<unsigned char>(s[i]);
                char32_t cp = lead;
                std::size_t len = 1;
                if (lead >= 0xF0 && i + 3 < s.size())
                {
                    cp = ((lead & 0x07u) << 18) |
                         ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 12) |
                         ((static_cast<unsigned char>(s[i + 2]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(s[i + 3]) & 0x3Fu);
                    len = 4;
                }
                else if (lead >= 0xE0 && i + 2 < s.size())
                {
                    cp = ((lead & 0x0Fu) << 12) |
                         ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(s[i + 2]) & 0x3Fu);
                    len = 3;
                }
                else if (lead >= 0xC0 && i + 1 < s.size())
                {
                    cp = ((lead & 0x1Fu) << 6) |
                         (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
                    len = 2;
                }

                if (cp >= 0x10000)
                {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                }
                else
                {
                    out.push_back(static_cast<char16_t>(cp));
                }
                i += len;
            }
            return out;
        }

        // ECMAScript Number::toString applied to the shortest round-trip digits
        std::string format_es6_double(double value)
        {
            if (value == 0.0)
                return "0"; // includes -0

            char buf[64];
            auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
            std::string_view sci(buf, static_cast<std::size_t>(end - buf));

            std::string out;
            if (sci.front() == '-')
            {
                out += '-';
                sci.remove_prefix(1);
            }

            auto epos = sci.find('e');
            std::string digits;
            for (char c : sci.substr(0, epos))
            {
                if (c != '.')
                    digits += c;
            }

            auto exp_text = sci.substr(epos + 1);
            bool exp_negative = exp_text.front() == '-';
            if (exp_text.front() == '-' || exp_text.front() == '+')
                exp_text.remove_prefix(1);
            int exponent = 0;
            std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exponent);
            if (exp_negative)
                exponent = -exponent;

            const int k = static_cast<int>(digits.size());
            const int n = exponent + 1;

            if (k <= n && n <= 21)
            {
                out += digits;
                out.append(static_cast<std::size_t>(n - k), '0');
            }
            else if (0 < n && n <= 21)
            {
                out += digits.substr(0, static_cast<std::size_t>(n));
                out += '.';
                out += digits.substr(static_cast<std::size_t>(n));
            }
            else if (-6 < n && n <= 0)
            {
                out += "0.";
                out.append(static_cast<std::size_t>(-n), '0');
                out += digits;
            }
            else
            {
                out += digits.front();
                if (k > 1)
                {
                    out += '.';
                    out += digits.substr(1);
                }
                out += 'e';
                out += (n - 1) < 0 ? '-' : '+';
                out += std::to_string(std::abs(n - 1));
            }
            return out;
        }
    } // namespace

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output); !res)
            return std::unexpected(res.error());
        return output;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_str);
            return canonicalize(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(ArbiterError::parsing(
                std::format("JSON parse error: {}", e.what())));
        }
    }

    bool RFC8785Canonicalizer::contains_non_finite(const nlohmann::json &value)
    {
        if (value.is_number_float())
            return !std::isfinite(value.get<double>());
        if (value.is_structured())
        {
            return std::any_of(value.begin(), value.end(),
                               [](const nlohmann::json &child) { return contains_non_finite(child); });
        }
        return false;
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return serialize_number(value, output);

        case nlohmann::json::value_t::string:
            serialize_string(value.get_ref<const std::string &>(), output);
            return {};

        case nlohmann::json::value_t::array:
            return serialize_array(value, output);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output);

        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
        }
        return std::unexpected(ArbiterError::invalid_input("Value has no canonical JSON form"));
    }

    void RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        output += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                    output += std::format("\\u{:04x}", static_cast<int>(ch));
                else
                    output += static_cast<char>(ch);
                break;
            }
        }
        output += '"';
    }

    Result<void> RFC8785Canonicalizer::serialize_number(const nlohmann::json &num, std::string &output)
    {
        if (num.is_number_unsigned())
        {
            output += std::to_string(num.get<uint64_t>());
            return {};
        }
        if (num.is_number_integer())
        {
            output += std::to_string(num.get<int64_t>());
            return {};
        }

        double value = num.get<double>();
        if (!std::isfinite(value))
        {
            return std::unexpected(ArbiterError::invalid_input("NaN and Infinity are not valid JSON numbers"));
        }
        output += format_es6_double(value);
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output)
    {
        std::vector<const std::string *> keys;
        keys.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
        {
            keys.push_back(&it.key());
        }
        std::sort(keys.begin(), keys.end(),
                  [](const std::string *a, const std::string *b) { return utf16_less(*a, *b); });

        output += '{';
        bool first = true;
        for (const auto *key : keys)
        {
            if (!first)
                output += ',';
            first = false;

            serialize_string(*key, output);
            output += ':';
            if (auto res = serialize_value(obj.at(*key), output); !res)
                return res;
        }
        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output)
    {
        output += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
                output += ',';
            first = false;
            if (auto res = serialize_value(item, output); !res)
                return res;
        }
        output += ']';
        return {};
    }

    bool RFC8785Canonicalizer::utf16_less(const std::string &a, const std::string &b)
    {
        return to_utf16_units(a) < to_utf16_units(b);
    }

    // ========== Helpers ==========

    bool is_valid_utf8(std::string_view text)
    {
        std::size_t i = 0;
        while (i < text.size())
        {
            auto lead = static_cast<unsigned char>(text[i]);
            std::size_t len;
            char32_t cp;
            if (lead < 0x80)
            {
                ++i;
                continue;
            }
            else if ((lead & 0xE0) == 0xC0)
            {
                len = 2;
                cp = lead & 0x1Fu;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                len = 3;
                cp = lead & 0x0Fu;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                len = 4;
                cp = lead & 0x07u;
            }
            else
            {
                return false;
            }

            if (i + len > text.size())
                return false;
            for (std::size_t k = 1; k < len; ++k)
            {
                auto cont = static_cast<unsigned char>(text[i + k]);
                if ((cont & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cont & 0x3Fu);
            }

            static constexpr char32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
            if (cp < kMinForLength[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            i += len;
        }
        return true;
    }

    std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        return it->get<std::string>();
    }

    nlohmann::json nullable(const std::optional<std::string> &value)
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

} // namespace arbiter::json
