/**
 * @file Format.cpp
 * @brief Implementation of printf-style Value formatting
 */

#include "patchwork/Format.hpp"
#include "patchwork/Errors.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace patchwork {

namespace {
    struct Directive {
        std::string flags;
        int width = -1;
        int precision = -1;
        char verb = '\0';

        bool has_flag(char f) const {
            return flags.find(f) != std::string::npos;
        }
    };

    const std::string kFlags = "-+ 0#";
    const std::string kVerbs = "svdfegqtxX";

    constexpr int kMaxWidth = 4096;

    /**
     * @brief Read a width or precision; values above kMaxWidth are rejected
     */
    int read_number(const std::string& format, std::size_t& pos) {
        int n = 0;
        while (pos < format.size() && format[pos] >= '0' && format[pos] <= '9') {
            n = n * 10 + (format[pos] - '0');
            if (n > kMaxWidth) {
                throw FormatError("format \"" + format + "\" has a width or precision above " +
                                  std::to_string(kMaxWidth));
            }
            ++pos;
        }
        return n;
    }

    /**
     * @brief Parse one directive; pos points just past the '%'
     */
    Directive parse_directive(const std::string& format, std::size_t& pos) {
        Directive d;
        while (pos < format.size() && kFlags.find(format[pos]) != std::string::npos) {
            d.flags += format[pos++];
        }
        if (pos < format.size() && format[pos] >= '0' && format[pos] <= '9') {
            d.width = read_number(format, pos);
        }
        if (pos < format.size() && format[pos] == '.') {
            ++pos;
            d.precision = read_number(format, pos);
        }
        if (pos >= format.size()) {
            throw FormatError("format \"" + format + "\" ends with an incomplete directive");
        }
        d.verb = format[pos++];
        if (kVerbs.find(d.verb) == std::string::npos) {
            throw FormatError("format \"" + format + "\" has unknown directive %" +
                              std::string(1, d.verb));
        }
        return d;
    }

    std::string spec_prefix(const Directive& d, const std::string& drop_flags = "") {
        std::string spec = "%";
        for (char f : d.flags) {
            if (drop_flags.find(f) == std::string::npos) spec += f;
        }
        if (d.width >= 0) spec += std::to_string(d.width);
        if (d.precision >= 0) spec += "." + std::to_string(d.precision);
        return spec;
    }

    template <typename T>
    std::string c_format(const std::string& spec, T value) {
        const int size = std::snprintf(nullptr, 0, spec.c_str(), value);
        if (size < 0) {
            throw FormatError("cannot render directive " + spec);
        }
        std::string out(static_cast<std::size_t>(size) + 1, '\0');
        std::snprintf(&out[0], out.size(), spec.c_str(), value);
        out.resize(static_cast<std::size_t>(size));
        return out;
    }

    std::string pad(std::string text, const Directive& d, bool numeric) {
        if (d.width < 0 || text.size() >= static_cast<std::size_t>(d.width)) {
            return text;
        }
        const std::size_t fill = static_cast<std::size_t>(d.width) - text.size();
        if (d.has_flag('-')) {
            return text + std::string(fill, ' ');
        }
        if (numeric && d.has_flag('0')) {
            std::size_t sign = 0;
            if (!text.empty() && (text[0] == '-' || text[0] == '+' || text[0] == ' ')) sign = 1;
            if (text.compare(sign, 2, "0x") == 0 || text.compare(sign, 2, "0X") == 0) sign += 2;
            return text.substr(0, sign) + std::string(fill, '0') + text.substr(sign);
        }
        return std::string(fill, ' ') + text;
    }

    std::string describe(const Value& v) {
        return type_name(v) + "=" + to_display_string(v);
    }

    std::string render_integer(const Directive& d, const Value& v) {
        if (!v.is_number_integer()) {
            throw FormatError("%" + std::string(1, d.verb) +
                              " requires an integer value, got " + describe(v));
        }

        if (d.verb == 'd') {
            if (v.is_number_unsigned()) {
                return c_format(spec_prefix(d, "#") + "llu",
                                static_cast<unsigned long long>(v.get<std::uint64_t>()));
            }
            return c_format(spec_prefix(d, "#") + "lld",
                            static_cast<long long>(v.get<std::int64_t>()));
        }

        // %x / %X: sign and magnitude, so negatives read as -ff rather than
        // as two's complement
        bool negative = false;
        unsigned long long magnitude = 0;
        if (v.is_number_unsigned()) {
            magnitude = v.get<std::uint64_t>();
        } else {
            const std::int64_t i = v.get<std::int64_t>();
            negative = i < 0;
            magnitude = negative ? 0ULL - static_cast<unsigned long long>(i)
                                 : static_cast<unsigned long long>(i);
        }
        std::string digits = c_format(d.verb == 'x' ? "%llx" : "%llX", magnitude);
        if (d.precision >= 0 && digits.size() < static_cast<std::size_t>(d.precision)) {
            digits.insert(0, static_cast<std::size_t>(d.precision) - digits.size(), '0');
        }
        if (d.has_flag('#')) {
            digits.insert(0, d.verb == 'x' ? "0x" : "0X");
        }
        if (negative) {
            digits.insert(0, "-");
        } else if (d.has_flag('+')) {
            digits.insert(0, "+");
        } else if (d.has_flag(' ')) {
            digits.insert(0, " ");
        }
        return pad(digits, d, true);
    }

    std::string render_hex_string(const Directive& d, const std::string& s) {
        const char* alphabet = d.verb == 'x' ? "0123456789abcdef" : "0123456789ABCDEF";
        std::string out;
        out.reserve(s.size() * 2);
        for (unsigned char c : s) {
            out += alphabet[c >> 4];
            out += alphabet[c & 0x0F];
        }
        return pad(out, d, false);
    }

    std::string render_float(const Directive& d, const Value& v) {
        if (!v.is_number()) {
            throw FormatError("%" + std::string(1, d.verb) +
                              " requires a numeric value, got " + describe(v));
        }
        return c_format(spec_prefix(d) + std::string(1, d.verb), v.get<double>());
    }

    std::string render_text(const Directive& d, std::string text) {
        if (d.precision >= 0 && text.size() > static_cast<std::size_t>(d.precision)) {
            text.resize(static_cast<std::size_t>(d.precision));
        }
        return pad(std::move(text), d, false);
    }

    std::string render(const Directive& d, const Value& v) {
        switch (d.verb) {
            case 's':
            case 'v':
                return render_text(d, to_display_string(v));
            case 'q':
                return pad(Value(to_display_string(v)).dump(), d, false);
            case 't':
                if (!v.is_boolean()) {
                    throw FormatError("%t requires a boolean value, got " + describe(v));
                }
                return pad(v.get<bool>() ? "true" : "false", d, false);
            case 'd':
                return render_integer(d, v);
            case 'x':
            case 'X':
                if (v.is_string()) return render_hex_string(d, v.get<std::string>());
                return render_integer(d, v);
            default:
                return render_float(d, v);
        }
    }
}

std::size_t count_directives(const std::string& format) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < format.size()) {
        if (format[pos++] != '%') continue;
        if (pos < format.size() && format[pos] == '%') {
            ++pos;
            continue;
        }
        parse_directive(format, pos);
        ++count;
    }
    return count;
}

std::string format_values(const std::string& format, const std::vector<Value>& values) {
    const std::size_t expected = count_directives(format);
    if (expected != values.size()) {
        throw FormatError("format \"" + format + "\" expects " + std::to_string(expected) +
                          " value(s), got " + std::to_string(values.size()));
    }

    std::string out;
    std::size_t next = 0;
    std::size_t pos = 0;
    while (pos < format.size()) {
        const char c = format[pos++];
        if (c != '%') {
            out += c;
            continue;
        }
        if (format[pos] == '%') {
            out += '%';
            ++pos;
            continue;
        }
        const Directive d = parse_directive(format, pos);
        out += render(d, values[next++]);
    }
    return out;
}

} // namespace patchwork
