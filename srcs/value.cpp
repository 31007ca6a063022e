#include "value.hpp"
#include "utils.hpp"
#include <cerrno>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <limits>
#include <type_traits>

namespace tagmenu {

namespace {

template <ValueKind K, typename T>
ParsedValue make(T v) {
    return ParsedValue(ParsedValue::Storage(std::in_place_index<static_cast<std::size_t>(K)>, std::move(v)));
}

bool all_digits(const std::string& s, size_t from, size_t to) {
    if (from >= to) return false;
    for (size_t i = from; i < to; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Optional sign followed by decimal digits, value within [lo, hi].
bool parse_integral(const std::string& text, long long lo, long long hi, long long& out) {
    const std::string t = trim(text);
    size_t start = (!t.empty() && (t[0] == '+' || t[0] == '-')) ? 1 : 0;
    if (!all_digits(t, start, t.size())) return false;

    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(t.c_str(), &end, 10);
    if (errno == ERANGE || end != t.c_str() + t.size()) return false;
    if (v < lo || v > hi) return false;
    out = v;
    return true;
}

template <typename F, typename Conv>
bool parse_floating(const std::string& text, Conv conv, F& out) {
    const std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    F v = conv(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return false;
    // overflow; underflow to a denormal or zero is accepted
    if (errno == ERANGE && (v == std::numeric_limits<F>::infinity() || v == -std::numeric_limits<F>::infinity())) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

const char* kindName(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::None:       return "none";
        case ValueKind::Text:       return "text";
        case ValueKind::Integer:    return "integer";
        case ValueKind::Long:       return "long";
        case ValueKind::Short:      return "short";
        case ValueKind::BigInteger: return "big-integer";
        case ValueKind::Double:     return "double";
        case ValueKind::Float:      return "float";
        case ValueKind::BigDecimal: return "big-decimal";
        case ValueKind::Boolean:    return "boolean";
        case ValueKind::Byte:       return "byte";
    }
    return "unknown";
}

std::optional<BigInteger> BigInteger::parse(const std::string& text) {
    const std::string t = trim(text);
    bool neg = !t.empty() && t[0] == '-';
    size_t start = (!t.empty() && (t[0] == '+' || t[0] == '-')) ? 1 : 0;
    if (!all_digits(t, start, t.size())) return std::nullopt;

    size_t first = t.find_first_not_of('0', start);
    if (first == std::string::npos) return BigInteger("0");
    std::string digits = t.substr(first);
    return BigInteger(neg ? "-" + digits : digits);
}

std::optional<BigDecimal> BigDecimal::parse(const std::string& text) {
    const std::string t = trim(text);
    size_t i = 0;
    std::string sign;
    if (i < t.size() && (t[i] == '+' || t[i] == '-')) {
        if (t[i] == '-') sign = "-";
        ++i;
    }

    std::string digits;
    long fraction = 0;
    bool seenPoint = false;
    for (; i < t.size(); ++i) {
        char c = t[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
            if (seenPoint) ++fraction;
        } else if (c == '.' && !seenPoint) {
            seenPoint = true;
        } else {
            break;
        }
    }
    if (digits.empty()) return std::nullopt;

    long exponent = 0;
    if (i < t.size()) {
        if (t[i] != 'e' && t[i] != 'E') return std::nullopt;
        long long e = 0;
        if (!parse_integral(t.substr(i + 1), -kMaxDecimalExponent, kMaxDecimalExponent, e)) return std::nullopt;
        if (t.substr(i + 1) != trim(t.substr(i + 1))) return std::nullopt;
        exponent = static_cast<long>(e);
    }

    long long scale = static_cast<long long>(fraction) - exponent;
    if (scale < INT_MIN || scale > INT_MAX) return std::nullopt;

    std::optional<BigInteger> unscaled = BigInteger::parse(sign + digits);
    if (!unscaled) return std::nullopt;
    return BigDecimal(*unscaled, static_cast<long>(scale));
}

std::string BigDecimal::str() const {
    const std::string& u = _unscaled.str();
    if (_scale <= 0) {
        if (u == "0") return u;
        return u + std::string(static_cast<size_t>(-_scale), '0');
    }
    bool neg = _unscaled.negative();
    std::string digits = neg ? u.substr(1) : u;
    size_t scale = static_cast<size_t>(_scale);
    if (digits.size() <= scale) {
        digits.insert(0, scale + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - scale, ".");
    return neg ? "-" + digits : digits;
}

std::ostream& operator<<(std::ostream& os, const BigInteger& v) { return os << v.str(); }
std::ostream& operator<<(std::ostream& os, const BigDecimal& v) { return os << v.str(); }

std::ostream& operator<<(std::ostream& os, const ParsedValue& v) {
    switch (v.kind()) {
        case ValueKind::None:    return os << "none";
        case ValueKind::Text:    return os << '"' << *v.get<std::string>() << '"';
        case ValueKind::Boolean: return os << (*v.get<bool>() ? "true" : "false");
        case ValueKind::Byte:    return os << static_cast<int>(*v.get<std::int8_t>());
        default: break;
    }
    std::visit([&os](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (!std::is_same_v<T, std::monostate>) os << x;
    }, v.storage());
    return os;
}

bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept {
    if (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b) return false;
    if (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b) return false;
    out = a + b;
    return true;
}

ParsedValue parseValue(ValueKind kind, const std::string& text) {
    long long n = 0;
    switch (kind) {
        case ValueKind::Text:
            return make<ValueKind::Text>(text);
        case ValueKind::Integer:
            if (parse_integral(text, std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::int32_t>::max(), n))
                return make<ValueKind::Integer>(static_cast<std::int32_t>(n));
            break;
        case ValueKind::Long:
            if (parse_integral(text, std::numeric_limits<std::int64_t>::min(), std::numeric_limits<std::int64_t>::max(), n))
                return make<ValueKind::Long>(static_cast<std::int64_t>(n));
            break;
        case ValueKind::Short:
            if (parse_integral(text, std::numeric_limits<std::int16_t>::min(), std::numeric_limits<std::int16_t>::max(), n))
                return make<ValueKind::Short>(static_cast<std::int16_t>(n));
            break;
        case ValueKind::Byte:
            if (parse_integral(text, std::numeric_limits<std::int8_t>::min(), std::numeric_limits<std::int8_t>::max(), n))
                return make<ValueKind::Byte>(static_cast<std::int8_t>(n));
            break;
        case ValueKind::BigInteger:
            if (auto v = BigInteger::parse(text)) return make<ValueKind::BigInteger>(*v);
            break;
        case ValueKind::BigDecimal:
            if (auto v = BigDecimal::parse(text)) return make<ValueKind::BigDecimal>(*v);
            break;
        case ValueKind::Double: {
            double d = 0;
            if (parse_floating(text, [](const char* s, char** e) { return std::strtod(s, e); }, d))
                return make<ValueKind::Double>(d);
            break;
        }
        case ValueKind::Float: {
            float f = 0;
            if (parse_floating(text, [](const char* s, char** e) { return std::strtof(s, e); }, f))
                return make<ValueKind::Float>(f);
            break;
        }
        case ValueKind::Boolean: {
            const std::string t = to_lower(trim(text));
            if (t == "true")  return make<ValueKind::Boolean>(true);
            if (t == "false") return make<ValueKind::Boolean>(false);
            break;
        }
        default:
            break;
    }
    return ParsedValue::none();
}

} // namespace tagmenu
