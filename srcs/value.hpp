#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace tagmenu {

// Order matches the ParsedValue alternatives, see ParsedValue::kind().
enum class ValueKind {
    None = 0,
    Text,
    Integer,     // 32 bit
    Long,        // 64 bit
    Short,       // 16 bit
    BigInteger,
    Double,
    Float,
    BigDecimal,
    Boolean,
    Byte         // signed 8 bit
};

const char* kindName(ValueKind kind) noexcept;

// Arbitrary-precision integer kept as canonical decimal text:
// optional '-', no leading zeros, "0" for zero.
class BigInteger {
public:
    BigInteger() : _text("0") {}

    static std::optional<BigInteger> parse(const std::string& text);

    const std::string& str() const noexcept { return _text; }
    bool negative() const noexcept { return _text[0] == '-'; }

    friend bool operator==(const BigInteger& a, const BigInteger& b) { return a._text == b._text; }
    friend bool operator!=(const BigInteger& a, const BigInteger& b) { return !(a == b); }

private:
    explicit BigInteger(std::string canonical) : _text(std::move(canonical)) {}
    std::string _text;
};

// Largest |exponent| BigDecimal::parse accepts; str() never writes more
// zeros than that beyond the digits typed.
constexpr long kMaxDecimalExponent = 9999;

// Arbitrary-precision decimal: unscaled digits and a scale, value =
// unscaled * 10^-scale. "1.50" keeps scale 2, "1.5E+3" has scale -2.
class BigDecimal {
public:
    BigDecimal() : _unscaled(), _scale(0) {}

    static std::optional<BigDecimal> parse(const std::string& text);

    const BigInteger& unscaled() const noexcept { return _unscaled; }
    long scale() const noexcept { return _scale; }

    // Plain notation, no exponent: "1.50", "-0.003", "1500"
    std::string str() const;

    friend bool operator==(const BigDecimal& a, const BigDecimal& b) {
        return a._scale == b._scale && a._unscaled == b._unscaled;
    }
    friend bool operator!=(const BigDecimal& a, const BigDecimal& b) { return !(a == b); }

private:
    BigDecimal(BigInteger unscaled, long scale) : _unscaled(std::move(unscaled)), _scale(scale) {}
    BigInteger _unscaled;
    long _scale;
};

std::ostream& operator<<(std::ostream& os, const BigInteger& v);
std::ostream& operator<<(std::ostream& os, const BigDecimal& v);

// Result of reading one line of input. None means "no value obtained"
// (parse failure, unsupported kind, end of input) and is distinct from an
// empty Text value.
class ParsedValue {
public:
    using Storage = std::variant<std::monostate, std::string, std::int32_t, std::int64_t,
                                 std::int16_t, BigInteger, double, float, BigDecimal,
                                 bool, std::int8_t>;

    ParsedValue() = default;
    explicit ParsedValue(Storage v) : _v(std::move(v)) {}

    static ParsedValue none() { return ParsedValue(); }

    ValueKind kind() const noexcept { return static_cast<ValueKind>(_v.index()); }
    bool isNone() const noexcept { return _v.index() == 0; }
    explicit operator bool() const noexcept { return !isNone(); }

    // Typed access; returns nullptr when the value holds another kind.
    template <typename T>
    const T* get() const noexcept { return std::get_if<T>(&_v); }

    const Storage& storage() const noexcept { return _v; }

    friend bool operator==(const ParsedValue& a, const ParsedValue& b) { return a._v == b._v; }
    friend bool operator!=(const ParsedValue& a, const ParsedValue& b) { return !(a == b); }

private:
    Storage _v;
};

std::ostream& operator<<(std::ostream& os, const ParsedValue& v);

// Converts text to the requested kind. Surrounding whitespace is ignored for
// every kind but Text. Returns none on malformed or out-of-range input and
// for kinds outside the supported set.
ParsedValue parseValue(ValueKind kind, const std::string& text);

// a + b into out unless the sum leaves the int64 range; out is untouched then.
bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out) noexcept;

// Maps a C++ type to the kind that produces it.
template <typename T> struct ValueTraits { static constexpr bool supported = false; };
template <> struct ValueTraits<std::string>  { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Text; };
template <> struct ValueTraits<std::int32_t> { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Integer; };
template <> struct ValueTraits<std::int64_t> { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Long; };
template <> struct ValueTraits<std::int16_t> { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Short; };
template <> struct ValueTraits<BigInteger>   { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::BigInteger; };
template <> struct ValueTraits<double>       { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Double; };
template <> struct ValueTraits<float>        { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Float; };
template <> struct ValueTraits<BigDecimal>   { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::BigDecimal; };
template <> struct ValueTraits<bool>         { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Boolean; };
template <> struct ValueTraits<std::int8_t>  { static constexpr bool supported = true; static constexpr ValueKind kind = ValueKind::Byte; };

} // namespace tagmenu
