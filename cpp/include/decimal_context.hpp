#ifndef FIXEDEXP_DECIMAL_CONTEXT_HPP
#define FIXEDEXP_DECIMAL_CONTEXT_HPP

#include "fixedexp_types.hpp"
#include <limits>
#include <string>

namespace fixedexp {

/**
 * Precision context for one decimal type.
 *
 * Every integer entering or leaving decimal arithmetic goes through here, so a
 * digit budget that is too small for a magnitude aborts the computation with a
 * ConfigurationError instead of silently dropping low digits. The context is a
 * plain value owned by whoever computes; nothing is shared between calls.
 */
template <typename Real>
class DecimalContext {
public:
    explicit DecimalContext(unsigned guard_digits = 2) : guard_digits_(guard_digits) {
        if (guard_digits_ >= digits10()) {
            throw ConfigurationError("guard digits leave no room for integer digits");
        }
    }

    static constexpr unsigned digits10() {
        return static_cast<unsigned>(std::numeric_limits<Real>::digits10);
    }

    unsigned guard_digits() const { return guard_digits_; }

    // Digits available to the integer part of any value
    unsigned integer_digits() const { return digits10() - guard_digits_; }

    // Every value below 2^bits must be representable
    void require_bits(unsigned bits, const std::string& what) const {
        const uint_t max = (uint_t(1) << bits) - 1;
        require_digits(decimal_digits(max), what);
    }

    Real to_real(const uint_t& value, const std::string& what = "value") const {
        require_digits(decimal_digits(value), what);
        return Real(value);
    }

    uint_t floor_to_int(const Real& value, const std::string& what = "value") const {
        if (!(boost::multiprecision::isfinite)(value)) {
            throw std::domain_error(what + " is not finite");
        }
        if (value < 0) {
            throw std::domain_error(what + " is negative");
        }
        Real whole = floor(value);
        const Real limit = pow(Real(10), static_cast<int>(integer_digits()));
        if (whole >= limit) {
            throw ConfigurationError(
                what + " exceeds the " + std::to_string(integer_digits()) + "-digit integer budget");
        }
        return whole.template convert_to<uint_t>();
    }

    // 2^e, exact for the exponents used here
    Real pow2(int e) const {
        return ldexp(Real(1), e);
    }

private:
    static unsigned decimal_digits(const uint_t& value) {
        std::string s = value.str();
        return static_cast<unsigned>(s[0] == '-' ? s.size() - 1 : s.size());
    }

    void require_digits(unsigned digits, const std::string& what) const {
        if (digits > integer_digits()) {
            throw ConfigurationError(
                what + " needs " + std::to_string(digits) + " digits, context has "
                + std::to_string(integer_digits()) + " (+" + std::to_string(guard_digits_) + " guard)");
        }
    }

    unsigned guard_digits_;
};

} // namespace fixedexp

#endif // FIXEDEXP_DECIMAL_CONTEXT_HPP
