// Bonding-curve formulas in arbitrary precision (templated on decimal type)
//
// Ground truth for the fixed-point kernels: every formula is a closed form over
// power(baseN, baseD, expN, expD, precision). Inputs are exact integers and are
// converted to Real on entry. Preconditions (positive balance, ratio in range,
// amount within supply) are the caller's; a violation yields NaN, infinity or
// a negative value, never an exception from the formula itself.
#pragma once

#include "decimal_context.hpp"

namespace fixedexp {

template <typename Real>
class BondingFormulaT {
public:
    // Weights are expressed in parts per million
    static uint_t MAX_RATIO() { return uint_t(1000000); }

    explicit BondingFormulaT(DecimalContext<Real> ctx = DecimalContext<Real>())
        : ctx_(ctx) {}

    const DecimalContext<Real>& context() const { return ctx_; }

    // (baseN / baseD) ^ (expN / expD) * 2 ^ precision
    Real power(
        const uint_t& baseN,
        const uint_t& baseD,
        const uint_t& expN,
        const uint_t& expD,
        unsigned precision = 0
    ) const {
        const Real bn = ctx_.to_real(baseN, "baseN");
        const Real bd = ctx_.to_real(baseD, "baseD");
        const Real en = ctx_.to_real(expN, "expN");
        const Real ed = ctx_.to_real(expD, "expD");
        const Real scale = ctx_.to_real(uint_t(1) << precision, "2^precision");
        Real base = bn / bd;
        Real exponent = en / ed;
        return Real(pow(base, exponent)) * scale;
    }

    // supply * ((1 + amount / balance) ^ (ratio / 1000000) - 1)
    Real calculate_purchase_return(
        const uint_t& supply,
        const uint_t& balance,
        const uint_t& ratio,
        const uint_t& amount
    ) const {
        const Real s = ctx_.to_real(supply, "supply");
        return s * (power(balance + amount, balance, ratio, MAX_RATIO()) - 1);
    }

    // balance * (1 - (1 - amount / supply) ^ (1000000 / ratio))
    Real calculate_sale_return(
        const uint_t& supply,
        const uint_t& balance,
        const uint_t& ratio,
        const uint_t& amount
    ) const {
        const Real b = ctx_.to_real(balance, "balance");
        return b * (1 - power(supply - amount, supply, MAX_RATIO(), ratio));
    }

    // balance2 * (1 - (balance1 / (balance1 + amount)) ^ (ratio1 / ratio2))
    Real calculate_cross_reserve_return(
        const uint_t& balance1,
        const uint_t& ratio1,
        const uint_t& balance2,
        const uint_t& ratio2,
        const uint_t& amount
    ) const {
        const Real b2 = ctx_.to_real(balance2, "balance2");
        return b2 * (1 - power(balance1, balance1 + amount, ratio1, ratio2));
    }

    // Reserve needed to mint `amount`: balance * (((supply + amount) / supply) ^ (1000000 / ratios) - 1)
    Real calculate_fund_cost(
        const uint_t& supply,
        const uint_t& balance,
        const uint_t& ratios,
        const uint_t& amount
    ) const {
        const Real b = ctx_.to_real(balance, "balance");
        return b * (power(supply + amount, supply, MAX_RATIO(), ratios) - 1);
    }

    // balance * (((supply + amount) / supply) ^ (1000000 / ratios) - 1), as the fund cost
    Real calculate_fund_return(
        const uint_t& supply,
        const uint_t& balance,
        const uint_t& ratios,
        const uint_t& amount
    ) const {
        return calculate_fund_cost(supply, balance, ratios, amount);
    }

    // balance * ((supply / (supply - amount)) ^ (1000000 / ratios) - 1)
    Real calculate_liquidate_return(
        const uint_t& supply,
        const uint_t& balance,
        const uint_t& ratios,
        const uint_t& amount
    ) const {
        const Real b = ctx_.to_real(balance, "balance");
        return b * (power(supply, supply - amount, MAX_RATIO(), ratios) - 1);
    }

private:
    DecimalContext<Real> ctx_;
};

using BondingFormula = BondingFormulaT<OracleReal>;

} // namespace fixedexp
