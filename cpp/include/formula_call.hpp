#ifndef FIXEDEXP_FORMULA_CALL_HPP
#define FIXEDEXP_FORMULA_CALL_HPP

#include "bonding_formula.hpp"
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fixedexp {

namespace json = boost::json;

enum class Formula {
    PurchaseReturn,
    SaleReturn,
    CrossReserveReturn,
    FundCost,
    FundReturn,
    LiquidateReturn,
    Power
};

// Accepts "calculatePurchaseReturn" / "purchase_return" style names
Formula parse_formula(const std::string& name);
const char* formula_name(Formula f);
size_t formula_arity(Formula f);

// One oracle invocation with explicit integer arguments, in formula order
struct FormulaCall {
    Formula formula;
    std::vector<uint_t> args;

    static FormulaCall from_json(const json::object& obj);
};

// The precondition a call breaks, if any. Such calls are expected to be
// skipped by callers; the formulas themselves would return garbage.
std::optional<std::string> domain_violation(const FormulaCall& call);

OracleReal evaluate(const BondingFormula& formula, const FormulaCall& call);

/**
 * One harness entry. The result carries "name" (from the call, else
 * "call_<idx>"), "formula" once parsed, and "status":
 *   ok       "value" holds the result
 *   skipped  "reason" names the broken precondition
 *   failed   "error" holds the exception text (malformed call, digit budget, ...)
 */
json::object process_call(const BondingFormula& formula, const json::object& call, size_t idx);

struct CallTally {
    size_t ok = 0;
    size_t skipped = 0;
    size_t failed = 0;

    // Counts a process_call result by its status
    void record(const json::object& result);
    size_t total() const { return ok + skipped + failed; }
};

} // namespace fixedexp

#endif // FIXEDEXP_FORMULA_CALL_HPP
