#include "table_emitter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fixedexp {

namespace {

std::string padded_decimal(unsigned value, size_t width) {
    std::ostringstream os;
    os << std::setw(static_cast<int>(width)) << std::setfill('0') << value;
    return os.str();
}

template <typename It, typename Field>
size_t widest_hex(It first, It last, Field field) {
    size_t width = 0;
    for (; first != last; ++first) {
        width = std::max(width, TableEmitter::hex_literal(field(*first)).size());
    }
    return width;
}

} // namespace

std::string TableEmitter::hex_literal(const uint_t& value, size_t width) {
    std::string digits = value.str(0, std::ios_base::hex);
    if (digits.size() + 2 < width) {
        digits.insert(0, width - 2 - digits.size(), '0');
    }
    return "0x" + digits;
}

EmittedTable TableEmitter::emit(const HiTerms& hi_terms, const LoTerms& lo_terms) {
    if (hi_terms.empty() || lo_terms.empty()) {
        throw std::invalid_argument("emit: empty table");
    }

    // Column widths over the emitted entries only (no lo-term 0, no sentinel)
    const auto hi_end = hi_terms.end() - 1;
    const size_t bit_w = widest_hex(hi_terms.begin(), hi_end, [](const HiTerm& t) -> const uint_t& { return t.bit; });
    const size_t num_w = widest_hex(hi_terms.begin(), hi_end, [](const HiTerm& t) -> const uint_t& { return t.num; });
    const size_t den_w = widest_hex(hi_terms.begin(), hi_end, [](const HiTerm& t) -> const uint_t& { return t.den; });
    const size_t val_w = widest_hex(lo_terms.begin() + 1, lo_terms.end(), [](const LoTerm& t) -> const uint_t& { return t.val; });
    size_t ind_w = 0;
    for (auto it = lo_terms.begin() + 1; it != lo_terms.end(); ++it) {
        ind_w = std::max(ind_w, std::to_string(it->ind).size());
    }

    const unsigned n = static_cast<unsigned>(lo_terms.size());
    EmittedTable table;
    auto& out = table.statements;

    out.push_back("z = y = x % " + hex_literal(hi_terms.front().bit) + ";");
    for (auto it = lo_terms.begin() + 1; it != lo_terms.end(); ++it) {
        out.push_back(
            "z = z * y / FIXED_ONE; res += z * " + hex_literal(it->val, val_w) + ";"
            + " // add y^" + padded_decimal(it->ind, ind_w)
            + " * (" + padded_decimal(n, ind_w) + "! / " + padded_decimal(it->ind, ind_w) + "!)");
    }
    out.push_back(
        "res = res / " + hex_literal(lo_terms.front().val) + " + y + FIXED_ONE;"
        + " // divide by " + std::to_string(n) + "! and then add y^1 / 1! + y^0 / 0!");

    table.hi_block_begin = out.size();
    for (auto it = hi_terms.begin(); it != hi_end; ++it) {
        out.push_back(
            "if ((x & " + hex_literal(it->bit, bit_w) + ") != 0) res = res * "
            + hex_literal(it->num, num_w) + " / " + hex_literal(it->den, den_w) + ";");
    }
    out.push_back("assert(x < " + hex_literal(hi_terms.back().bit) + ");");
    return table;
}

std::string EmittedTable::render(const std::string& indent) const {
    std::ostringstream os;
    for (size_t i = 0; i < statements.size(); ++i) {
        if (i == hi_block_begin && i != 0) {
            os << "\n";
        }
        os << indent << statements[i] << "\n";
    }
    return os.str();
}

} // namespace fixedexp
