#ifndef FIXEDEXP_TABLE_EMITTER_HPP
#define FIXEDEXP_TABLE_EMITTER_HPP

#include "fixedexp_types.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace fixedexp {

struct EmittedTable {
    std::vector<std::string> statements;
    size_t hi_block_begin = 0;  // first statement of the bit-test block

    // One statement per line, blank line between the polynomial and the bit tests
    std::string render(const std::string& indent = "        ") const;
};

// Renders the kernel body for a finished table. Pure text, no arithmetic.
class TableEmitter {
public:
    static EmittedTable emit(const HiTerms& hi_terms, const LoTerms& lo_terms);

    // "0x" + hex digits, zero-padded so the literal is `width` characters long
    static std::string hex_literal(const uint_t& value, size_t width = 0);
};

} // namespace fixedexp

#endif // FIXEDEXP_TABLE_EMITTER_HPP
