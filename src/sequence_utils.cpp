/**
 * Sequence Utilities - Implementation
 */

#include "sequence_utils.hpp"
#include "tfbs_scanner.hpp"
#include <algorithm>
#include <cctype>

namespace tfbs {

namespace {

std::array<uint8_t, 256> build_encoding_table() {
    std::array<uint8_t, 256> table;
    table.fill(BASE_AMBIGUOUS);
    table[static_cast<unsigned char>('A')] = BASE_A;
    table[static_cast<unsigned char>('C')] = BASE_C;
    table[static_cast<unsigned char>('G')] = BASE_G;
    table[static_cast<unsigned char>('T')] = BASE_T;
    table[static_cast<unsigned char>('a')] = BASE_A;
    table[static_cast<unsigned char>('c')] = BASE_C;
    table[static_cast<unsigned char>('g')] = BASE_G;
    table[static_cast<unsigned char>('t')] = BASE_T;
    return table;
}

const std::array<uint8_t, 256> ENCODING_TABLE = build_encoding_table();

} // namespace

uint8_t encode_base(char c) {
    return ENCODING_TABLE[static_cast<unsigned char>(c)];
}

std::vector<uint8_t> encode_sequence(const std::string& sequence) {
    std::vector<uint8_t> codes(sequence.size());
    for (size_t i = 0; i < sequence.size(); ++i) {
        codes[i] = encode_base(sequence[i]);
    }
    return codes;
}

std::string to_upper(const std::string& sequence) {
    std::string result = sequence;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string reverse_complement(const std::string& sequence) {
    std::string result(sequence.size(), 'N');
    const size_t n = sequence.size();

    for (size_t i = 0; i < n; ++i) {
        uint8_t code = encode_base(sequence[i]);
        if (code == BASE_AMBIGUOUS) {
            throw InvalidSequenceError(i, std::string("unexpected nucleotide '") +
                                              sequence[i] + "'");
        }
        result[n - 1 - i] = ALPHABET[complement_code(code)];
    }

    return result;
}

double gc_content(const std::string& sequence) {
    if (sequence.empty()) return 0.0;

    size_t gc = 0;
    for (char c : sequence) {
        uint8_t code = encode_base(c);
        if (code == BASE_C || code == BASE_G) ++gc;
    }
    return static_cast<double>(gc) / static_cast<double>(sequence.size());
}

bool has_restriction_sites(const std::string& sequence,
                           const std::vector<std::string>& sites) {
    if (sites.empty()) return false;

    std::string upper = to_upper(sequence);
    for (const auto& site : sites) {
        if (site.empty()) continue;
        if (upper.find(to_upper(site)) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace tfbs
