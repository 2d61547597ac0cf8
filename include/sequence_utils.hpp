/**
 * Sequence Utilities
 *
 * Fixed 4-letter DNA alphabet encoding, complements and small sequence
 * statistics used by the scanner and the summary output.
 */

#ifndef SEQUENCE_UTILS_HPP
#define SEQUENCE_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tfbs {

/**
 * Base index into PWM/EWM rows
 */
enum Base : uint8_t {
    BASE_A = 0,
    BASE_C = 1,
    BASE_G = 2,
    BASE_T = 3
};

constexpr std::size_t ALPHABET_SIZE = 4;

// Code for N, IUPAC ambiguity symbols, gaps and anything else
constexpr uint8_t BASE_AMBIGUOUS = 4;

constexpr std::array<char, ALPHABET_SIZE> ALPHABET = {{'A', 'C', 'G', 'T'}};

/**
 * Encode a nucleotide (case-insensitive) as 0-3, or BASE_AMBIGUOUS
 */
uint8_t encode_base(char c);

/**
 * Complement of an encoded base (A<->T, C<->G); ambiguous stays ambiguous
 */
inline uint8_t complement_code(uint8_t code) {
    return code < ALPHABET_SIZE ? static_cast<uint8_t>(3 - code) : BASE_AMBIGUOUS;
}

/**
 * Encode a whole sequence
 */
std::vector<uint8_t> encode_sequence(const std::string& sequence);

/**
 * Upper-case copy of a sequence
 */
std::string to_upper(const std::string& sequence);

/**
 * Reverse complement of an ACGT sequence.
 * Lowercase input is upper-cased. Throws InvalidSequenceError on any other symbol.
 */
std::string reverse_complement(const std::string& sequence);

/**
 * Fraction of G/C bases (case-insensitive) over the full length; 0 for empty input
 */
double gc_content(const std::string& sequence);

/**
 * True if any of the given sites occurs in the sequence (case-insensitive)
 */
bool has_restriction_sites(const std::string& sequence,
                           const std::vector<std::string>& sites);

} // namespace tfbs

#endif // SEQUENCE_UTILS_HPP
