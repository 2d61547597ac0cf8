/**
 * Tests for sequence_utils.hpp: base encoding, reverse complement,
 * GC content and restriction site checks.
 */

#include <gtest/gtest.h>
#include "sequence_utils.hpp"
#include "tfbs_scanner.hpp"

using namespace tfbs;

// ============================================================================
// Encoding
// ============================================================================

TEST(BaseEncoding, CanonicalBases) {
    EXPECT_EQ(encode_base('A'), BASE_A);
    EXPECT_EQ(encode_base('C'), BASE_C);
    EXPECT_EQ(encode_base('G'), BASE_G);
    EXPECT_EQ(encode_base('T'), BASE_T);
}

TEST(BaseEncoding, LowercaseBases) {
    EXPECT_EQ(encode_base('a'), BASE_A);
    EXPECT_EQ(encode_base('c'), BASE_C);
    EXPECT_EQ(encode_base('g'), BASE_G);
    EXPECT_EQ(encode_base('t'), BASE_T);
}

TEST(BaseEncoding, AmbiguousSymbols) {
    EXPECT_EQ(encode_base('N'), BASE_AMBIGUOUS);
    EXPECT_EQ(encode_base('R'), BASE_AMBIGUOUS);
    EXPECT_EQ(encode_base('-'), BASE_AMBIGUOUS);
    EXPECT_EQ(encode_base('U'), BASE_AMBIGUOUS);
    EXPECT_EQ(encode_base('\0'), BASE_AMBIGUOUS);
}

TEST(BaseEncoding, ComplementCodes) {
    EXPECT_EQ(complement_code(BASE_A), BASE_T);
    EXPECT_EQ(complement_code(BASE_C), BASE_G);
    EXPECT_EQ(complement_code(BASE_G), BASE_C);
    EXPECT_EQ(complement_code(BASE_T), BASE_A);
    EXPECT_EQ(complement_code(BASE_AMBIGUOUS), BASE_AMBIGUOUS);
}

TEST(BaseEncoding, EncodeSequence) {
    auto codes = encode_sequence("AcGtN");
    ASSERT_EQ(codes.size(), 5u);
    EXPECT_EQ(codes[0], BASE_A);
    EXPECT_EQ(codes[1], BASE_C);
    EXPECT_EQ(codes[2], BASE_G);
    EXPECT_EQ(codes[3], BASE_T);
    EXPECT_EQ(codes[4], BASE_AMBIGUOUS);
}

// ============================================================================
// Reverse complement
// ============================================================================

TEST(ReverseComplement, Basic) {
    EXPECT_EQ(reverse_complement("ATCG"), "CGAT");
    EXPECT_EQ(reverse_complement("AAAA"), "TTTT");
    EXPECT_EQ(reverse_complement("GATTACA"), "TGTAATC");
}

TEST(ReverseComplement, Empty) {
    EXPECT_EQ(reverse_complement(""), "");
}

TEST(ReverseComplement, LowercaseIsUpperCased) {
    EXPECT_EQ(reverse_complement("atcg"), "CGAT");
}

TEST(ReverseComplement, Involution) {
    std::string seq = "ACGTTGCAAGGCTTAC";
    EXPECT_EQ(reverse_complement(reverse_complement(seq)), seq);
}

TEST(ReverseComplement, InvalidBaseThrows) {
    EXPECT_THROW(reverse_complement("ACNGT"), InvalidSequenceError);
}

TEST(ReverseComplement, InvalidBaseReportsPosition) {
    try {
        reverse_complement("ACXGT");
        FAIL() << "Expected InvalidSequenceError";
    } catch (const InvalidSequenceError& e) {
        EXPECT_EQ(e.position(), 2u);
    }
}

// ============================================================================
// GC content
// ============================================================================

TEST(GcContent, Values) {
    EXPECT_DOUBLE_EQ(gc_content("GGCC"), 1.0);
    EXPECT_DOUBLE_EQ(gc_content("AATT"), 0.0);
    EXPECT_DOUBLE_EQ(gc_content("ACGT"), 0.5);
    EXPECT_DOUBLE_EQ(gc_content("acgt"), 0.5);
}

TEST(GcContent, AmbiguousCountInLength) {
    EXPECT_DOUBLE_EQ(gc_content("GCNN"), 0.5);
}

TEST(GcContent, EmptyIsZero) {
    EXPECT_DOUBLE_EQ(gc_content(""), 0.0);
}

// ============================================================================
// Restriction sites
// ============================================================================

TEST(RestrictionSites, Found) {
    EXPECT_TRUE(has_restriction_sites("AAGAATTCAA", {"GAATTC"}));
    EXPECT_TRUE(has_restriction_sites("AAGGATCCAA", {"GAATTC", "GGATCC"}));
}

TEST(RestrictionSites, NotFound) {
    EXPECT_FALSE(has_restriction_sites("AAAAAAAAAA", {"GAATTC", "GGATCC"}));
}

TEST(RestrictionSites, CaseInsensitive) {
    EXPECT_TRUE(has_restriction_sites("aagaattcaa", {"GAATTC"}));
    EXPECT_TRUE(has_restriction_sites("AAGAATTCAA", {"gaattc"}));
}

TEST(RestrictionSites, EmptyListOrSite) {
    EXPECT_FALSE(has_restriction_sites("GAATTC", {}));
    EXPECT_FALSE(has_restriction_sites("GAATTC", {""}));
}
