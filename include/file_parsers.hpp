/**
 * File Format Parsers
 *
 * Readers for the scanner's inputs, plain or gzip-compressed:
 * - MEME motif files (letter-probability matrices)
 * - FASTA sequences
 * - Delimited sequence tables (CSV/TSV with a "sequence" column)
 * plus a FASTA writer.
 */

#ifndef FILE_PARSERS_HPP
#define FILE_PARSERS_HPP

#include "tfbs_scanner.hpp"
#include "motif_matrix.hpp"
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <zlib.h>

namespace tfbs {

// ============================================================================
// Line reader
// ============================================================================

/**
 * Line-by-line reader over a plain file, a .gz file or an existing stream.
 * Trailing "\n" / "\r\n" are stripped.
 */
class LineReader {
public:
    /**
     * Open a file; ".gz" paths are decompressed with zlib
     * @throws FileFormatError if the file cannot be opened
     */
    explicit LineReader(const std::string& path);

    /**
     * Read from a caller-owned stream
     */
    explicit LineReader(std::istream& in, const std::string& source_name = "<stream>");

    ~LineReader();

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * @return false at end of input
     */
    bool next(std::string& line);

    /**
     * 1-based number of the last line returned
     */
    std::size_t line_number() const { return line_number_; }

    const std::string& source() const { return source_; }

private:
    std::string source_;
    gzFile gz_ = nullptr;
    std::ifstream file_;
    std::istream* stream_ = nullptr;
    std::size_t line_number_ = 0;
};

// ============================================================================
// MEME motif files
// ============================================================================

/**
 * One MOTIF block as written in the file, before validation
 */
struct MemeRecord {
    std::string name;
    std::string alt_name;
    int alength = 0;            // Declared alphabet length (0 if not declared)
    int declared_width = 0;     // Declared w= (0 if not declared)
    int nsites = 0;
    Matrix rows;
};

struct MemeData {
    std::optional<MatrixRow> background;   // "Background letter frequencies" block
    std::vector<MemeRecord> records;
};

/**
 * Parse MEME text. Header lines before the first MOTIF are skipped apart
 * from the ALPHABET and background declarations.
 * @throws FileFormatError for unparseable content or when no motif is found
 * @throws MalformedMatrixError for rows without four values or shape mismatches
 */
MemeData parse_meme(LineReader& reader);

MemeData read_meme_file(const std::string& path);

/**
 * Validate records and convert them to motifs. The whole collection fails
 * if any motif is malformed or a name is repeated.
 */
MotifCollection build_motif_collection(const std::vector<MemeRecord>& records,
                                       const MatrixConverter& converter);

/**
 * Read a MEME file and derive energy matrices.
 * @param use_file_background Use the file's background frequencies instead
 *        of options.background when the file declares them
 */
MotifCollection load_motifs(const std::string& path,
                            const ConverterOptions& options = ConverterOptions(),
                            bool use_file_background = false);

// ============================================================================
// Sequences
// ============================================================================

/**
 * Parse FASTA; labels are the full header line after '>', sequences are
 * upper-cased. Headers without text are labelled with their record index.
 * @throws FileFormatError if no records are found
 */
std::vector<SequenceRecord> parse_fasta(LineReader& reader);

std::vector<SequenceRecord> read_fasta(const std::string& path);

/**
 * Write records as FASTA (gzip-compressed when path ends with .gz)
 */
void write_fasta(const std::vector<SequenceRecord>& records, const std::string& path);

/**
 * Parse a delimited table with a header row. Requires a "sequence" column;
 * the label comes from the first of "label", "name", "id", or the 0-based
 * row index when none exists. Column names match case-insensitively.
 */
std::vector<SequenceRecord> parse_sequence_table(LineReader& reader, char delim = ',');

std::vector<SequenceRecord> read_sequence_table(const std::string& path);

/**
 * Dispatch on extension: FASTA (.fa, .fasta, .fna, .fas, .fsa), TSV (.tsv,
 * .txt) or CSV (anything else); each optionally .gz
 */
std::vector<SequenceRecord> read_sequences(const std::string& path);

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Parse a line into fields by delimiter
 */
std::vector<std::string> split_line(const std::string& line, char delim = '\t');

/**
 * Split a delimited line honouring double-quoted fields ("" is an escaped quote)
 */
std::vector<std::string> split_delimited(const std::string& line, char delim = ',');

/**
 * Strip leading and trailing whitespace
 */
std::string trim(const std::string& str);

/**
 * Check if a file exists
 */
bool file_exists(const std::string& path);

/**
 * Get file extension, lower-cased (handles .gz: "x.csv.gz" -> ".csv.gz")
 */
std::string get_extension(const std::string& path);

/**
 * Check if path ends with .gz
 */
bool ends_with_gz(const std::string& path);

bool is_fasta_path(const std::string& path);

} // namespace tfbs

#endif // FILE_PARSERS_HPP
