/**
 * File Format Parsers - Implementation
 */

#include "file_parsers.hpp"
#include "sequence_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace tfbs {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::vector<std::string> split_delimited(const std::string& line, char delim) {
    std::vector<std::string> result;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == delim) {
            result.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    result.push_back(std::move(field));
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

std::string get_extension(const std::string& path) {
    std::string ext;
    size_t slash = path.find_last_of("/\\");
    size_t name_start = (slash == std::string::npos) ? 0 : slash + 1;
    size_t dot = path.rfind('.');

    if (dot != std::string::npos && dot > name_start) {
        ext = path.substr(dot);

        // Handle .gz compression
        if (ext == ".gz") {
            size_t dot2 = path.rfind('.', dot - 1);
            if (dot2 != std::string::npos && dot2 > name_start) {
                ext = path.substr(dot2);
            }
        }
    }

    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

bool is_fasta_path(const std::string& path) {
    std::string ext = get_extension(path);
    if (ends_with_gz(ext)) {
        ext = ext.substr(0, ext.size() - 3);
    }
    return ext == ".fa" || ext == ".fasta" || ext == ".fna" ||
           ext == ".fas" || ext == ".fsa";
}

// ============================================================================
// LineReader
// ============================================================================

LineReader::LineReader(const std::string& path) : source_(path) {
    if (ends_with_gz(path)) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw FileFormatError("Cannot open file: " + path);
        }
    } else {
        file_.open(path);
        if (!file_.is_open()) {
            throw FileFormatError("Cannot open file: " + path);
        }
        stream_ = &file_;
    }
}

LineReader::LineReader(std::istream& in, const std::string& source_name)
    : source_(source_name), stream_(&in) {}

LineReader::~LineReader() {
    if (gz_) {
        gzclose(gz_);
        gz_ = nullptr;
    }
}

bool LineReader::next(std::string& line) {
    line.clear();

    if (gz_) {
        char buffer[65536];
        bool got_any = false;
        while (gzgets(gz_, buffer, sizeof(buffer)) != nullptr) {
            got_any = true;
            line += buffer;
            if (!line.empty() && line.back() == '\n') break;
        }
        if (!got_any) {
            int errnum = Z_OK;
            const char* msg = gzerror(gz_, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                throw FileFormatError("Error reading " + source_ + ": " + msg);
            }
            return false;
        }
    } else {
        if (!std::getline(*stream_, line)) return false;
    }

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

// ============================================================================
// MEME motif files
// ============================================================================

namespace {

std::string location(const LineReader& reader) {
    return reader.source() + ":" + std::to_string(reader.line_number());
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

double parse_number(const std::string& token, const LineReader& reader) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size()) {
        throw FileFormatError("Invalid PWM value '" + token + "' at " + location(reader));
    }
    return value;
}

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Value following "key=" in a MEME matrix header, e.g. "alength= 4 w= 10"
bool find_header_value(const std::string& line, const std::string& key, double& value) {
    size_t pos = line.find(key + "=");
    if (pos == std::string::npos) return false;
    pos += key.size() + 1;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    char* end = nullptr;
    const char* begin = line.c_str() + pos;
    value = std::strtod(begin, &end);
    return end != begin;
}

bool is_matrix_row(const std::string& line) {
    char c = line[0];
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+';
}

void check_record(const MemeRecord& record) {
    if (record.rows.empty()) {
        throw FileFormatError("Empty PWM for motif '" + record.name + "'");
    }
    if (record.alength != 0 && record.alength != static_cast<int>(ALPHABET_SIZE)) {
        throw MalformedMatrixError(record.name,
            "alength= " + std::to_string(record.alength) + " (expected 4 for DNA)");
    }
    if (record.declared_width != 0 &&
        record.declared_width != static_cast<int>(record.rows.size())) {
        throw MalformedMatrixError(record.name,
            "declared w= " + std::to_string(record.declared_width) + " but found " +
            std::to_string(record.rows.size()) + " rows");
    }
}

} // namespace

MemeData parse_meme(LineReader& reader) {
    MemeData data;
    std::optional<MemeRecord> current;
    bool rows_closed = false;
    bool in_log_odds = false;
    bool reading_background = false;
    std::vector<std::string> background_tokens;

    auto finish_record = [&]() {
        if (current) {
            check_record(*current);
            data.records.push_back(std::move(*current));
            current.reset();
        }
    };

    std::string raw;
    while (reader.next(raw)) {
        std::string line = trim(raw);

        if (reading_background) {
            if (line.empty()) {
                if (!background_tokens.empty()) reading_background = false;
                continue;
            }
            auto tokens = tokenize(line);
            background_tokens.insert(background_tokens.end(), tokens.begin(), tokens.end());
            if (background_tokens.size() >= 2 * ALPHABET_SIZE) {
                MatrixRow bg{{0.0, 0.0, 0.0, 0.0}};
                std::array<bool, ALPHABET_SIZE> seen{{false, false, false, false}};
                for (size_t i = 0; i + 1 < background_tokens.size(); i += 2) {
                    if (background_tokens[i].size() != 1) continue;
                    uint8_t code = encode_base(background_tokens[i][0]);
                    if (code == BASE_AMBIGUOUS) continue;
                    bg[code] = parse_number(background_tokens[i + 1], reader);
                    seen[code] = true;
                }
                if (std::find(seen.begin(), seen.end(), false) != seen.end()) {
                    throw FileFormatError("Incomplete background frequencies at " +
                                          location(reader));
                }
                data.background = bg;
                reading_background = false;
            }
            continue;
        }

        if (line.empty()) continue;

        if (starts_with(line, "MOTIF")) {
            finish_record();
            auto tokens = tokenize(line);
            if (tokens.size() < 2) {
                throw FileFormatError("Missing motif ID at " + location(reader));
            }
            MemeRecord record;
            record.name = tokens[1];
            if (tokens.size() > 2) record.alt_name = tokens[2];
            current = std::move(record);
            rows_closed = false;
            in_log_odds = false;
            continue;
        }

        if (!current) {
            // Header section
            if (starts_with(line, "ALPHABET")) {
                size_t eq = line.find('=');
                std::string alphabet = eq == std::string::npos ? "" : trim(line.substr(eq + 1));
                std::string upper = to_upper(alphabet);
                if (!upper.empty() && upper != "ACGT" && !starts_with(upper, "ACGT ")) {
                    throw FileFormatError("Unsupported alphabet '" + alphabet + "' in " +
                                          reader.source());
                }
            } else if (starts_with(line, "Background letter frequencies")) {
                reading_background = true;
                background_tokens.clear();
            }
            continue;
        }

        if (starts_with(line, "log-odds matrix")) {
            in_log_odds = true;
            if (!current->rows.empty()) rows_closed = true;
            continue;
        }

        if (starts_with(line, "letter-probability matrix")) {
            in_log_odds = false;
            auto read_count = [&](const std::string& key, int& field) {
                double value = 0.0;
                if (!find_header_value(line, key, value)) return;
                if (!(value >= 0.0 && value <= std::numeric_limits<int>::max())) {
                    throw FileFormatError("Invalid " + key + "= value for motif '" +
                                          current->name + "' at " + location(reader));
                }
                field = static_cast<int>(value);
            };
            read_count("alength", current->alength);
            read_count("w", current->declared_width);
            read_count("nsites", current->nsites);
            continue;
        }

        if (in_log_odds && is_matrix_row(line)) {
            continue;
        }

        if (!rows_closed && is_matrix_row(line)) {
            auto tokens = tokenize(line);
            if (tokens.size() != ALPHABET_SIZE) {
                throw MalformedMatrixError(current->name,
                    "row " + std::to_string(current->rows.size() + 1) + " has " +
                    std::to_string(tokens.size()) + " values (expected 4) at " +
                    location(reader));
            }
            MatrixRow row;
            for (size_t b = 0; b < ALPHABET_SIZE; ++b) {
                row[b] = parse_number(tokens[b], reader);
            }
            current->rows.push_back(row);
            continue;
        }

        // URL, log-odds blocks and anything else end the probability rows
        if (!current->rows.empty()) {
            rows_closed = true;
        }
    }

    finish_record();

    if (data.records.empty()) {
        throw FileFormatError("No PWMs found in " + reader.source());
    }

    return data;
}

MemeData read_meme_file(const std::string& path) {
    LineReader reader(path);
    return parse_meme(reader);
}

MotifCollection build_motif_collection(const std::vector<MemeRecord>& records,
                                       const MatrixConverter& converter) {
    MotifCollection motifs;
    for (const auto& record : records) {
        if (motifs.count(record.name)) {
            throw FileFormatError("Duplicate motif ID '" + record.name + "'");
        }
        motifs.emplace(record.name,
                       MotifMatrix(record.name, record.alt_name, record.nsites,
                                   record.rows, converter));
    }
    return motifs;
}

MotifCollection load_motifs(const std::string& path, const ConverterOptions& options,
                            bool use_file_background) {
    log(LogLevel::INFO, "Loading motifs from: " + path);

    MemeData data = read_meme_file(path);

    ConverterOptions effective = options;
    if (use_file_background) {
        if (data.background) {
            effective.background = *data.background;
        } else {
            log(LogLevel::WARNING, "No background frequencies in " + path +
                                   "; using configured background");
        }
    }

    MatrixConverter converter(effective);
    MotifCollection motifs = build_motif_collection(data.records, converter);

    log(LogLevel::INFO, "Loaded " + std::to_string(motifs.size()) + " motifs (" +
                        energy_reference_to_string(converter.options().reference) +
                        " reference)");
    return motifs;
}

// ============================================================================
// Sequences
// ============================================================================

std::vector<SequenceRecord> parse_fasta(LineReader& reader) {
    std::vector<SequenceRecord> records;
    bool in_record = false;
    std::string line;

    while (reader.next(line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty()) continue;

        if (trimmed[0] == '>') {
            SequenceRecord record;
            record.label = trim(trimmed.substr(1));
            if (record.label.empty()) {
                record.label = std::to_string(records.size());
            }
            records.push_back(std::move(record));
            in_record = true;
        } else {
            if (!in_record) {
                throw FileFormatError("Sequence data before first header at " +
                                      location(reader));
            }
            records.back().sequence += to_upper(trimmed);
        }
    }

    if (records.empty()) {
        throw FileFormatError("No sequences found in " + reader.source());
    }

    return records;
}

std::vector<SequenceRecord> read_fasta(const std::string& path) {
    LineReader reader(path);
    return parse_fasta(reader);
}

void write_fasta(const std::vector<SequenceRecord>& records, const std::string& path) {
    std::ostringstream out;
    for (const auto& record : records) {
        out << ">" << record.label << "\n" << record.sequence << "\n";
    }
    const std::string content = out.str();

    if (ends_with_gz(path)) {
        gzFile gz = gzopen(path.c_str(), "wb");
        if (!gz) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        int written = content.empty() ? 0 :
            gzwrite(gz, content.data(), static_cast<unsigned int>(content.size()));
        int close_status = gzclose(gz);
        if ((!content.empty() && written <= 0) || close_status != Z_OK) {
            throw std::runtime_error("Failed writing FASTA file: " + path);
        }
    } else {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        file << content;
        if (!file) {
            throw std::runtime_error("Failed writing FASTA file: " + path);
        }
    }
}

std::vector<SequenceRecord> parse_sequence_table(LineReader& reader, char delim) {
    std::string line;
    std::vector<std::string> header;

    while (reader.next(line)) {
        if (!trim(line).empty()) {
            header = split_delimited(line, delim);
            break;
        }
    }
    if (header.empty()) {
        throw FileFormatError("No header row in " + reader.source());
    }

    auto lower = [](const std::string& s) {
        std::string r = trim(s);
        std::transform(r.begin(), r.end(), r.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return r;
    };

    int seq_col = -1;
    int label_col = -1;
    for (const char* candidate : {"label", "name", "id"}) {
        for (size_t i = 0; i < header.size() && label_col < 0; ++i) {
            if (lower(header[i]) == candidate) label_col = static_cast<int>(i);
        }
        if (label_col >= 0) break;
    }
    for (size_t i = 0; i < header.size(); ++i) {
        if (lower(header[i]) == "sequence") {
            seq_col = static_cast<int>(i);
            break;
        }
    }
    if (seq_col < 0) {
        throw FileFormatError("Missing required 'sequence' column in " + reader.source());
    }

    std::vector<SequenceRecord> records;
    while (reader.next(line)) {
        if (trim(line).empty()) continue;

        auto fields = split_delimited(line, delim);
        if (static_cast<int>(fields.size()) <= seq_col ||
            (label_col >= 0 && static_cast<int>(fields.size()) <= label_col)) {
            throw FileFormatError("Expected " + std::to_string(header.size()) +
                                  " fields but found " + std::to_string(fields.size()) +
                                  " at " + location(reader));
        }

        SequenceRecord record;
        record.sequence = to_upper(trim(fields[static_cast<size_t>(seq_col)]));
        record.label = label_col >= 0 ? trim(fields[static_cast<size_t>(label_col)])
                                      : std::to_string(records.size());
        records.push_back(std::move(record));
    }

    return records;
}

std::vector<SequenceRecord> read_sequence_table(const std::string& path) {
    std::string ext = get_extension(path);
    char delim = (ext == ".tsv" || ext == ".tsv.gz" || ext == ".txt" || ext == ".txt.gz")
                     ? '\t' : ',';
    LineReader reader(path);
    return parse_sequence_table(reader, delim);
}

std::vector<SequenceRecord> read_sequences(const std::string& path) {
    log(LogLevel::INFO, "Loading sequences from: " + path);

    std::vector<SequenceRecord> records =
        is_fasta_path(path) ? read_fasta(path) : read_sequence_table(path);

    log(LogLevel::INFO, "Loaded " + std::to_string(records.size()) + " sequences");
    return records;
}

} // namespace tfbs
