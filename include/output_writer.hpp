/**
 * Output Writer - Result Table Formats
 *
 * Site tables in CSV (default), TSV or JSON, plus the dense landscape table
 * and the per-sequence summary table. Every writer accepts "-" (stdout), a
 * plain path, or a ".gz" path (zlib-compressed).
 */

#ifndef OUTPUT_WRITER_HPP
#define OUTPUT_WRITER_HPP

#include "tfbs_scanner.hpp"
#include "batch_processor.hpp"
#include "file_parsers.hpp"
#include "occupancy.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

namespace tfbs {

/**
 * Output format types
 */
enum class OutputFormat {
    CSV,    // Comma-separated values (default)
    TSV,    // Tab-separated values
    JSON    // Array of site objects
};

/**
 * Parse output format name; throws InvalidParameterError for unknown names
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "csv") return OutputFormat::CSV;
    if (lower == "tsv") return OutputFormat::TSV;
    if (lower == "json") return OutputFormat::JSON;
    throw InvalidParameterError("format", format, "expected csv, tsv or json");
}

/**
 * Format implied by a file name (".tsv", ".json", optionally ".gz"); CSV otherwise
 */
inline OutputFormat format_from_path(const std::string& path) {
    std::string ext = get_extension(path);
    if (ends_with_gz(ext)) {
        ext = ext.substr(0, ext.size() - 3);
    }
    if (ext == ".tsv" || ext == ".txt") return OutputFormat::TSV;
    if (ext == ".json") return OutputFormat::JSON;
    return OutputFormat::CSV;
}

/**
 * Shortest text that parses back to exactly the same double
 */
inline std::string format_value(double value) {
    std::string text;
    for (int precision = 15; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == value) break;
    }
    return text;
}

/**
 * Quote a field for a delimited table if it contains the delimiter, a quote
 * or a line break
 */
inline std::string quote_field(const std::string& field, char delim) {
    if (field.find(delim) == std::string::npos && field.find('"') == std::string::npos &&
        field.find('\n') == std::string::npos && field.find('\r') == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

inline std::string escape_json(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

/**
 * Text sink shared by all writers: stdout, plain file or gzip file
 */
class OutputSink {
public:
    explicit OutputSink(const std::string& output_path, bool compress = false)
        : output_path_(output_path), compress_(compress), gz_file_(nullptr),
          use_stdout_(output_path.empty() || output_path == "-" || output_path == "STDOUT") {

        if (use_stdout_) {
            compress_ = false;  // Cannot compress stdout
        } else if (compress_ || ends_with_gz(output_path_)) {
            compress_ = true;
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_path_);
            }
        }
    }

    ~OutputSink() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
    }

    OutputSink(const OutputSink&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;

    void write(const std::string& s) {
        if (s.empty()) return;
        if (use_stdout_) {
            std::cout << s;
        } else if (compress_ && gz_file_) {
            if (gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) <= 0) {
                throw std::runtime_error("Failed writing to " + output_path_);
            }
        } else {
            output_ << s;
            if (!output_) {
                throw std::runtime_error("Failed writing to " + output_path_);
            }
        }
    }

    void close() {
        if (gz_file_) {
            int status = gzclose(gz_file_);
            gz_file_ = nullptr;
            if (status != Z_OK) {
                throw std::runtime_error("Failed closing " + output_path_);
            }
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }

    const std::string& path() const { return output_path_; }

private:
    std::string output_path_;
    bool compress_;
    std::ofstream output_;
    gzFile gz_file_;
    bool use_stdout_;
};

/**
 * Abstract base class for site table writers
 */
class OutputWriter {
public:
    virtual ~OutputWriter() = default;

    virtual void write_header() = 0;
    virtual void write_site(const BindingSite& site) = 0;
    virtual void write_footer() = 0;
    virtual void close() = 0;

    void write_sites(const std::vector<BindingSite>& sites) {
        for (const auto& site : sites) {
            write_site(site);
        }
    }

    std::size_t rows_written() const { return rows_written_; }

protected:
    std::size_t rows_written_ = 0;
};

/**
 * Delimited site table (CSV or TSV)
 */
class DelimitedWriter : public OutputWriter {
public:
    DelimitedWriter(const std::string& output_path, char delim, bool compress = false)
        : sink_(output_path, compress), delim_(delim) {}

    ~DelimitedWriter() override {
        try { close(); } catch (const std::exception& e) {
            log(LogLevel::ERROR, e.what());
        }
    }

    void write_header() override {
        std::string d(1, delim_);
        sink_.write("label" + d + "position" + d + "motif" + d + "strand" + d +
                    "motif_length" + d + "occupancy\n");
    }

    void write_site(const BindingSite& site) override {
        std::ostringstream line;
        line << quote_field(site.label, delim_) << delim_
             << site.position << delim_
             << quote_field(site.motif, delim_) << delim_
             << strand_to_char(site.strand) << delim_
             << site.motif_length << delim_
             << format_value(site.occupancy) << "\n";
        sink_.write(line.str());
        rows_written_++;
    }

    void write_footer() override {
        // Delimited tables have no footer
    }

    void close() override {
        sink_.close();
    }

private:
    OutputSink sink_;
    char delim_;
};

/**
 * JSON site table: one array of flat objects
 */
class JSONWriter : public OutputWriter {
public:
    explicit JSONWriter(const std::string& output_path, bool compress = false)
        : sink_(output_path, compress) {}

    ~JSONWriter() override {
        try { close(); } catch (const std::exception& e) {
            log(LogLevel::ERROR, e.what());
        }
    }

    void write_header() override {
        sink_.write("[");
    }

    void write_site(const BindingSite& site) override {
        std::ostringstream json;
        json << (rows_written_ == 0 ? "\n" : ",\n");
        json << "  {\"label\": \"" << escape_json(site.label) << "\", "
             << "\"position\": " << site.position << ", "
             << "\"motif\": \"" << escape_json(site.motif) << "\", "
             << "\"strand\": \"" << strand_to_char(site.strand) << "\", "
             << "\"motif_length\": " << site.motif_length << ", "
             << "\"occupancy\": " << format_value(site.occupancy) << "}";
        sink_.write(json.str());
        rows_written_++;
    }

    void write_footer() override {
        sink_.write(rows_written_ == 0 ? "]\n" : "\n]\n");
    }

    void close() override {
        sink_.close();
    }

private:
    OutputSink sink_;
};

/**
 * Factory for site table writers
 */
inline std::unique_ptr<OutputWriter> create_output_writer(
    const std::string& output_path,
    OutputFormat format,
    bool compress = false) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path, compress);
    } else if (format == OutputFormat::TSV) {
        return std::make_unique<DelimitedWriter>(output_path, '\t', compress);
    } else {
        return std::make_unique<DelimitedWriter>(output_path, ',', compress);
    }
}

/**
 * Dense landscape table: label, position, then <motif>_F / <motif>_R columns.
 * The header is taken from the first landscape written.
 */
class LandscapeWriter {
public:
    LandscapeWriter(const std::string& output_path, char delim = ',', bool compress = false)
        : sink_(output_path, compress), delim_(delim) {}

    void write(const std::string& label, const DenseLandscape& landscape) {
        if (!header_written_) {
            std::ostringstream header;
            header << "label" << delim_ << "position";
            for (const auto& col : landscape.columns) {
                header << delim_ << quote_field(col, delim_);
            }
            header << "\n";
            sink_.write(header.str());
            columns_ = landscape.columns;
            header_written_ = true;
        } else if (landscape.columns != columns_) {
            throw std::runtime_error("Landscape columns differ between sequences");
        }

        std::ostringstream out;
        const std::string quoted_label = quote_field(label, delim_);
        for (size_t p = 0; p < landscape.rows.size(); ++p) {
            out << quoted_label << delim_ << p;
            for (double v : landscape.rows[p]) {
                out << delim_ << format_value(v);
            }
            out << "\n";
        }
        sink_.write(out.str());
    }

    void close() { sink_.close(); }

private:
    OutputSink sink_;
    char delim_;
    bool header_written_ = false;
    std::vector<std::string> columns_;
};

/**
 * Per-sequence summary table
 */
class SummaryWriter {
public:
    SummaryWriter(const std::string& output_path, char delim = ',', bool compress = false)
        : sink_(output_path, compress), delim_(delim) {
        std::string d(1, delim_);
        sink_.write("label" + d + "length" + d + "gc_content" + d + "has_restriction_site" +
                    d + "sites" + d + "expected_bound\n");
    }

    void write(const SequenceSummary& summary) {
        std::ostringstream line;
        line << quote_field(summary.label, delim_) << delim_
             << summary.length << delim_
             << format_value(summary.gc_content) << delim_
             << (summary.has_restriction_site ? "true" : "false") << delim_
             << summary.sites << delim_
             << format_value(summary.expected_bound) << "\n";
        sink_.write(line.str());
    }

    void close() { sink_.close(); }

private:
    OutputSink sink_;
    char delim_;
};

/**
 * Delimiter for auxiliary tables: tab for .tsv/.txt names, comma otherwise
 */
inline char delimiter_for_path(const std::string& path) {
    return format_from_path(path) == OutputFormat::TSV ? '\t' : ',';
}

} // namespace tfbs

#endif // OUTPUT_WRITER_HPP
