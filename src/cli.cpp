/**
 * Command-line interface for motif-scanner - Implementation
 */

#include "cli.hpp"
#include "batch_processor.hpp"
#include "file_parsers.hpp"
#include "output_writer.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>

namespace tfbs {
namespace cli {

void print_version() {
    std::cout << "motif-scanner " << TFBS_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "Motif Scanner - Transcription Factor Binding Occupancy\n"
              << "=======================================================\n\n"
              << "Scans DNA sequences with position weight matrices and predicts the\n"
              << "occupancy of every binding site on both strands.\n\n"
              << "Usage: " << program_name << " [OPTIONS] DATA_FILE PWM_FILE OUTPUT_FILE\n\n"
              << "Inputs:\n"
              << "  DATA_FILE               CSV/TSV table with a 'sequence' column, or FASTA\n"
              << "                          (.fa/.fasta/.fna); .gz accepted\n"
              << "  PWM_FILE                MEME format motif file; .gz accepted\n"
              << "  OUTPUT_FILE             Site table (.csv, .tsv, .json, optionally .gz; - for stdout)\n\n"
              << "Model Parameters:\n"
              << "  --cutoff X              Minimum occupancy to report (default: 0.2)\n"
              << "  --mu X                  Chemical potential of the TF (default: 9)\n"
              << "                          Higher values mean stronger binding\n\n"
              << "Energy Matrix:\n"
              << "  --background A,C,G,T    Background base frequencies (default: 0.25 each)\n"
              << "  --meme-background       Use the background declared in PWM_FILE\n"
              << "  --pseudocount X         Frequency floor before the log (default: 0.0001)\n"
              << "  --reference MODE        background | consensus (default: background)\n"
              << "  --rt X                  Energy scale factor (default: 1.0)\n\n"
              << "Output Options:\n"
              << "  --format FMT            csv | tsv | json (default: from OUTPUT_FILE)\n"
              << "  --landscape FILE        Also write the per-position landscape table\n"
              << "  --summary FILE          Also write the per-sequence summary table\n"
              << "  --restriction-sites S   Comma-separated sites flagged in the summary\n"
              << "  --motif NAME            Scan only this motif (repeatable)\n\n"
              << "Other Options:\n"
              << "  -t, --threads N         Worker threads (default: all)\n"
              << "  --debug                 Enable debug logging\n"
              << "  --quiet                 Only log warnings and errors\n"
              << "  -V, --version           Show version and exit\n"
              << "  -h, --help              Show this help message\n\n"
              << "Examples:\n"
              << "  " << program_name << " data.csv motifs.meme results.csv --cutoff 0.3 --mu 12\n"
              << "  " << program_name << " sequences.fa motifs.meme sites.tsv.gz --summary summary.csv\n"
              << std::endl;
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    for (const auto& item : split_line(value, ',')) {
        std::string t = trim(item);
        if (!t.empty()) items.push_back(t);
    }
    return items;
}

MatrixRow parse_background(const std::string& value) {
    auto items = split_list(value);
    if (items.size() != ALPHABET_SIZE) {
        throw std::invalid_argument("expected four values, got " + std::to_string(items.size()));
    }

    MatrixRow bg{{0.0, 0.0, 0.0, 0.0}};
    bool keyed = items[0].find(':') != std::string::npos;
    std::array<bool, ALPHABET_SIZE> seen{{false, false, false, false}};

    for (size_t i = 0; i < items.size(); ++i) {
        std::string number = items[i];
        size_t index = i;
        if (keyed) {
            size_t colon = items[i].find(':');
            if (colon != 1) {
                throw std::invalid_argument("expected BASE:VALUE, got '" + items[i] + "'");
            }
            uint8_t code = encode_base(items[i][0]);
            if (code == BASE_AMBIGUOUS) {
                throw std::invalid_argument("unknown base in '" + items[i] + "'");
            }
            index = code;
            number = items[i].substr(colon + 1);
        }
        if (seen[index]) {
            throw std::invalid_argument(std::string("base ") + ALPHABET[index] + " given twice");
        }
        size_t idx = 0;
        double parsed = std::stod(number, &idx);
        if (idx != number.size()) {
            throw std::invalid_argument("invalid number '" + number + "'");
        }
        bg[index] = parsed;
        seen[index] = true;
    }

    return bg;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "--cutoff") {
            opts.params.cutoff = parse_double(arg, require_value(arg));
        } else if (arg == "--mu") {
            opts.params.mu = parse_double(arg, require_value(arg));
        } else if (arg == "--background") {
            std::string value = require_value(arg);
            try {
                opts.converter.background = parse_background(value);
            } catch (const std::exception& e) {
                throw ParseArgsExit(1, "Error: Invalid --background '" + value + "': " + e.what());
            }
        } else if (arg == "--meme-background") {
            opts.meme_background = true;
        } else if (arg == "--pseudocount") {
            opts.converter.pseudocount = parse_double(arg, require_value(arg));
        } else if (arg == "--reference") {
            std::string value = require_value(arg);
            try {
                opts.converter.reference = parse_energy_reference(value);
            } catch (const InvalidParameterError& e) {
                throw ParseArgsExit(1, std::string("Error: ") + e.what());
            }
        } else if (arg == "--rt") {
            opts.converter.rt = parse_double(arg, require_value(arg));
        } else if (arg == "--format") {
            opts.format = require_value(arg);
        } else if (arg == "--landscape") {
            opts.landscape_file = require_value(arg);
        } else if (arg == "--summary") {
            opts.summary_file = require_value(arg);
        } else if (arg == "--restriction-sites") {
            auto sites = split_list(require_value(arg));
            opts.restriction_sites.insert(opts.restriction_sites.end(), sites.begin(), sites.end());
        } else if (arg == "--motif") {
            opts.motifs.push_back(require_value(arg));
        } else if (arg == "-t" || arg == "--threads") {
            opts.threads = parse_int(arg, require_value(arg));
            if (opts.threads < 0) {
                throw ParseArgsExit(1, "Error: --threads must be >= 0");
            }
        } else if (arg == "--debug") {
            opts.log_level = LogLevel::DEBUG;
        } else if (arg == "--quiet") {
            opts.log_level = LogLevel::WARNING;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 3) {
        throw ParseArgsExit(1, "Error: Expected DATA_FILE PWM_FILE OUTPUT_FILE (got " +
                               std::to_string(positional.size()) + " positional arguments)");
    }
    opts.data_file = positional[0];
    opts.pwm_file = positional[1];
    opts.output_file = positional[2];

    if (!opts.format.empty()) {
        try {
            parse_output_format(opts.format);
        } catch (const InvalidParameterError& e) {
            throw ParseArgsExit(1, std::string("Error: ") + e.what());
        }
    }

    return opts;
}

MotifCollection select_motifs(const MotifCollection& motifs,
                              const std::vector<std::string>& names) {
    if (names.empty()) return motifs;

    MotifCollection selected;
    for (const auto& name : names) {
        auto it = motifs.find(name);
        if (it == motifs.end()) {
            throw InvalidParameterError("motif", name, "not found in motif file");
        }
        selected.emplace(it->first, it->second);
    }
    return selected;
}

namespace {

// Output directories are created on demand
void ensure_parent_directory(const std::string& path) {
    if (path.empty() || path == "-" || path == "STDOUT") return;
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
        log(LogLevel::DEBUG, "Created output directory: " + parent.string());
    }
}

} // namespace

int run_scan(const Options& opts) {
    validate_scan_params(opts.params);

    {
        std::ostringstream oss;
        oss << "Parameters: mu=" << opts.params.mu << " cutoff=" << opts.params.cutoff
            << " reference=" << energy_reference_to_string(opts.converter.reference)
            << " rt=" << opts.converter.rt << " pseudocount=" << opts.converter.pseudocount;
        log(LogLevel::DEBUG, oss.str());
    }

    MotifCollection loaded = load_motifs(opts.pwm_file, opts.converter, opts.meme_background);
    auto motifs = std::make_shared<const MotifCollection>(select_motifs(loaded, opts.motifs));
    for (const auto& entry : *motifs) {
        const MotifMatrix& motif = entry.second;
        std::string desc = "Motif " + entry.first;
        if (!motif.alt_name().empty()) desc += " " + motif.alt_name();
        desc += " (w=" + std::to_string(motif.width());
        if (motif.nsites() > 0) desc += ", nsites=" + std::to_string(motif.nsites());
        desc += ", consensus " + motif.consensus() + ")";
        log(LogLevel::DEBUG, desc);
    }

    std::vector<SequenceRecord> records = read_sequences(opts.data_file);

    BatchOptions batch_options;
    batch_options.threads = opts.threads;
    batch_options.keep_landscapes = !opts.landscape_file.empty();
    batch_options.restriction_sites = opts.restriction_sites;

    BatchProcessor processor(motifs, opts.params, batch_options);
    std::vector<SequenceResult> results = processor.run(records);

    OutputFormat format = opts.format.empty() ? format_from_path(opts.output_file)
                                              : parse_output_format(opts.format);
    ensure_parent_directory(opts.output_file);
    auto writer = create_output_writer(opts.output_file, format);
    writer->write_header();
    for (const auto& result : results) {
        writer->write_sites(result.sites);
    }
    writer->write_footer();
    writer->close();
    log(LogLevel::INFO, "Wrote " + std::to_string(writer->rows_written()) + " sites to " +
                        opts.output_file);

    if (!opts.landscape_file.empty()) {
        ensure_parent_directory(opts.landscape_file);
        LandscapeWriter landscape_writer(opts.landscape_file,
                                         delimiter_for_path(opts.landscape_file));
        for (size_t i = 0; i < results.size(); ++i) {
            landscape_writer.write(records[i].label, results[i].landscape);
        }
        landscape_writer.close();
        log(LogLevel::INFO, "Wrote landscape table to " + opts.landscape_file);
    }

    if (!opts.summary_file.empty()) {
        ensure_parent_directory(opts.summary_file);
        SummaryWriter summary_writer(opts.summary_file, delimiter_for_path(opts.summary_file));
        for (const auto& result : results) {
            summary_writer.write(result.summary);
        }
        summary_writer.close();
        log(LogLevel::INFO, "Wrote summary table to " + opts.summary_file);
    }

    BatchStats stats = BatchProcessor::summarize(results);
    if (get_log_level() <= LogLevel::INFO) {
        std::cerr << "\n" << stats.to_string() << std::endl;
    }

    return 0;
}

} // namespace cli
} // namespace tfbs
