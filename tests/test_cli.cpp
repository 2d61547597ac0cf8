/**
 * Tests for cli.hpp: argument parsing, background and list parsing,
 * motif selection, and end-to-end runs of run_scan on temporary files.
 */

#include <gtest/gtest.h>
#include "cli.hpp"
#include "file_parsers.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace tfbs;
using namespace tfbs::cli;

// ============================================================================
// Helpers
// ============================================================================

// Owns argv storage for parse_args
class ArgList {
public:
    ArgList(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "motif-scanner");
        for (auto& s : storage_) {
            pointers_.push_back(&s[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

static Options parse(std::initializer_list<std::string> args) {
    ArgList list(args);
    return parse_args(list.argc(), list.argv());
}

static int exit_code_of(std::initializer_list<std::string> args) {
    try {
        parse(args);
    } catch (const ParseArgsExit& e) {
        return e.exit_code();
    }
    return -1;
}

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    std::string content((std::istreambuf_iterator<char>(f)),
                         std::istreambuf_iterator<char>());
    return content;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Scratch directory removed with its contents
class TempDir {
public:
    TempDir() {
        path_ = std::filesystem::temp_directory_path() /
                ("test_cli_" + std::to_string(counter_++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::filesystem::remove_all(path_);
    }
    std::string file(const std::string& name) const { return (path_ / name).string(); }
private:
    std::filesystem::path path_;
    static inline int counter_ = 0;
};

static void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

// AT: 0.97 A then 0.97 T; with uniform background "AT" scores 2 * -ln(3.88)
static const char* MOTIF_FILE =
    "MEME version 4\n"
    "\n"
    "ALPHABET= ACGT\n"
    "\n"
    "MOTIF AT\n"
    "letter-probability matrix: alength= 4 w= 2 nsites= 20 E= 0\n"
    "0.97 0.01 0.01 0.01\n"
    "0.01 0.01 0.01 0.97\n"
    "\n"
    "MOTIF GGG\n"
    "letter-probability matrix: alength= 4 w= 3 nsites= 20 E= 0\n"
    "0.01 0.01 0.97 0.01\n"
    "0.01 0.01 0.97 0.01\n"
    "0.01 0.01 0.97 0.01\n";

// ============================================================================
// parse_args
// ============================================================================

TEST(ParseArgs, PositionalAndDefaults) {
    Options opts = parse({"data.csv", "motifs.meme", "out.csv"});
    EXPECT_EQ(opts.data_file, "data.csv");
    EXPECT_EQ(opts.pwm_file, "motifs.meme");
    EXPECT_EQ(opts.output_file, "out.csv");
    EXPECT_DOUBLE_EQ(opts.params.cutoff, 0.2);
    EXPECT_DOUBLE_EQ(opts.params.mu, 9.0);
    EXPECT_DOUBLE_EQ(opts.converter.pseudocount, 1e-4);
    EXPECT_EQ(opts.converter.reference, EnergyReference::BACKGROUND);
    EXPECT_FALSE(opts.meme_background);
    EXPECT_TRUE(opts.format.empty());
    EXPECT_TRUE(opts.motifs.empty());
    EXPECT_EQ(opts.threads, 0);
    EXPECT_EQ(opts.log_level, LogLevel::INFO);
}

TEST(ParseArgs, ModelOptions) {
    Options opts = parse({"--cutoff", "0.35", "d.csv", "--mu", "12.5", "p.meme", "o.csv",
                          "--rt", "2.5", "--pseudocount", "0.001", "--reference", "consensus"});
    EXPECT_DOUBLE_EQ(opts.params.cutoff, 0.35);
    EXPECT_DOUBLE_EQ(opts.params.mu, 12.5);
    EXPECT_DOUBLE_EQ(opts.converter.rt, 2.5);
    EXPECT_DOUBLE_EQ(opts.converter.pseudocount, 0.001);
    EXPECT_EQ(opts.converter.reference, EnergyReference::CONSENSUS);
    EXPECT_EQ(opts.output_file, "o.csv");
}

TEST(ParseArgs, OutputOptions) {
    Options opts = parse({"d.fa", "p.meme", "-", "--format", "json", "--landscape", "l.tsv",
                          "--summary", "s.csv", "--restriction-sites", "GAATTC, GGATCC",
                          "--motif", "AT", "--motif", "GGG", "-t", "4", "--quiet",
                          "--meme-background"});
    EXPECT_EQ(opts.output_file, "-");
    EXPECT_EQ(opts.format, "json");
    EXPECT_EQ(opts.landscape_file, "l.tsv");
    EXPECT_EQ(opts.summary_file, "s.csv");
    ASSERT_EQ(opts.restriction_sites.size(), 2u);
    EXPECT_EQ(opts.restriction_sites[1], "GGATCC");
    ASSERT_EQ(opts.motifs.size(), 2u);
    EXPECT_EQ(opts.motifs[0], "AT");
    EXPECT_EQ(opts.threads, 4);
    EXPECT_EQ(opts.log_level, LogLevel::WARNING);
    EXPECT_TRUE(opts.meme_background);
}

TEST(ParseArgs, Background) {
    Options opts = parse({"--background", "0.3,0.2,0.2,0.3", "d", "p", "o"});
    EXPECT_DOUBLE_EQ(opts.converter.background[BASE_A], 0.3);
    EXPECT_DOUBLE_EQ(opts.converter.background[BASE_C], 0.2);
}

TEST(ParseArgs, DebugLevel) {
    EXPECT_EQ(parse({"--debug", "d", "p", "o"}).log_level, LogLevel::DEBUG);
}

TEST(ParseArgs, HelpAndVersionExitZero) {
    EXPECT_EQ(exit_code_of({"--help"}), 0);
    EXPECT_EQ(exit_code_of({"-h"}), 0);
    EXPECT_EQ(exit_code_of({"--version"}), 0);
}

TEST(ParseArgs, UsageErrorsExitOne) {
    EXPECT_EQ(exit_code_of({}), 1);
    EXPECT_EQ(exit_code_of({"d", "p"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "extra"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--cutoff"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--cutoff", "abc"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--mu", "9x"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--threads", "-2"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--threads", "two"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--reference", "max"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--format", "xml"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--background", "0.5,0.5"}), 1);
    EXPECT_EQ(exit_code_of({"d", "p", "o", "--unknown"}), 1);
}

TEST(ParseArgs, ErrorMessage) {
    try {
        parse({"d", "p", "o", "--cutoff", "abc"});
        FAIL() << "Expected ParseArgsExit";
    } catch (const ParseArgsExit& e) {
        EXPECT_EQ(std::string(e.what()), "Error: Invalid number for --cutoff: abc");
    }
}

// ============================================================================
// Helpers: background, lists, motif selection
// ============================================================================

TEST(ParseBackground, Positional) {
    MatrixRow bg = parse_background("0.1, 0.2, 0.3, 0.4");
    EXPECT_DOUBLE_EQ(bg[BASE_A], 0.1);
    EXPECT_DOUBLE_EQ(bg[BASE_C], 0.2);
    EXPECT_DOUBLE_EQ(bg[BASE_G], 0.3);
    EXPECT_DOUBLE_EQ(bg[BASE_T], 0.4);
}

TEST(ParseBackground, Keyed) {
    MatrixRow bg = parse_background("T:0.4,G:0.3,c:0.2,A:0.1");
    EXPECT_DOUBLE_EQ(bg[BASE_A], 0.1);
    EXPECT_DOUBLE_EQ(bg[BASE_C], 0.2);
    EXPECT_DOUBLE_EQ(bg[BASE_G], 0.3);
    EXPECT_DOUBLE_EQ(bg[BASE_T], 0.4);
}

TEST(ParseBackground, Invalid) {
    EXPECT_THROW(parse_background("0.25,0.25,0.25"), std::invalid_argument);
    EXPECT_THROW(parse_background("A:0.25,A:0.25,G:0.25,T:0.25"), std::invalid_argument);
    EXPECT_THROW(parse_background("N:0.25,C:0.25,G:0.25,T:0.25"), std::invalid_argument);
    EXPECT_THROW(parse_background("0.25,x,0.25,0.25"), std::invalid_argument);
}

TEST(SplitList, TrimsAndDropsEmpty) {
    auto items = split_list(" GAATTC, ,GGATCC ,");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "GAATTC");
    EXPECT_EQ(items[1], "GGATCC");
    EXPECT_TRUE(split_list("").empty());
}

TEST(SelectMotifs, Subset) {
    MotifCollection all;
    all.emplace("A", MotifMatrix::from_energies("A", {MatrixRow{{0.0, 1.0, 1.0, 1.0}}}));
    all.emplace("B", MotifMatrix::from_energies("B", {MatrixRow{{1.0, 0.0, 1.0, 1.0}}}));

    EXPECT_EQ(select_motifs(all, {}).size(), 2u);

    MotifCollection subset = select_motifs(all, {"B"});
    ASSERT_EQ(subset.size(), 1u);
    EXPECT_EQ(subset.begin()->first, "B");

    EXPECT_THROW(select_motifs(all, {"C"}), InvalidParameterError);
}

// ============================================================================
// run_scan end to end
// ============================================================================

TEST(RunScan, WritesSiteTable) {
    TempDir dir;
    write_text(dir.file("motifs.meme"), MOTIF_FILE);
    write_text(dir.file("data.csv"), "label,sequence\ns1,CCATCC\ns2,CCCCCC\n");

    Options opts = parse({dir.file("data.csv"), dir.file("motifs.meme"), dir.file("out.csv"),
                          "--mu", "2", "--cutoff", "0.5", "--motif", "AT", "--quiet"});
    EXPECT_EQ(run_scan(opts), 0);

    auto lines = split_lines(read_file(dir.file("out.csv")));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "label,position,motif,strand,motif_length,occupancy");
    EXPECT_EQ(lines[1].substr(0, 15), "s1,2,AT,F,2,0.9");
    EXPECT_EQ(lines[2].substr(0, 15), "s1,2,AT,R,2,0.9");
}

TEST(RunScan, DebugLogDescribesMotifs) {
    TempDir dir;
    write_text(dir.file("motifs.meme"),
               "MOTIF MA0001.1 AGL3\n"
               "letter-probability matrix: alength= 4 w= 2 nsites= 37 E= 0\n"
               "0.97 0.01 0.01 0.01\n"
               "0.01 0.01 0.01 0.97\n");
    write_text(dir.file("data.csv"), "label,sequence\ns1,CCATCC\n");

    Options opts = parse({dir.file("data.csv"), dir.file("motifs.meme"), dir.file("out.csv")});

    LogLevel saved_level = get_log_level();
    set_log_level(LogLevel::DEBUG);
    std::ostringstream captured;
    std::streambuf* saved_buf = std::cerr.rdbuf(captured.rdbuf());
    int rc = run_scan(opts);
    std::cerr.rdbuf(saved_buf);
    set_log_level(saved_level);

    EXPECT_EQ(rc, 0);
    EXPECT_NE(captured.str().find("Motif MA0001.1 AGL3 (w=2, nsites=37, consensus AT)"),
              std::string::npos) << captured.str();
}

TEST(RunScan, WritesLandscapeAndSummary) {
    TempDir dir;
    write_text(dir.file("motifs.meme"), MOTIF_FILE);
    write_text(dir.file("seqs.fa"), ">s1\nccatcc\n>s2\nGGGAATTC\n");

    Options opts = parse({dir.file("seqs.fa"), dir.file("motifs.meme"), dir.file("out/sites.tsv"),
                          "--mu", "2", "--landscape", dir.file("out/landscape.csv"),
                          "--summary", dir.file("out/summary.csv"),
                          "--restriction-sites", "GAATTC", "-t", "2", "--quiet"});
    EXPECT_EQ(run_scan(opts), 0);

    auto sites = split_lines(read_file(dir.file("out/sites.tsv")));
    ASSERT_GE(sites.size(), 2u);
    EXPECT_EQ(sites[0], "label\tposition\tmotif\tstrand\tmotif_length\toccupancy");

    auto landscape = split_lines(read_file(dir.file("out/landscape.csv")));
    // header + 6 rows for s1 + 8 rows for s2
    ASSERT_EQ(landscape.size(), 15u);
    EXPECT_EQ(landscape[0], "label,position,AT_F,AT_R,GGG_F,GGG_R");
    EXPECT_EQ(landscape[6], "s1,5,0,0,0,0");

    auto summary = split_lines(read_file(dir.file("out/summary.csv")));
    ASSERT_EQ(summary.size(), 3u);
    EXPECT_EQ(summary[0], "label,length,gc_content,has_restriction_site,sites,expected_bound");
    EXPECT_EQ(summary[1].substr(0, 30), "s1,6,0.6666666666666666,false,");
    EXPECT_EQ(summary[2].substr(0, 14), "s2,8,0.5,true,");
}

TEST(RunScan, UnknownMotifFails) {
    TempDir dir;
    write_text(dir.file("motifs.meme"), MOTIF_FILE);
    write_text(dir.file("data.csv"), "sequence\nACGT\n");

    Options opts = parse({dir.file("data.csv"), dir.file("motifs.meme"), dir.file("out.csv"),
                          "--motif", "CTCF", "--quiet"});
    EXPECT_THROW(run_scan(opts), InvalidParameterError);
}

TEST(RunScan, InvalidCutoffFails) {
    TempDir dir;
    Options opts = parse({dir.file("data.csv"), dir.file("motifs.meme"), dir.file("out.csv"),
                          "--cutoff", "1.5", "--quiet"});
    EXPECT_THROW(run_scan(opts), InvalidParameterError);
}

TEST(RunScan, MissingMotifFileFails) {
    TempDir dir;
    write_text(dir.file("data.csv"), "sequence\nACGT\n");
    Options opts = parse({dir.file("data.csv"), dir.file("missing.meme"), dir.file("out.csv"),
                          "--quiet"});
    EXPECT_THROW(run_scan(opts), FileFormatError);
}
