#include "core/version.hpp"
#include "fastaclass/report.hpp"
#include "io/fasta_reader.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace fastaclass;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [<file.fasta>]\n"
        "\n"
        "Input:\n"
        "  <file.fasta>            FASTA file (default: example.fasta)\n"
        "  -in <path>              Same as the positional argument\n"
        "\n"
        "Options:\n"
        "  -o <path>               Output report file (default: stdout)\n"
        "  -summary                Append per-alphabet record counts\n"
        "  -v, --verbose           Verbose logging\n"
        "  --version               Print version and exit\n"
        "  -h, --help              Show this help\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv,
                  {"-summary", "-v", "--verbose", "--version", "-h", "--help"});

    if (check_version(cli, "fastaclass")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    std::string input_path = "example.fasta";
    if (cli.has("-in")) {
        input_path = cli.get_string("-in");
    } else if (!cli.positional().empty()) {
        input_path = cli.positional().front();
    }
    if (cli.positional().size() > 1 ||
        (cli.has("-in") && !cli.positional().empty())) {
        std::fprintf(stderr, "Error: only one input file may be given\n");
        print_usage(argv[0]);
        return 1;
    }

    Logger logger = make_logger(cli);

    FastaReader reader(input_path);
    if (!reader.is_fasta()) {
        std::fprintf(stderr, "Error: %s is not in FASTA format or was not found\n",
                     input_path.c_str());
        return 1;
    }

    // Open output
    std::string output_path = cli.get_string("-o");
    std::ofstream out_file;
    std::ostream* out_ptr = &std::cout;
    if (!output_path.empty() && output_path != "-") {
        out_file.open(output_path);
        if (!out_file.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
            return 1;
        }
        out_ptr = &out_file;
    }

    logger.info("Reading %s", input_path.c_str());

    AlphabetTally tally;
    uint64_t n = 0;
    try {
        n = report_records(reader, *out_ptr, tally, logger);
    } catch (const std::exception& e) {
        logger.error("%s", e.what());
        return 1;
    }

    if (cli.has("-summary")) {
        write_summary(*out_ptr, tally);
    }

    out_ptr->flush();
    if (!*out_ptr) {
        std::fprintf(stderr, "Error: failed writing report\n");
        return 1;
    }

    logger.info("Done. %llu record(s).", static_cast<unsigned long long>(n));
    return 0;
}
