/**
 * loctogene - Main Entry Point
 *
 * Annotates genomic locations with the genes they fall in or near and the
 * N genes with the closest TSS.
 */

#include "annotator.hpp"
#include "gene_store.hpp"
#include "input_parser.hpp"
#include "output_writer.hpp"
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "loctogene - Genomic Location to Gene Annotation\n"
              << "===============================================\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Required Data Files:\n"
              << "  --genes FILE            Gene models: GTF (.gtf/.gtf.gz), gene table\n"
              << "                          (.tsv/.tsv.gz) or tabix-indexed gene table\n"
              << "                          (.tsv.gz with .tbi, requires htslib)\n\n"
              << "Location Input (at least one):\n"
              << "  -l, --location REGION   Location to annotate, CHR:START-END or CHR:POS\n"
              << "                          (can be used multiple times)\n"
              << "  -i, --input FILE        File of locations, one per line: CHR:START-END\n"
              << "                          or BED (CHR<TAB>START<TAB>END, 0-based)\n\n"
              << "Annotation Options:\n"
              << "  --tss 5P,3P             Promoter window around the TSS in bp\n"
              << "                          (default: 2000,1000)\n"
              << "  -n, --closest N         Number of closest genes to report (default: 10)\n"
              << "  --threads N             Worker threads for batch annotation (default: 1)\n"
              << "  --fail-fast             Stop at the first location that fails\n\n"
              << "Output Options:\n"
              << "  -o, --output FILE       Output file path, .gz to compress (default: stdout)\n"
              << "  --format FORMAT         tsv or json (default: tsv)\n"
              << "  --stats                 Print annotation statistics to stderr\n\n"
              << "Other Options:\n"
              << "  --config FILE           Read options from FILE (key = value per line)\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n"
              << "  --quiet                 Only log warnings and errors\n\n"
              << "Examples:\n"
              << "  # Annotate a single location\n"
              << "  " << program_name << " --genes genes.gtf.gz -l chr3:187745448-187745468\n\n"
              << "  # Annotate a BED file on 4 threads, 5 closest genes, JSON output\n"
              << "  " << program_name << " --genes genes.tsv.gz -i peaks.bed -n 5 \\\n"
              << "      --threads 4 --format json -o peaks_genes.json\n"
              << std::endl;
}

// Parse a positive integer option value
static bool parse_positive(const std::string& text, int& value) {
    if (text.empty() || text.size() > 9) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    value = std::stoi(text);
    return value > 0;
}

int main(int argc, char* argv[]) {
    std::string genes_path;
    std::vector<std::string> location_args;
    std::string input_path;
    std::string output_path = "-";
    std::string format = "tsv";
    std::string tss_arg = "2000,1000";
    int closest_n = 10;
    int threads = 1;
    bool fail_fast = false;
    bool show_stats = false;
    bool debug = false;
    bool quiet = false;

    // Config file options go first so the command line overrides them
    std::vector<std::string> args;
    std::vector<std::string> cli_args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            try {
                auto config_args = loctogene::read_config_file(argv[++i]);
                args.insert(args.end(), config_args.begin(), config_args.end());
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                return 1;
            }
        } else {
            cli_args.push_back(arg);
        }
    }
    args.insert(args.end(), cli_args.begin(), cli_args.end());

    // Parse command line arguments
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--genes" && has_value) {
            genes_path = args[++i];
        } else if ((arg == "-l" || arg == "--location") && has_value) {
            location_args.push_back(args[++i]);
        } else if ((arg == "-i" || arg == "--input") && has_value) {
            input_path = args[++i];
        } else if ((arg == "-o" || arg == "--output") && has_value) {
            output_path = args[++i];
        } else if (arg == "--format" && has_value) {
            format = args[++i];
        } else if (arg == "--tss" && has_value) {
            tss_arg = args[++i];
        } else if ((arg == "-n" || arg == "--closest") && has_value) {
            if (!parse_positive(args[++i], closest_n)) {
                std::cerr << "Error: --closest expects a positive integer, got: " << args[i] << std::endl;
                return 1;
            }
        } else if (arg == "--threads" && has_value) {
            if (!parse_positive(args[++i], threads)) {
                std::cerr << "Error: --threads expects a positive integer, got: " << args[i] << std::endl;
                return 1;
            }
        } else if (arg == "--fail-fast") {
            fail_fast = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        loctogene::set_log_level(loctogene::LogLevel::DEBUG);
    } else if (quiet) {
        loctogene::set_log_level(loctogene::LogLevel::WARNING);
    }

    // Validate required arguments
    if (genes_path.empty()) {
        std::cerr << "Error: --genes is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (location_args.empty() && input_path.empty()) {
        std::cerr << "Error: Either --location or --input is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::vector<loctogene::LocationResult> results;
    loctogene::AnnotationStats stats;

    try {
        loctogene::TSSRegion tss_region = loctogene::parse_tss_region(tss_arg);
        loctogene::OutputFormat output_format = loctogene::parse_output_format(format);

        std::vector<loctogene::Location> locations;
        for (const auto& text : location_args) {
            locations.push_back(loctogene::Location::parse(text));
        }
        if (!input_path.empty()) {
            auto from_file = loctogene::read_locations(input_path);
            locations.insert(locations.end(), from_file.begin(), from_file.end());
        }

        auto store = loctogene::open_gene_store(genes_path);
        loctogene::log(loctogene::LogLevel::INFO, "Gene store: " + store->get_stats());

        loctogene::Annotator annotator(store, tss_region, static_cast<size_t>(closest_n));

        loctogene::BatchOptions options;
        options.threads = threads;
        options.fail_fast = fail_fast;

        results = loctogene::annotate_batch(annotator, locations, options);

        auto writer = loctogene::create_output_writer(output_path, output_format, tss_region,
                                                      static_cast<size_t>(closest_n));
        writer->write_header();
        writer->write_results(results);
        writer->write_footer();
        writer->close();

        stats = writer->get_stats();

    } catch (const loctogene::StoreError& e) {
        // --fail-fast rethrows the first failed location
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (show_stats) {
        std::cerr << stats.to_string();
    }

    if (stats.failed_locations > 0) {
        loctogene::log(loctogene::LogLevel::WARNING,
                       std::to_string(stats.failed_locations) + " of " +
                       std::to_string(results.size()) + " locations could not be annotated");
        return 2;
    }

    return 0;
}
