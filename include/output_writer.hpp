/**
 * Output Writer - gene table output formats
 *
 * Supports TSV (default) and JSON.
 */

#ifndef LOCTOGENE_OUTPUT_WRITER_HPP
#define LOCTOGENE_OUTPUT_WRITER_HPP

#include "annotator.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <zlib.h>

namespace loctogene {

/**
 * Output format types
 */
enum class OutputFormat {
    TSV,    // Tab-separated gene table (default)
    JSON    // Array of per-location objects
};

/**
 * Parse output format from string
 * @throws InputError for anything other than "tsv" or "json"
 */
inline OutputFormat parse_output_format(const std::string& format) {
    std::string lower = format;
    for (size_t i = 0; i < lower.size(); ++i) {
        lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(lower[i])));
    }

    if (lower == "json") return OutputFormat::JSON;
    if (lower == "tsv") return OutputFormat::TSV;
    throw InputError("Unknown output format: " + format + " (expected tsv or json)");
}

/**
 * Statistics collector for annotation summary
 */
struct AnnotationStats {
    int total_locations = 0;
    int with_genes_within = 0;
    int without_genes_within = 0;
    int failed_locations = 0;
    std::map<std::string, int> label_counts;    // per gene in the within lists

    void add(const GeneAnnotation& ann) {
        total_locations++;
        if (!ann.has_genes_within()) {
            without_genes_within++;
            return;
        }

        with_genes_within++;
        for (const auto& label : ann.labels) {
            label_counts[label.empty() ? "none" : label]++;
        }
    }

    void add_failure() {
        total_locations++;
        failed_locations++;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "=== Annotation Statistics ===\n";
        oss << "Total locations: " << total_locations << "\n";
        oss << "With genes within: " << with_genes_within << "\n";
        oss << "Without genes within: " << without_genes_within << "\n";
        oss << "Failed: " << failed_locations << "\n";
        oss << "\nLabel counts:\n";
        for (const auto& pair : label_counts) {
            oss << "  " << pair.first << ": " << pair.second << "\n";
        }
        return oss.str();
    }
};

inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

inline std::string escape_json(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

/**
 * Abstract base class for output writers.
 *
 * Owns the destination: stdout for "" or "-", gzip for paths ending in
 * .gz, a plain file otherwise.
 */
class OutputWriter {
public:
    explicit OutputWriter(const std::string& output_path)
        : output_path_(output_path),
          use_stdout_(output_path.empty() || output_path == "-") {

        if (use_stdout_) return;

        if (ends_with_gz(output_path_)) {
            gz_file_ = gzopen(output_path_.c_str(), "wb");
            if (!gz_file_) {
                throw InputError("Cannot open output file: " + output_path_);
            }
        } else {
            output_.open(output_path_);
            if (!output_.is_open()) {
                throw InputError("Cannot open output file: " + output_path_);
            }
        }
    }

    virtual ~OutputWriter() {
        close_output();
    }

    OutputWriter(const OutputWriter&) = delete;
    OutputWriter& operator=(const OutputWriter&) = delete;

    virtual void write_header() = 0;
    virtual void write_annotation(const Location& location, const GeneAnnotation& ann) = 0;
    virtual void write_footer() = 0;

    void close() { close_output(); }

    /**
     * Write every successful result of a batch in input order; failed and
     * skipped locations are only counted.
     */
    void write_results(const std::vector<LocationResult>& results) {
        for (const auto& result : results) {
            if (result.ok) {
                write_annotation(result.location, result.annotation);
            } else if (!result.skipped) {
                stats_.add_failure();
            }
        }
    }

    const AnnotationStats& get_stats() const { return stats_; }

protected:
    AnnotationStats stats_;

    void write_string(const std::string& s) {
        if (use_stdout_) {
            std::cout << s;
        } else if (gz_file_) {
            if (gzwrite(gz_file_, s.c_str(), static_cast<unsigned int>(s.size())) == 0 && !s.empty()) {
                throw InputError("Error writing output file: " + output_path_);
            }
        } else {
            output_ << s;
        }
    }

private:
    std::string output_path_;
    bool use_stdout_;
    std::ofstream output_;
    gzFile gz_file_ = nullptr;

    void close_output() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (output_.is_open()) {
            output_.close();
        }
        if (use_stdout_) {
            std::cout.flush();
        }
    }
};

/**
 * TSV gene table: one row per location, the within lists ';'-joined, then
 * one block of four columns per closest-gene slot. Slots beyond the genes
 * found are filled with "n/a".
 */
class TSVWriter : public OutputWriter {
public:
    TSVWriter(const std::string& output_path, const TSSRegion& tss_region, size_t closest_n)
        : OutputWriter(output_path), tss_region_(tss_region), closest_n_(closest_n) {}

    ~TSVWriter() override = default;

    std::vector<std::string> header_columns() const {
        std::string prom = "(prom=-" + std::to_string(tss_region_.offset_5p() / 1000) +
                           "/+" + std::to_string(tss_region_.offset_3p() / 1000) + "kb)";

        std::vector<std::string> headers;
        headers.push_back("Location");
        headers.push_back("ID");
        headers.push_back("Gene Symbol");
        headers.push_back("Relative To Gene " + prom);
        headers.push_back("TSS Distance");

        for (size_t i = 1; i <= closest_n_; ++i) {
            std::string slot = "#" + std::to_string(i);
            headers.push_back(slot + " Closest ID");
            headers.push_back(slot + " Closest Gene Symbols");
            headers.push_back(slot + " Relative To Closest Gene " + prom);
            headers.push_back(slot + " TSS Closest Distance");
        }
        return headers;
    }

    void write_header() override {
        write_string(join(header_columns(), "\t") + "\n");
    }

    void write_annotation(const Location& location, const GeneAnnotation& ann) override {
        stats_.add(ann);

        std::vector<std::string> row;
        row.reserve(5 + 4 * closest_n_);
        row.push_back(location.to_string());
        row.push_back(ann.joined_gene_ids());
        row.push_back(ann.joined_gene_symbols());
        row.push_back(ann.joined_labels());
        row.push_back(ann.joined_tss_dists());

        for (size_t i = 0; i < closest_n_; ++i) {
            if (i < ann.closest_genes.size()) {
                const auto& gene = ann.closest_genes[i];
                row.push_back(gene.gene_id);
                row.push_back(gene.gene_symbol);
                row.push_back(gene.label);
                row.push_back(std::to_string(gene.tss_dist));
            } else {
                row.insert(row.end(), 4, std::string(NA));
            }
        }

        write_string(join(row, "\t") + "\n");
    }

    void write_footer() override {
        // TSV has no footer
    }

private:
    TSSRegion tss_region_;
    size_t closest_n_;
};

/**
 * JSON output: an array with one object per location
 */
class JSONWriter : public OutputWriter {
public:
    explicit JSONWriter(const std::string& output_path)
        : OutputWriter(output_path) {}

    ~JSONWriter() override = default;

    void write_header() override {
        write_string("[");
    }

    void write_annotation(const Location& location, const GeneAnnotation& ann) override {
        stats_.add(ann);

        std::ostringstream json;
        json << (first_ ? "\n" : ",\n");
        first_ = false;

        json << "  {\n";
        json << "    \"location\": \"" << escape_json(location.to_string()) << "\",\n";
        json << "    \"gene_ids\": " << string_array(ann.gene_ids) << ",\n";
        json << "    \"gene_symbols\": " << string_array(ann.gene_symbols) << ",\n";
        json << "    \"labels\": " << string_array(ann.labels) << ",\n";
        json << "    \"tss_dists\": " << string_array(ann.tss_dists) << ",\n";
        json << "    \"closest_genes\": [";

        for (size_t i = 0; i < ann.closest_genes.size(); ++i) {
            const auto& gene = ann.closest_genes[i];
            json << (i == 0 ? "\n" : ",\n");
            json << "      {\"gene_id\": \"" << escape_json(gene.gene_id) << "\", "
                 << "\"gene_symbol\": \"" << escape_json(gene.gene_symbol) << "\", "
                 << "\"label\": \"" << escape_json(gene.label) << "\", "
                 << "\"tss_dist\": " << gene.tss_dist << "}";
        }
        if (!ann.closest_genes.empty()) json << "\n    ";
        json << "]\n";
        json << "  }";

        write_string(json.str());
    }

    void write_footer() override {
        write_string(first_ ? "]\n" : "\n]\n");
    }

private:
    bool first_ = true;

    static std::string string_array(const std::vector<std::string>& values) {
        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out += ", ";
            out += "\"" + escape_json(values[i]) + "\"";
        }
        return out + "]";
    }
};

/**
 * Factory function to create output writer
 */
inline std::unique_ptr<OutputWriter> create_output_writer(
    const std::string& output_path,
    OutputFormat format,
    const TSSRegion& tss_region,
    size_t closest_n) {

    if (format == OutputFormat::JSON) {
        return std::make_unique<JSONWriter>(output_path);
    }
    return std::make_unique<TSVWriter>(output_path, tss_region, closest_n);
}

} // namespace loctogene

#endif // LOCTOGENE_OUTPUT_WRITER_HPP
