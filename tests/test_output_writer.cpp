/**
 * Tests for the TSV and JSON gene table writers and annotation statistics
 */

#include <gtest/gtest.h>
#include "output_writer.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace loctogene;
using namespace loctogene_test;

static GeneAnnotation promoter_annotation() {
    GeneAnnotation ann;
    ann.gene_ids = {"GENE1", "GENE2"};
    ann.gene_symbols = {"G1SYM", "G2SYM"};
    ann.labels = {"promoter,intronic", "exonic"};
    ann.tss_dists = {"-8", "1200"};

    ClosestGene closest;
    closest.gene_id = "GENE1";
    closest.gene_symbol = "G1SYM";
    closest.label = "promoter,intronic";
    closest.tss_dist = -8;
    ann.closest_genes.push_back(closest);
    return ann;
}

static GeneAnnotation empty_annotation() {
    GeneAnnotation ann;
    ann.gene_ids = {NA};
    ann.gene_symbols = {NA};
    ann.labels = {NA};
    ann.tss_dists = {NA};
    return ann;
}

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, '\t')) fields.push_back(field);
    return fields;
}

// ============================================================================
// Output format
// ============================================================================

TEST(OutputFormat, ParseKnownFormats) {
    EXPECT_EQ(parse_output_format("tsv"), OutputFormat::TSV);
    EXPECT_EQ(parse_output_format("TSV"), OutputFormat::TSV);
    EXPECT_EQ(parse_output_format("json"), OutputFormat::JSON);
    EXPECT_EQ(parse_output_format("Json"), OutputFormat::JSON);
}

TEST(OutputFormat, UnknownFormatIsInputError) {
    EXPECT_THROW(parse_output_format("vcf"), InputError);
    EXPECT_THROW(parse_output_format(""), InputError);
}

TEST(EscapeJson, SpecialCharacters) {
    EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_json("a\\b"), "a\\\\b");
    EXPECT_EQ(escape_json("a\tb\n"), "a\\tb\\n");
    EXPECT_EQ(escape_json("plain"), "plain");
}

TEST(EscapeJson, OtherControlBytesUseUnicodeEscape) {
    EXPECT_EQ(escape_json("A\x01" "B"), "A\\u0001B");
    EXPECT_EQ(escape_json(std::string("x\0y", 3)), "x\\u0000y");
    EXPECT_EQ(escape_json("\x1f"), "\\u001f");
}

// ============================================================================
// TSV writer
// ============================================================================

TEST(TSVWriter, HeaderColumns) {
    TempFile file(".tsv");
    TSVWriter writer(file.path(), TSSRegion(2000, 1000), 2);

    std::vector<std::string> expected = {
        "Location",
        "ID",
        "Gene Symbol",
        "Relative To Gene (prom=-2/+1kb)",
        "TSS Distance",
        "#1 Closest ID",
        "#1 Closest Gene Symbols",
        "#1 Relative To Closest Gene (prom=-2/+1kb)",
        "#1 TSS Closest Distance",
        "#2 Closest ID",
        "#2 Closest Gene Symbols",
        "#2 Relative To Closest Gene (prom=-2/+1kb)",
        "#2 TSS Closest Distance"
    };
    EXPECT_EQ(writer.header_columns(), expected);
}

TEST(TSVWriter, HeaderUsesWholeKilobases) {
    TempFile file(".tsv");
    TSVWriter writer(file.path(), TSSRegion(2500, 500), 1);
    EXPECT_EQ(writer.header_columns()[3], "Relative To Gene (prom=-2/+0kb)");
}

TEST(TSVWriter, RowPadsMissingClosestSlots) {
    TempFile file(".tsv");
    {
        TSVWriter writer(file.path(), TSSRegion(2000, 1000), 2);
        writer.write_header();
        writer.write_annotation(Location("chr3", 187745448, 187745468), promoter_annotation());
        writer.write_footer();
    }

    auto lines = split_lines(read_file(file.path()));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(split_tabs(lines[0]).size(), 13u);

    auto row = split_tabs(lines[1]);
    ASSERT_EQ(row.size(), 13u);
    EXPECT_EQ(row[0], "chr3:187745448-187745468");
    EXPECT_EQ(row[1], "GENE1;GENE2");
    EXPECT_EQ(row[2], "G1SYM;G2SYM");
    EXPECT_EQ(row[3], "promoter,intronic;exonic");
    EXPECT_EQ(row[4], "-8;1200");
    EXPECT_EQ(row[5], "GENE1");
    EXPECT_EQ(row[6], "G1SYM");
    EXPECT_EQ(row[7], "promoter,intronic");
    EXPECT_EQ(row[8], "-8");
    for (size_t i = 9; i < 13; ++i) {
        EXPECT_EQ(row[i], "n/a");
    }
}

TEST(TSVWriter, SentinelRow) {
    TempFile file(".tsv");
    {
        TSVWriter writer(file.path(), TSSRegion(2000, 1000), 1);
        writer.write_annotation(Location("chrUn", 1, 100), empty_annotation());
    }

    EXPECT_EQ(read_file(file.path()),
              "chrUn:1-100\tn/a\tn/a\tn/a\tn/a\tn/a\tn/a\tn/a\tn/a\n");
}

TEST(TSVWriter, GzipOutput) {
    TempFile file(".tsv.gz");
    {
        TSVWriter writer(file.path(), TSSRegion(2000, 1000), 1);
        writer.write_header();
        writer.write_annotation(Location("chr3", 187745448, 187745468), promoter_annotation());
        writer.close();
    }

    auto lines = split_lines(read_gz_file(file.path()));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].compare(0, 8, "Location"), 0);
    EXPECT_EQ(split_tabs(lines[1])[1], "GENE1;GENE2");
}

TEST(TSVWriter, UnwritablePathIsInputError) {
    EXPECT_THROW(TSVWriter("/nonexistent/dir/out.tsv", TSSRegion(2000, 1000), 1), InputError);
}

// ============================================================================
// JSON writer
// ============================================================================

TEST(JSONWriter, WritesArrayOfObjects) {
    TempFile file(".json");
    {
        JSONWriter writer(file.path());
        writer.write_header();
        writer.write_annotation(Location("chr3", 187745448, 187745468), promoter_annotation());
        writer.write_annotation(Location("chrUn", 1, 100), empty_annotation());
        writer.write_footer();
    }

    std::string json = read_file(file.path());
    EXPECT_EQ(json.front(), '[');
    EXPECT_EQ(json.substr(json.size() - 2), "]\n");
    EXPECT_NE(json.find("\"location\": \"chr3:187745448-187745468\""), std::string::npos);
    EXPECT_NE(json.find("\"gene_ids\": [\"GENE1\", \"GENE2\"]"), std::string::npos);
    EXPECT_NE(json.find("\"labels\": [\"promoter,intronic\", \"exonic\"]"), std::string::npos);
    EXPECT_NE(json.find("\"tss_dists\": [\"-8\", \"1200\"]"), std::string::npos);
    EXPECT_NE(json.find("{\"gene_id\": \"GENE1\", \"gene_symbol\": \"G1SYM\", "
                        "\"label\": \"promoter,intronic\", \"tss_dist\": -8}"),
              std::string::npos);
    EXPECT_NE(json.find("\"gene_ids\": [\"n/a\"]"), std::string::npos);
    EXPECT_NE(json.find("\"closest_genes\": []"), std::string::npos);
}

TEST(JSONWriter, EmptyOutputIsEmptyArray) {
    TempFile file(".json");
    {
        JSONWriter writer(file.path());
        writer.write_header();
        writer.write_footer();
    }
    EXPECT_EQ(read_file(file.path()), "[]\n");
}

// ============================================================================
// Statistics and batch results
// ============================================================================

TEST(AnnotationStats, CountsLocationsAndLabels) {
    AnnotationStats stats;
    stats.add(promoter_annotation());
    stats.add(empty_annotation());

    GeneAnnotation unlabeled = empty_annotation();
    unlabeled.gene_ids = {"GENE3"};
    unlabeled.gene_symbols = {"G3SYM"};
    unlabeled.labels = {""};
    unlabeled.tss_dists = {"-2500"};
    stats.add(unlabeled);
    stats.add_failure();

    EXPECT_EQ(stats.total_locations, 4);
    EXPECT_EQ(stats.with_genes_within, 2);
    EXPECT_EQ(stats.without_genes_within, 1);
    EXPECT_EQ(stats.failed_locations, 1);
    EXPECT_EQ(stats.label_counts["promoter,intronic"], 1);
    EXPECT_EQ(stats.label_counts["exonic"], 1);
    EXPECT_EQ(stats.label_counts["none"], 1);

    std::string report = stats.to_string();
    EXPECT_NE(report.find("Total locations: 4"), std::string::npos);
    EXPECT_NE(report.find("Failed: 1"), std::string::npos);
}

TEST(OutputWriter, WriteResultsSkipsFailedAndCancelled) {
    std::vector<LocationResult> results(3);

    results[0].location = Location("chr3", 187745448, 187745468);
    results[0].ok = true;
    results[0].annotation = promoter_annotation();

    results[1].location = Location("chr1", 5, 10);
    results[1].error = "features_overlapping failed for chr1:5-10: connection lost";

    results[2].location = Location("chr1", 50, 60);
    results[2].skipped = true;

    TempFile file(".tsv");
    AnnotationStats stats;
    {
        TSVWriter writer(file.path(), TSSRegion(2000, 1000), 1);
        writer.write_results(results);
        stats = writer.get_stats();
    }

    auto lines = split_lines(read_file(file.path()));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(split_tabs(lines[0])[0], "chr3:187745448-187745468");

    EXPECT_EQ(stats.total_locations, 2);
    EXPECT_EQ(stats.with_genes_within, 1);
    EXPECT_EQ(stats.failed_locations, 1);
}

TEST(OutputWriter, FactoryPicksWriterByFormat) {
    TempFile tsv(".tsv");
    TempFile json(".json");

    auto tsv_writer = create_output_writer(tsv.path(), OutputFormat::TSV, TSSRegion(2000, 1000), 3);
    auto json_writer = create_output_writer(json.path(), OutputFormat::JSON, TSSRegion(2000, 1000), 3);

    auto* as_tsv = dynamic_cast<TSVWriter*>(tsv_writer.get());
    ASSERT_NE(as_tsv, nullptr);
    EXPECT_EQ(as_tsv->header_columns().size(), 5u + 4u * 3u);
    EXPECT_NE(dynamic_cast<JSONWriter*>(json_writer.get()), nullptr);
}
