/**
 * Gene Store Interface
 *
 * Range and nearest-neighbour queries over gene, transcript and exon
 * features. The annotator only consumes these queries; building the
 * feature index is the job of the store backends below.
 */

#ifndef LOCTOGENE_GENE_STORE_HPP
#define LOCTOGENE_GENE_STORE_HPP

#include "loctogene.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace loctogene {

/**
 * Abstract base class for all gene stores.
 *
 * Implementations must be safe to query from several threads at once.
 * Every query failure is reported as a StoreError.
 */
class GeneStore {
public:
    virtual ~GeneStore() = default;

    /**
     * Short description of the backend and its data file
     */
    virtual std::string name() const = 0;

    /**
     * All features of the given level whose extent, padded by pad bases on
     * both sides, overlaps the location.
     * @param location Query interval
     * @param level Feature granularity
     * @param pad Padding in bp (0 = plain overlap)
     */
    virtual std::vector<GenomicFeature> features_overlapping(
        const Location& location,
        Level level,
        uint32_t pad = 0
    ) const = 0;

    /**
     * Exons of gene_id overlapping the location
     */
    virtual std::vector<GenomicFeature> features_in_exon(
        const Location& location,
        const std::string& gene_id
    ) const = 0;

    /**
     * The n features of the given level whose TSS is nearest the location
     * midpoint, each with dist = tss - mid, ordered by |dist| then gene id.
     */
    virtual std::vector<GenomicFeature> closest_features(
        const Location& location,
        size_t n,
        Level level
    ) const = 0;

    /**
     * Get stats string
     */
    virtual std::string get_stats() const { return name(); }
};

/**
 * Order features by |dist|, then gene id, then id
 */
void sort_by_distance(std::vector<GenomicFeature>& features);

// ============================================================================
// In-memory store
// ============================================================================

/**
 * Gene store holding every feature in memory, indexed per chromosome and
 * level by start position.
 */
class MemoryGeneStore : public GeneStore {
public:
    MemoryGeneStore();
    ~MemoryGeneStore() override;

    MemoryGeneStore(const MemoryGeneStore&) = delete;
    MemoryGeneStore& operator=(const MemoryGeneStore&) = delete;

    /**
     * Load genes, transcripts and exons from a GTF file (.gtf or .gtf.gz).
     * Gene and transcript extents are derived from their children when the
     * file has no explicit gene/transcript rows.
     * @throws InputError if the file cannot be opened
     */
    static std::unique_ptr<MemoryGeneStore> from_gtf(const std::string& gtf_path);

    /**
     * Load a gene table (.tsv or .tsv.gz) with columns
     * chr, start, end, strand, level, id, gene_id, gene_symbol
     * @throws InputError if the file cannot be opened or a row is malformed
     */
    static std::unique_ptr<MemoryGeneStore> from_gene_table(const std::string& table_path);

    /**
     * Add a feature. Call build_index() once all features are added.
     */
    void add_feature(const GenomicFeature& feature);

    /**
     * Sort the per-chromosome indexes. Queries before this see no features.
     */
    void build_index();

    std::string name() const override;

    std::vector<GenomicFeature> features_overlapping(
        const Location& location, Level level, uint32_t pad = 0) const override;

    std::vector<GenomicFeature> features_in_exon(
        const Location& location, const std::string& gene_id) const override;

    std::vector<GenomicFeature> closest_features(
        const Location& location, size_t n, Level level) const override;

    std::string get_stats() const override;

    size_t feature_count(Level level) const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

// ============================================================================
// Tabix-indexed store
// ============================================================================

#ifdef HAVE_HTSLIB

/**
 * Gene store that queries a bgzipped, tabix-indexed gene table on disk
 * (tabix -s1 -b2 -e3). Used for tables too large to hold in memory.
 */
class TabixGeneStore : public GeneStore {
public:
    /**
     * @throws InputError if the file or its .tbi index cannot be opened
     */
    explicit TabixGeneStore(const std::string& table_path);
    ~TabixGeneStore() override;

    TabixGeneStore(const TabixGeneStore&) = delete;
    TabixGeneStore& operator=(const TabixGeneStore&) = delete;

    std::string name() const override;

    std::vector<GenomicFeature> features_overlapping(
        const Location& location, Level level, uint32_t pad = 0) const override;

    std::vector<GenomicFeature> features_in_exon(
        const Location& location, const std::string& gene_id) const override;

    std::vector<GenomicFeature> closest_features(
        const Location& location, size_t n, Level level) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

#endif // HAVE_HTSLIB

/**
 * Parse one gene table row.
 * @return false if the row is blank or a comment
 * @throws InputError if the row is malformed
 */
bool parse_gene_table_line(const std::string& line, GenomicFeature& feature);

/**
 * Open a gene store, choosing the backend from the file name:
 * .gtf / .gtf.gz -> GTF in memory; .gz with a .tbi index -> tabix;
 * anything else -> gene table in memory.
 * @throws InputError if the file cannot be loaded
 */
std::shared_ptr<const GeneStore> open_gene_store(const std::string& path);

} // namespace loctogene

#endif // LOCTOGENE_GENE_STORE_HPP
