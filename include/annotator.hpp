/**
 * Annotator - per-location gene annotation
 *
 * Classifies a location against every gene whose promoter-extended extent
 * overlaps it, collapses transcript hits into one record per gene, and
 * lists the N genes with the nearest TSS.
 */

#ifndef LOCTOGENE_ANNOTATOR_HPP
#define LOCTOGENE_ANNOTATOR_HPP

#include "loctogene.hpp"
#include "gene_store.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace loctogene {

/**
 * One of the N nearest genes to a location
 */
struct ClosestGene {
    std::string gene_id;
    std::string gene_symbol;
    std::string label;
    int tss_dist = 0;
};

/**
 * Annotation of one location.
 *
 * The four "within" lists are co-indexed and ordered by |tss_dist|, then
 * gene id. With no overlapping gene each holds the single value "n/a".
 */
struct GeneAnnotation {
    std::vector<std::string> gene_ids;
    std::vector<std::string> gene_symbols;
    std::vector<std::string> labels;
    std::vector<std::string> tss_dists;

    std::vector<ClosestGene> closest_genes;

    bool has_genes_within() const {
        return !gene_ids.empty() && !(gene_ids.size() == 1 && gene_ids[0] == NA);
    }

    size_t within_count() const { return has_genes_within() ? gene_ids.size() : 0; }

    std::string joined_gene_ids() const { return join(gene_ids, ";"); }
    std::string joined_gene_symbols() const { return join(gene_symbols, ";"); }
    std::string joined_labels() const { return join(labels, ";"); }
    std::string joined_tss_dists() const { return join(tss_dists, ";"); }
};

// ============================================================================
// Aggregator
// ============================================================================

/**
 * Folds transcript-level classifications into one record per gene id.
 *
 * Flags are OR-combined across transcripts. The distance is replaced only
 * by a strictly smaller |d|, so ties keep the first value seen.
 */
class GeneAggregator {
public:
    struct GeneState {
        std::string gene_symbol;
        bool is_promoter = false;
        bool is_exon = false;
        bool is_intronic = false;
        int d = 0;
        int abs_d = 0;

        std::string label() const { return make_label(is_promoter, is_exon, is_intronic); }
    };

    void add(const std::string& gene_id,
             const std::string& gene_symbol,
             const Classification& classification);

    void add(const std::string& gene_id,
             const std::string& gene_symbol,
             bool is_promoter,
             bool is_exon,
             bool is_intronic,
             int d);

    /**
     * Gene ids by ascending |d|, ties by ascending gene id
     */
    std::vector<std::string> ordered_gene_ids() const;

    /**
     * Fill the four within lists of an annotation in order, or with the
     * "n/a" sentinel if no gene was added.
     */
    void build_within_lists(GeneAnnotation& annotation) const;

    const GeneState* get(const std::string& gene_id) const;

    size_t size() const { return genes_.size(); }
    bool empty() const { return genes_.empty(); }

private:
    std::map<std::string, GeneState> genes_;
};

// ============================================================================
// Annotator
// ============================================================================

/**
 * Annotates locations against a gene store. Holds no per-call state, so
 * one instance may annotate from several threads at once.
 */
class Annotator {
public:
    /**
     * @param store Gene store to query
     * @param tss_region Promoter window
     * @param n Number of closest genes to report (> 0)
     * @throws InputError if store is null or n is 0
     */
    Annotator(std::shared_ptr<const GeneStore> store, const TSSRegion& tss_region, size_t n);

    /**
     * Annotate one location
     * @throws StoreError if any store query fails; no partial result
     */
    GeneAnnotation annotate(const Location& location) const;

    const TSSRegion& tss_region() const { return tss_region_; }
    size_t closest_n() const { return n_; }
    const GeneStore& store() const { return *store_; }

private:
    std::shared_ptr<const GeneStore> store_;
    TSSRegion tss_region_;
    size_t n_;

    std::vector<ClosestGene> annotate_closest(const Location& location,
                                              std::map<std::string, bool>& exon_memo) const;
};

// ============================================================================
// Batch annotation
// ============================================================================

struct BatchOptions {
    int threads = 1;
    bool fail_fast = false;                 // rethrow the first failure
    std::atomic<bool>* cancel = nullptr;    // set to stop starting new locations
};

/**
 * Outcome for one location of a batch
 */
struct LocationResult {
    Location location;
    bool ok = false;
    bool skipped = false;                   // cancelled before it started
    GeneAnnotation annotation;
    std::string error;
};

/**
 * Annotate many locations on a worker pool. Results are in input order.
 * A failing location is recorded in its result; with fail_fast the first
 * failure is rethrown once running work has drained.
 */
std::vector<LocationResult> annotate_batch(
    const Annotator& annotator,
    const std::vector<Location>& locations,
    const BatchOptions& options = BatchOptions()
);

} // namespace loctogene

#endif // LOCTOGENE_ANNOTATOR_HPP
