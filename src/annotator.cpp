/**
 * Annotator implementation
 */

#include "annotator.hpp"
#include "task_queue.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <mutex>

namespace loctogene {

// ============================================================================
// GeneAggregator
// ============================================================================

void GeneAggregator::add(const std::string& gene_id,
                         const std::string& gene_symbol,
                         const Classification& classification) {
    add(gene_id, gene_symbol,
        classification.is_promoter,
        classification.is_exon,
        classification.is_intronic,
        classification.tss_dist);
}

void GeneAggregator::add(const std::string& gene_id,
                         const std::string& gene_symbol,
                         bool is_promoter,
                         bool is_exon,
                         bool is_intronic,
                         int d) {
    int abs_d = std::abs(d);

    auto it = genes_.find(gene_id);
    if (it == genes_.end()) {
        GeneState state;
        state.gene_symbol = gene_symbol;
        state.is_promoter = is_promoter;
        state.is_exon = is_exon;
        state.is_intronic = is_intronic;
        state.d = d;
        state.abs_d = abs_d;
        genes_.emplace(gene_id, std::move(state));
        return;
    }

    GeneState& state = it->second;
    state.is_promoter = state.is_promoter || is_promoter;
    state.is_exon = state.is_exon || is_exon;
    state.is_intronic = state.is_intronic || is_intronic;

    if (abs_d < state.abs_d) {
        state.d = d;
        state.abs_d = abs_d;
    }
}

std::vector<std::string> GeneAggregator::ordered_gene_ids() const {
    // genes_ iterates in gene id order, so each distance group is already sorted
    std::map<int, std::vector<std::string>> by_distance;
    for (const auto& [gene_id, state] : genes_) {
        by_distance[state.abs_d].push_back(gene_id);
    }

    std::vector<std::string> ordered;
    ordered.reserve(genes_.size());
    for (const auto& [abs_d, ids] : by_distance) {
        ordered.insert(ordered.end(), ids.begin(), ids.end());
    }
    return ordered;
}

void GeneAggregator::build_within_lists(GeneAnnotation& annotation) const {
    annotation.gene_ids.clear();
    annotation.gene_symbols.clear();
    annotation.labels.clear();
    annotation.tss_dists.clear();

    if (genes_.empty()) {
        annotation.gene_ids.push_back(NA);
        annotation.gene_symbols.push_back(NA);
        annotation.labels.push_back(NA);
        annotation.tss_dists.push_back(NA);
        return;
    }

    for (const auto& gene_id : ordered_gene_ids()) {
        const GeneState& state = genes_.at(gene_id);
        annotation.gene_ids.push_back(gene_id);
        annotation.gene_symbols.push_back(state.gene_symbol);
        annotation.labels.push_back(state.label());
        annotation.tss_dists.push_back(std::to_string(state.d));
    }
}

const GeneAggregator::GeneState* GeneAggregator::get(const std::string& gene_id) const {
    auto it = genes_.find(gene_id);
    return it != genes_.end() ? &it->second : nullptr;
}

// ============================================================================
// Annotator
// ============================================================================

namespace {

/**
 * Run a store query, rethrowing any failure as a StoreError that names the
 * query and the location.
 */
template <typename Query>
std::vector<GenomicFeature> run_query(const std::string& query_name,
                                      const Location& location,
                                      Query&& query) {
    try {
        return query();
    } catch (const std::exception& e) {
        throw StoreError(query_name + " failed for " +
                         location.to_string() + ": " + e.what());
    }
}

/**
 * Classify against one feature, asking the store about exon membership at
 * most once per gene id.
 */
Classification classify_memoized(const GeneStore& store,
                                 const Location& location,
                                 const GenomicFeature& feature,
                                 const TSSRegion& tss_region,
                                 std::map<std::string, bool>& exon_memo) {
    return classify_with_exon_lookup(location, feature, tss_region, [&]() {
        auto it = exon_memo.find(feature.gene_id);
        if (it != exon_memo.end()) return it->second;

        bool is_exon = !run_query("features_in_exon(" + feature.gene_id + ")", location, [&]() {
            return store.features_in_exon(location, feature.gene_id);
        }).empty();
        exon_memo.emplace(feature.gene_id, is_exon);
        return is_exon;
    });
}

std::string describe_closest(const std::vector<ClosestGene>& genes) {
    std::vector<std::string> parts;
    for (const auto& g : genes) {
        parts.push_back(g.gene_id + "(" + g.label + "," + std::to_string(g.tss_dist) + ")");
    }
    return join(parts, " ");
}

} // namespace

Annotator::Annotator(std::shared_ptr<const GeneStore> store, const TSSRegion& tss_region, size_t n)
    : store_(std::move(store)), tss_region_(tss_region), n_(n) {
    if (!store_) {
        throw InputError("Annotator requires a gene store");
    }
    if (n_ == 0) {
        throw InputError("Number of closest genes must be positive");
    }
}

GeneAnnotation Annotator::annotate(const Location& location) const {
    GeneAnnotation annotation;
    std::map<std::string, bool> exon_memo;

    auto transcripts = run_query("features_overlapping", location, [&]() {
        return store_->features_overlapping(location, Level::TRANSCRIPT, tss_region_.max_offset());
    });

    GeneAggregator aggregator;
    for (const auto& transcript : transcripts) {
        Classification c = classify_memoized(*store_, location, transcript, tss_region_, exon_memo);
        aggregator.add(transcript.gene_id, transcript.gene_symbol, c);
    }
    aggregator.build_within_lists(annotation);

    annotation.closest_genes = annotate_closest(location, exon_memo);

    if (get_log_level() <= LogLevel::DEBUG) {
        log(LogLevel::DEBUG, location.to_string() + " " + tss_region_.to_string() + ": " +
                             std::to_string(transcripts.size()) + " transcripts, " +
                             std::to_string(aggregator.size()) + " genes within");
        log(LogLevel::DEBUG, "  ids: " + annotation.joined_gene_ids());
        log(LogLevel::DEBUG, "  labels: " + annotation.joined_labels());
        log(LogLevel::DEBUG, "  dists: " + annotation.joined_tss_dists());
        log(LogLevel::DEBUG, "  closest: " + describe_closest(annotation.closest_genes));
    }

    return annotation;
}

std::vector<ClosestGene> Annotator::annotate_closest(const Location& location,
                                                     std::map<std::string, bool>& exon_memo) const {
    auto features = run_query("closest_features", location, [&]() {
        return store_->closest_features(location, n_, Level::GENE);
    });

    std::vector<ClosestGene> closest;
    closest.reserve(features.size());

    for (const auto& feature : features) {
        Classification c = classify_memoized(*store_, location, feature, tss_region_, exon_memo);

        ClosestGene gene;
        gene.gene_id = feature.gene_id.empty() ? feature.id : feature.gene_id;
        gene.gene_symbol = feature.gene_symbol;
        gene.label = c.label();
        gene.tss_dist = c.tss_dist;
        closest.push_back(std::move(gene));
    }

    return closest;
}

// ============================================================================
// Batch annotation
// ============================================================================

namespace {

/**
 * State shared by the tasks of one batch
 */
struct BatchState {
    const Annotator& annotator;
    const BatchOptions& options;

    std::mutex mutex;
    std::exception_ptr first_error;
    bool stopped = false;
    size_t failed = 0;

    BatchState(const Annotator& a, const BatchOptions& o) : annotator(a), options(o) {}

    bool should_stop() {
        if (options.cancel && options.cancel->load()) return true;
        std::lock_guard<std::mutex> lock(mutex);
        return stopped;
    }

    void record_failure(std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex);
        ++failed;
        if (!first_error) first_error = error;
        if (options.fail_fast) stopped = true;
    }
};

class AnnotateTask : public Task {
public:
    AnnotateTask(BatchState& state, LocationResult& result)
        : state_(state), result_(result) {}

    void execute() override {
        if (state_.should_stop()) {
            result_.skipped = true;
            return;
        }

        try {
            result_.annotation = state_.annotator.annotate(result_.location);
            result_.ok = true;
        } catch (const std::exception& e) {
            result_.error = e.what();
            log(LogLevel::WARNING, "Failed to annotate " + result_.location.to_string() +
                                   ": " + result_.error);
            state_.record_failure(std::current_exception());
        }
    }

private:
    BatchState& state_;
    LocationResult& result_;
};

} // namespace

std::vector<LocationResult> annotate_batch(
    const Annotator& annotator,
    const std::vector<Location>& locations,
    const BatchOptions& options) {

    std::vector<LocationResult> results(locations.size());
    for (size_t i = 0; i < locations.size(); ++i) {
        results[i].location = locations[i];
    }

    if (locations.empty()) return results;

    BatchState state(annotator, options);

    int workers = std::max(1, std::min<int>(options.threads, static_cast<int>(locations.size())));
    log(LogLevel::INFO, "Annotating " + std::to_string(locations.size()) + " locations with " +
                        std::to_string(workers) + " thread(s)");

    {
        TaskQueue queue(workers);
        for (auto& result : results) {
            queue.submit(std::make_unique<AnnotateTask>(state, result));
        }
        queue.close();
        queue.wait();
    }

    size_t skipped = 0;
    for (const auto& r : results) {
        if (r.skipped) ++skipped;
    }

    log(LogLevel::INFO, "Annotated " + std::to_string(locations.size() - state.failed - skipped) +
                        " locations (" + std::to_string(state.failed) + " failed, " +
                        std::to_string(skipped) + " skipped)");

    if (options.fail_fast && state.first_error) {
        std::rethrow_exception(state.first_error);
    }

    return results;
}

} // namespace loctogene
