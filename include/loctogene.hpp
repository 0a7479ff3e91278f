/**
 * loctogene - Genomic Location to Gene Annotation
 *
 * Core types shared by every part of the library: locations, TSS regions,
 * gene features, classification of a location relative to a gene, errors
 * and logging.
 *
 * Coordinates are 1-based and inclusive throughout.
 */

#ifndef LOCTOGENE_HPP
#define LOCTOGENE_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace loctogene {

class GeneStore;

// ============================================================================
// Errors
// ============================================================================

/**
 * Base class for all errors raised by the library
 */
class LoctogeneError : public std::runtime_error {
public:
    explicit LoctogeneError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Malformed input: bad location text, start > end, negative TSS offsets,
 * unreadable input files.
 */
class InputError : public LoctogeneError {
public:
    explicit InputError(const std::string& message)
        : LoctogeneError(message) {}
};

/**
 * A gene store query failed. The message names the query and the location.
 */
class StoreError : public LoctogeneError {
public:
    explicit StoreError(const std::string& message)
        : LoctogeneError(message) {}
};

// ============================================================================
// Labels
// ============================================================================

extern const char* const NA;
extern const char* const PROMOTER;
extern const char* const EXONIC;
extern const char* const INTRONIC;
extern const char* const INTERGENIC;

/**
 * Build a classification label: "promoter" first, then "exonic" or
 * (only when not exonic) "intronic", comma-joined. No flags gives "".
 */
std::string make_label(bool is_promoter, bool is_exon, bool is_intronic);

// ============================================================================
// Location
// ============================================================================

/**
 * A genomic interval to annotate
 */
struct Location {
    std::string chr;
    uint32_t start = 0;     // 1-based, inclusive
    uint32_t end = 0;       // 1-based, inclusive

    Location() = default;

    /**
     * @throws InputError if chr is empty or start > end
     */
    Location(const std::string& chr, uint32_t start, uint32_t end);

    /**
     * Midpoint, rounded down
     */
    uint32_t mid() const { return static_cast<uint32_t>((static_cast<uint64_t>(start) + end) / 2); }

    uint32_t length() const { return end - start + 1; }

    std::string to_string() const;

    /**
     * Parse "chr:start-end" or "chr:pos". Commas inside numbers are ignored.
     * @throws InputError on malformed text
     */
    static Location parse(const std::string& text);

    bool operator==(const Location& other) const {
        return chr == other.chr && start == other.start && end == other.end;
    }
};

/**
 * Normalize chromosome name (remove "chr" prefix for consistency)
 */
inline std::string normalize_chrom(const std::string& chrom) {
    if (chrom.length() > 3 && chrom.compare(0, 3, "chr") == 0) {
        return chrom.substr(3);
    }
    return chrom;
}

// ============================================================================
// Feature level
// ============================================================================

/**
 * Feature granularity a store query targets
 */
enum class Level {
    GENE = 1,
    TRANSCRIPT = 2,
    EXON = 3
};

std::string level_to_string(Level level);

/**
 * Accepts "gene", "transcript", "exon" (any case) or "1", "2", "3".
 * Anything else is treated as gene level.
 */
Level parse_level(const std::string& text);

// ============================================================================
// TSS region
// ============================================================================

/**
 * Promoter window around a transcription start site, as magnitudes
 * upstream (5') and downstream (3') of the TSS in transcription direction.
 */
class TSSRegion {
public:
    /**
     * @throws InputError if either offset is negative
     */
    TSSRegion(int offset_5p, int offset_3p);

    uint32_t offset_5p() const { return offset_5p_; }
    uint32_t offset_3p() const { return offset_3p_; }
    uint32_t max_offset() const { return offset_5p_ > offset_3p_ ? offset_5p_ : offset_3p_; }

    std::string to_string() const;

private:
    uint32_t offset_5p_;
    uint32_t offset_3p_;
};

// ============================================================================
// Genomic feature
// ============================================================================

/**
 * A gene, transcript or exon row returned by a gene store
 */
struct GenomicFeature {
    std::string id;             // gene, transcript or exon identifier
    std::string chr;
    uint32_t start = 0;
    uint32_t end = 0;
    char strand = '+';          // '+' or '-'; anything else reads as '+'
    std::string gene_id;
    std::string gene_symbol;
    Level level = Level::GENE;
    int dist = 0;               // tss() - query midpoint; closest queries only

    bool is_minus_strand() const { return strand == '-'; }

    /**
     * Stranded start: start for + strand features, end for - strand
     */
    uint32_t tss() const { return is_minus_strand() ? end : start; }

    bool overlaps(uint32_t s, uint32_t e) const { return s <= end && e >= start; }
};

/**
 * Signed distance from the location midpoint to the feature's TSS:
 * tss - mid, for either strand.
 */
int tss_distance(const Location& location, const GenomicFeature& feature);

// ============================================================================
// Classifier
// ============================================================================

/**
 * Position of a location relative to one gene feature
 */
struct Classification {
    bool is_promoter = false;
    bool is_exon = false;
    bool is_intronic = false;
    bool is_intergenic = false;     // outside promoter window and gene body
    int tss_dist = 0;

    /**
     * "intergenic" for the out-of-window case, otherwise make_label()
     */
    std::string label() const;
};

/**
 * Bounds of the window a location must touch to be related to a feature:
 * the strand-adjusted promoter window joined with the feature body.
 * The lower bound saturates at 0.
 */
std::pair<uint32_t, uint32_t> search_window(const GenomicFeature& feature,
                                            const TSSRegion& tss_region);

/**
 * True if the midpoint of the location lies in the promoter window:
 * [tss - 5p, tss + 3p] on +, [tss - 3p, tss + 5p] on -.
 */
bool in_promoter(const Location& location, const GenomicFeature& feature,
                 const TSSRegion& tss_region);

/**
 * Classify a location against a feature when exon membership is known
 */
Classification classify_location(const Location& location,
                                 const GenomicFeature& feature,
                                 const TSSRegion& tss_region,
                                 bool is_exon);

/**
 * Classify a location against a feature, calling exon_lookup for exon
 * membership only when the location is not intergenic.
 */
Classification classify_with_exon_lookup(const Location& location,
                                         const GenomicFeature& feature,
                                         const TSSRegion& tss_region,
                                         const std::function<bool()>& exon_lookup);

/**
 * Classify a location against a feature, asking the store whether the
 * location falls in one of the feature's gene exons. The exon query is
 * skipped for intergenic locations.
 *
 * @throws StoreError if the exon query fails
 */
Classification classify_location(const Location& location,
                                 const GenomicFeature& feature,
                                 const TSSRegion& tss_region,
                                 const GeneStore& store);

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };
void set_log_level(LogLevel level);
LogLevel get_log_level();
void log(LogLevel level, const std::string& message);

/**
 * Join strings with a separator
 */
std::string join(const std::vector<std::string>& items, const std::string& sep);

} // namespace loctogene

#endif // LOCTOGENE_HPP
