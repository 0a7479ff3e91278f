/**
 * TabixGeneStore - on-disk queries over a bgzipped, tabix-indexed gene table
 *
 * Compiled only when htslib is available (HAVE_HTSLIB).
 */

#include "gene_store.hpp"

#ifdef HAVE_HTSLIB

#include <algorithm>
#include <cstdlib>
#include <mutex>

#include <htslib/hts.h>
#include <htslib/kstring.h>
#include <htslib/tbx.h>

namespace loctogene {

// Closest-gene search starts with this half-width and doubles it
static const uint32_t INITIAL_WINDOW = 100000;
static const uint32_t MAX_WINDOW = 1u << 30;

static uint32_t add_clamped(uint32_t pos, uint32_t delta) {
    uint64_t sum = static_cast<uint64_t>(pos) + delta;
    return sum > 0xFFFFFFFFULL ? 0xFFFFFFFFU : static_cast<uint32_t>(sum);
}

struct TabixGeneStore::Impl {
    std::string path;
    htsFile* hts_file = nullptr;
    tbx_t* tbx = nullptr;

    // htsFile iteration is not thread-safe
    std::mutex mutex;

    ~Impl() {
        if (tbx) tbx_destroy(tbx);
        if (hts_file) hts_close(hts_file);
    }

    /**
     * All rows overlapping [start, end] on chrom, trying the name with and
     * without the "chr" prefix.
     */
    std::vector<GenomicFeature> query(const std::string& chrom, uint32_t start, uint32_t end) {
        std::vector<GenomicFeature> results;

        std::vector<std::string> chrom_variants;
        if (chrom.compare(0, 3, "chr") == 0) {
            chrom_variants.push_back(chrom);
            chrom_variants.push_back(chrom.substr(3));
        } else {
            chrom_variants.push_back(chrom);
            chrom_variants.push_back("chr" + chrom);
        }

        std::lock_guard<std::mutex> lock(mutex);

        for (const auto& try_chrom : chrom_variants) {
            if (tbx_name2id(tbx, try_chrom.c_str()) < 0) continue;

            std::string region = try_chrom + ":" + std::to_string(std::max<uint32_t>(start, 1)) +
                                 "-" + std::to_string(end);

            hts_itr_t* itr = tbx_itr_querys(tbx, region.c_str());
            if (!itr) {
                throw StoreError("Tabix query failed for region " + region + " in " + path);
            }

            kstring_t str = {0, 0, nullptr};
            int ret;
            while ((ret = tbx_itr_next(hts_file, tbx, itr, &str)) >= 0) {
                GenomicFeature feature;
                try {
                    if (parse_gene_table_line(str.s, feature)) {
                        results.push_back(std::move(feature));
                    }
                } catch (const InputError& e) {
                    free(str.s);
                    tbx_itr_destroy(itr);
                    throw StoreError("Malformed row in " + path + ": " + e.what());
                }
            }

            free(str.s);
            tbx_itr_destroy(itr);

            if (ret < -1) {
                throw StoreError("Error reading " + path + " at region " + region);
            }
            break;
        }

        return results;
    }
};

TabixGeneStore::TabixGeneStore(const std::string& table_path)
    : pimpl_(std::make_unique<Impl>()) {

    pimpl_->path = table_path;

    pimpl_->hts_file = hts_open(table_path.c_str(), "r");
    if (!pimpl_->hts_file) {
        throw InputError("Cannot open gene table: " + table_path);
    }

    pimpl_->tbx = tbx_index_load(table_path.c_str());
    if (!pimpl_->tbx) {
        throw InputError("Cannot load tabix index for: " + table_path +
                         ". Make sure the file is bgzip compressed and indexed with tabix.");
    }

    log(LogLevel::INFO, "Opened tabix-indexed gene table: " + table_path);
}

TabixGeneStore::~TabixGeneStore() = default;

std::string TabixGeneStore::name() const {
    return "tabix:" + pimpl_->path;
}

std::vector<GenomicFeature> TabixGeneStore::features_overlapping(
    const Location& location, Level level, uint32_t pad) const {

    uint32_t lo = location.start > pad ? location.start - pad : 0;
    uint32_t hi = add_clamped(location.end, pad);

    std::vector<GenomicFeature> results;
    for (auto& f : pimpl_->query(location.chr, lo, hi)) {
        if (f.level != level || !f.overlaps(lo, hi)) continue;
        f.dist = tss_distance(location, f);
        results.push_back(std::move(f));
    }

    return results;
}

std::vector<GenomicFeature> TabixGeneStore::features_in_exon(
    const Location& location, const std::string& gene_id) const {

    std::vector<GenomicFeature> results;
    for (auto& f : pimpl_->query(location.chr, location.start, location.end)) {
        if (f.level != Level::EXON || f.gene_id != gene_id) continue;
        f.dist = tss_distance(location, f);
        results.push_back(std::move(f));
    }
    return results;
}

std::vector<GenomicFeature> TabixGeneStore::closest_features(
    const Location& location, size_t n, Level level) const {

    std::vector<GenomicFeature> results;
    if (n == 0) return results;

    uint32_t mid = location.mid();

    // Any feature whose TSS lies within the window also overlaps it, so once
    // n features have |dist| <= window the n nearest are all in hand.
    for (uint32_t window = INITIAL_WINDOW; ; window *= 2) {
        uint32_t lo = mid > window ? mid - window : 0;
        uint32_t hi = add_clamped(mid, window);

        results.clear();
        size_t inside = 0;
        for (auto& f : pimpl_->query(location.chr, lo, hi)) {
            if (f.level != level) continue;
            f.dist = tss_distance(location, f);
            if (static_cast<uint32_t>(std::abs(f.dist)) <= window) ++inside;
            results.push_back(std::move(f));
        }

        if (inside >= n || window >= MAX_WINDOW) break;
    }

    sort_by_distance(results);
    if (results.size() > n) results.resize(n);

    return results;
}

} // namespace loctogene

#endif // HAVE_HTSLIB
