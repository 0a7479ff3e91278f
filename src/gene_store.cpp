/**
 * Gene store backends and factory
 */

#include "gene_store.hpp"
#include "line_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace loctogene {

void sort_by_distance(std::vector<GenomicFeature>& features) {
    std::sort(features.begin(), features.end(),
              [](const GenomicFeature& a, const GenomicFeature& b) {
                  int abs_a = std::abs(a.dist);
                  int abs_b = std::abs(b.dist);
                  if (abs_a != abs_b) return abs_a < abs_b;
                  if (a.gene_id != b.gene_id) return a.gene_id < b.gene_id;
                  return a.id < b.id;
              });
}

static int signed_dist(uint32_t tss, uint32_t mid) {
    return static_cast<int>(static_cast<int64_t>(tss) - static_cast<int64_t>(mid));
}

// ============================================================================
// Gene table rows
// ============================================================================

bool parse_gene_table_line(const std::string& line, GenomicFeature& feature) {
    if (line.empty() || line[0] == '#') return false;

    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, '\t')) {
        fields.push_back(field);
    }

    if (fields.size() < 8) {
        throw InputError("Gene table row has " + std::to_string(fields.size()) +
                         " columns, expected 8");
    }

    feature = GenomicFeature();
    feature.chr = fields[0];

    try {
        size_t start_pos = 0;
        size_t end_pos = 0;
        long long start = std::stoll(fields[1], &start_pos);
        long long end = std::stoll(fields[2], &end_pos);
        if (start_pos != fields[1].size() || end_pos != fields[2].size()) {
            throw InputError("Non-numeric gene table coordinates: " + fields[1] + "-" + fields[2]);
        }
        if (start < 0 || end < start || end > 0xFFFFFFFFLL) {
            throw InputError("Invalid gene table coordinates: " + fields[1] + "-" + fields[2]);
        }
        feature.start = static_cast<uint32_t>(start);
        feature.end = static_cast<uint32_t>(end);
    } catch (const std::logic_error&) {
        throw InputError("Non-numeric gene table coordinates: " + fields[1] + "-" + fields[2]);
    }

    feature.strand = (fields[3] == "-") ? '-' : '+';
    feature.level = parse_level(fields[4]);
    feature.id = fields[5];
    feature.gene_id = fields[6];
    feature.gene_symbol = fields[7];

    return true;
}

// ============================================================================
// MemoryGeneStore implementation
// ============================================================================

namespace {

struct ChromIndex {
    std::vector<GenomicFeature> features;   // sorted by start
    std::vector<size_t> by_tss;             // indexes into features, sorted by tss
    uint32_t max_length = 0;
};

} // namespace

struct MemoryGeneStore::Impl {
    std::string source = "memory";

    // level -> normalized chromosome -> index
    std::map<Level, std::unordered_map<std::string, ChromIndex>> index;

    // gene_id -> exons of that gene
    std::unordered_map<std::string, std::vector<GenomicFeature>> exons_by_gene;

    const ChromIndex* find(Level level, const std::string& chrom) const {
        auto level_it = index.find(level);
        if (level_it == index.end()) return nullptr;

        auto it = level_it->second.find(normalize_chrom(chrom));
        return (it != level_it->second.end()) ? &it->second : nullptr;
    }
};

MemoryGeneStore::MemoryGeneStore()
    : pimpl_(std::make_unique<Impl>()) {}

MemoryGeneStore::~MemoryGeneStore() = default;

void MemoryGeneStore::add_feature(const GenomicFeature& feature) {
    ChromIndex& idx = pimpl_->index[feature.level][normalize_chrom(feature.chr)];
    idx.features.push_back(feature);

    if (feature.level == Level::EXON) {
        pimpl_->exons_by_gene[feature.gene_id].push_back(feature);
    }
}

void MemoryGeneStore::build_index() {
    for (auto& [level, chroms] : pimpl_->index) {
        for (auto& [chrom, idx] : chroms) {
            std::sort(idx.features.begin(), idx.features.end(),
                      [](const GenomicFeature& a, const GenomicFeature& b) {
                          if (a.start != b.start) return a.start < b.start;
                          if (a.end != b.end) return a.end < b.end;
                          return a.id < b.id;
                      });

            idx.max_length = 0;
            for (const auto& f : idx.features) {
                idx.max_length = std::max(idx.max_length, f.end - f.start + 1);
            }

            idx.by_tss.resize(idx.features.size());
            for (size_t i = 0; i < idx.by_tss.size(); ++i) idx.by_tss[i] = i;
            std::sort(idx.by_tss.begin(), idx.by_tss.end(),
                      [&idx](size_t a, size_t b) {
                          return idx.features[a].tss() < idx.features[b].tss();
                      });
        }
    }

    for (auto& [gene_id, exons] : pimpl_->exons_by_gene) {
        std::sort(exons.begin(), exons.end(),
                  [](const GenomicFeature& a, const GenomicFeature& b) { return a.start < b.start; });
    }
}

std::string MemoryGeneStore::name() const {
    return "memory:" + pimpl_->source;
}

std::vector<GenomicFeature> MemoryGeneStore::features_overlapping(
    const Location& location, Level level, uint32_t pad) const {

    std::vector<GenomicFeature> results;

    const ChromIndex* idx = pimpl_->find(level, location.chr);
    if (!idx) return results;

    uint32_t lo = location.start > pad ? location.start - pad : 0;
    uint64_t hi64 = static_cast<uint64_t>(location.end) + pad;
    uint32_t hi = hi64 > 0xFFFFFFFFULL ? 0xFFFFFFFFU : static_cast<uint32_t>(hi64);

    // No feature starting before lo - max_length can reach lo
    uint32_t first_start = lo > idx->max_length ? lo - idx->max_length : 0;
    auto it = std::lower_bound(idx->features.begin(), idx->features.end(), first_start,
                               [](const GenomicFeature& f, uint32_t pos) { return f.start < pos; });

    uint32_t mid = location.mid();
    for (; it != idx->features.end(); ++it) {
        if (it->start > hi) break;
        if (it->overlaps(lo, hi)) {
            GenomicFeature f = *it;
            f.dist = signed_dist(f.tss(), mid);
            results.push_back(std::move(f));
        }
    }

    return results;
}

std::vector<GenomicFeature> MemoryGeneStore::features_in_exon(
    const Location& location, const std::string& gene_id) const {

    std::vector<GenomicFeature> results;

    auto it = pimpl_->exons_by_gene.find(gene_id);
    if (it == pimpl_->exons_by_gene.end()) return results;

    std::string chrom = normalize_chrom(location.chr);
    uint32_t mid = location.mid();
    for (const auto& exon : it->second) {
        if (normalize_chrom(exon.chr) != chrom) continue;
        if (exon.start > location.end) break;
        if (exon.overlaps(location.start, location.end)) {
            GenomicFeature f = exon;
            f.dist = signed_dist(f.tss(), mid);
            results.push_back(std::move(f));
        }
    }

    return results;
}

std::vector<GenomicFeature> MemoryGeneStore::closest_features(
    const Location& location, size_t n, Level level) const {

    std::vector<GenomicFeature> results;
    if (n == 0) return results;

    const ChromIndex* idx = pimpl_->find(level, location.chr);
    if (!idx || idx->by_tss.empty()) return results;

    const auto& order = idx->by_tss;
    uint32_t mid = location.mid();

    auto abs_dist = [&](size_t pos) -> int {
        return std::abs(signed_dist(idx->features[order[pos]].tss(), mid));
    };

    // Walk outwards from the midpoint, always taking the nearer side
    size_t right = static_cast<size_t>(
        std::lower_bound(order.begin(), order.end(), mid,
                         [&idx](size_t i, uint32_t pos) { return idx->features[i].tss() < pos; })
        - order.begin());
    size_t left = right;   // next candidate on the left is left - 1

    std::vector<size_t> picked;
    int cutoff = -1;
    while (left > 0 || right < order.size()) {
        bool take_left;
        if (left == 0) {
            take_left = false;
        } else if (right >= order.size()) {
            take_left = true;
        } else {
            take_left = abs_dist(left - 1) <= abs_dist(right);
        }

        size_t pos = take_left ? left - 1 : right;
        int d = abs_dist(pos);

        // Keep going past n only to collect features tied with the nth
        if (picked.size() >= n && d > cutoff) break;

        picked.push_back(pos);
        if (picked.size() == n) cutoff = d;

        if (take_left) --left; else ++right;
    }

    results.reserve(picked.size());
    for (size_t pos : picked) {
        GenomicFeature f = idx->features[order[pos]];
        f.dist = signed_dist(f.tss(), mid);
        results.push_back(std::move(f));
    }

    sort_by_distance(results);
    if (results.size() > n) results.resize(n);

    return results;
}

size_t MemoryGeneStore::feature_count(Level level) const {
    auto level_it = pimpl_->index.find(level);
    if (level_it == pimpl_->index.end()) return 0;

    size_t count = 0;
    for (const auto& [chrom, idx] : level_it->second) {
        count += idx.features.size();
    }
    return count;
}

std::string MemoryGeneStore::get_stats() const {
    std::ostringstream oss;
    oss << name() << ": "
        << feature_count(Level::GENE) << " genes, "
        << feature_count(Level::TRANSCRIPT) << " transcripts, "
        << feature_count(Level::EXON) << " exons";
    return oss.str();
}

// ============================================================================
// GTF loading
// ============================================================================

// Helper to parse GTF attribute string
static std::unordered_map<std::string, std::string> parse_gtf_attributes(const std::string& attr_str) {
    std::unordered_map<std::string, std::string> attrs;

    static const std::regex attr_regex(R"((\w+)\s+\"([^\"]*)\")");
    std::sregex_iterator it(attr_str.begin(), attr_str.end(), attr_regex);
    std::sregex_iterator end;

    while (it != end) {
        // First occurrence wins (GTF may repeat "tag")
        attrs.emplace((*it)[1].str(), (*it)[2].str());
        ++it;
    }

    return attrs;
}

// Grow a derived parent so that it spans a child
static void extend_to(GenomicFeature& parent, const GenomicFeature& child) {
    parent.start = std::min(parent.start, child.start);
    parent.end = std::max(parent.end, child.end);
}

std::unique_ptr<MemoryGeneStore> MemoryGeneStore::from_gtf(const std::string& gtf_path) {
    log(LogLevel::INFO, "Loading gene models from GTF: " + gtf_path);

    LineReader reader(gtf_path);

    std::unordered_map<std::string, GenomicFeature> genes;
    std::unordered_map<std::string, GenomicFeature> transcripts;
    std::vector<GenomicFeature> exons;

    // Extents built from child features rather than their own GTF row
    std::unordered_set<std::string> derived_genes;
    std::unordered_set<std::string> derived_transcripts;

    std::string line;
    while (reader.next(line)) {
        if (line.empty() || line[0] == '#') continue;

        if (reader.line_number() % 500000 == 0) {
            log(LogLevel::DEBUG, "Processed " + std::to_string(reader.line_number()) + " lines...");
        }

        std::istringstream iss(line);
        std::string chrom, source, feature_type;
        long long start, end;
        std::string score, strand_str, frame, attributes;

        if (!(iss >> chrom >> source >> feature_type >> start >> end >> score >> strand_str >> frame)) {
            log(LogLevel::DEBUG, gtf_path + ":" + std::to_string(reader.line_number()) +
                                 ": skipping malformed GTF line");
            continue;
        }

        if (feature_type != "gene" && feature_type != "transcript" && feature_type != "exon") {
            continue;
        }

        if (start < 1 || end < start) {
            log(LogLevel::WARNING, gtf_path + ":" + std::to_string(reader.line_number()) +
                                   ": invalid coordinates, skipping");
            continue;
        }

        std::getline(iss, attributes);
        auto attrs = parse_gtf_attributes(attributes);

        std::string gene_id = attrs.count("gene_id") ? attrs["gene_id"] : "";
        if (gene_id.empty()) continue;

        GenomicFeature f;
        f.chr = chrom;
        f.start = static_cast<uint32_t>(start);
        f.end = static_cast<uint32_t>(end);
        f.strand = (strand_str == "-") ? '-' : '+';
        f.gene_id = gene_id;
        f.gene_symbol = attrs.count("gene_name") ? attrs["gene_name"] : gene_id;

        std::string transcript_id = attrs.count("transcript_id") ? attrs["transcript_id"] : "";

        if (feature_type == "gene") {
            f.level = Level::GENE;
            f.id = gene_id;
            genes[gene_id] = f;
            derived_genes.erase(gene_id);
        } else if (feature_type == "transcript" && !transcript_id.empty()) {
            f.level = Level::TRANSCRIPT;
            f.id = transcript_id;
            transcripts[transcript_id] = f;
            derived_transcripts.erase(transcript_id);
        } else if (feature_type == "exon") {
            f.level = Level::EXON;
            if (attrs.count("exon_id")) {
                f.id = attrs["exon_id"];
            } else {
                f.id = transcript_id + ":" +
                       (attrs.count("exon_number") ? attrs["exon_number"] : std::to_string(exons.size()));
            }
            exons.push_back(f);

            // Transcripts without their own row span their exons
            if (!transcript_id.empty()) {
                auto tr_it = transcripts.find(transcript_id);
                if (tr_it == transcripts.end()) {
                    GenomicFeature tr = f;
                    tr.level = Level::TRANSCRIPT;
                    tr.id = transcript_id;
                    transcripts.emplace(transcript_id, tr);
                    derived_transcripts.insert(transcript_id);
                } else if (derived_transcripts.count(transcript_id)) {
                    extend_to(tr_it->second, f);
                }
            }
        }
    }

    // Genes without their own row span their transcripts
    for (const auto& [tid, tr] : transcripts) {
        auto gene_it = genes.find(tr.gene_id);
        if (gene_it == genes.end()) {
            GenomicFeature gene = tr;
            gene.level = Level::GENE;
            gene.id = tr.gene_id;
            genes.emplace(tr.gene_id, gene);
            derived_genes.insert(tr.gene_id);
        } else if (derived_genes.count(tr.gene_id)) {
            extend_to(gene_it->second, tr);
        }
    }

    auto store = std::make_unique<MemoryGeneStore>();
    store->pimpl_->source = gtf_path;

    for (const auto& [gene_id, gene] : genes) {
        store->add_feature(gene);
    }
    for (const auto& [tid, tr] : transcripts) {
        store->add_feature(tr);
    }
    for (const auto& exon : exons) {
        store->add_feature(exon);
    }

    store->build_index();

    log(LogLevel::INFO, "Loaded " + std::to_string(genes.size()) + " genes, " +
                        std::to_string(transcripts.size()) + " transcripts, " +
                        std::to_string(exons.size()) + " exons");
    if (!derived_genes.empty() || !derived_transcripts.empty()) {
        log(LogLevel::DEBUG, "Derived extents for " + std::to_string(derived_genes.size()) +
                             " genes and " + std::to_string(derived_transcripts.size()) +
                             " transcripts without their own GTF row");
    }

    return store;
}

// ============================================================================
// Gene table loading
// ============================================================================

std::unique_ptr<MemoryGeneStore> MemoryGeneStore::from_gene_table(const std::string& table_path) {
    log(LogLevel::INFO, "Loading gene table: " + table_path);

    LineReader reader(table_path);
    auto store = std::make_unique<MemoryGeneStore>();
    store->pimpl_->source = table_path;

    std::string line;
    size_t count = 0;
    while (reader.next(line)) {
        GenomicFeature feature;
        try {
            if (!parse_gene_table_line(line, feature)) continue;
        } catch (const InputError& e) {
            throw InputError(table_path + ":" + std::to_string(reader.line_number()) + ": " + e.what());
        }
        store->add_feature(feature);
        ++count;
    }

    store->build_index();

    log(LogLevel::INFO, "Loaded " + std::to_string(count) + " features (" +
                        std::to_string(store->feature_count(Level::GENE)) + " genes)");

    return store;
}

// ============================================================================
// Factory
// ============================================================================

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::shared_ptr<const GeneStore> open_gene_store(const std::string& path) {
    std::string lower = path;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (ends_with(lower, ".gtf") || ends_with(lower, ".gtf.gz")) {
        return MemoryGeneStore::from_gtf(path);
    }

    bool has_index = ends_with(lower, ".gz") && std::ifstream(path + ".tbi").good();

#ifdef HAVE_HTSLIB
    if (has_index) {
        try {
            return std::make_shared<TabixGeneStore>(path);
        } catch (const InputError& e) {
            log(LogLevel::WARNING, "Failed to open tabix index: " + std::string(e.what()) +
                                   ". Falling back to in-memory loading.");
        }
    }
#else
    if (has_index) {
        log(LogLevel::WARNING, "Tabix support not compiled in. Build with htslib. "
                               "Falling back to in-memory loading for: " + path);
    }
#endif

    return MemoryGeneStore::from_gene_table(path);
}

} // namespace loctogene
