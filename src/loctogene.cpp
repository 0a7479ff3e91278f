/**
 * loctogene - core types, classifier and logging
 */

#include "loctogene.hpp"
#include "gene_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace loctogene {

// ============================================================================
// Logging
// ============================================================================

static LogLevel g_log_level = LogLevel::INFO;
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time_t_now, &local_tm);

    const char* level_str;
    switch (level) {
        case LogLevel::DEBUG:   level_str = "DEBUG"; break;
        case LogLevel::INFO:    level_str = "INFO"; break;
        case LogLevel::WARNING: level_str = "WARNING"; break;
        case LogLevel::ERROR:   level_str = "ERROR"; break;
        default:                level_str = "UNKNOWN"; break;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
              << " - " << level_str << " - " << message << std::endl;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += sep;
        result += items[i];
    }
    return result;
}

// ============================================================================
// Labels
// ============================================================================

const char* const NA = "n/a";
const char* const PROMOTER = "promoter";
const char* const EXONIC = "exonic";
const char* const INTRONIC = "intronic";
const char* const INTERGENIC = "intergenic";

std::string make_label(bool is_promoter, bool is_exon, bool is_intronic) {
    std::vector<std::string> labels;

    if (is_promoter) {
        labels.push_back(PROMOTER);
    }

    if (is_exon) {
        labels.push_back(EXONIC);
    } else if (is_intronic) {
        labels.push_back(INTRONIC);
    }

    return join(labels, ",");
}

// ============================================================================
// Location
// ============================================================================

Location::Location(const std::string& chr_, uint32_t start_, uint32_t end_)
    : chr(chr_), start(start_), end(end_) {
    if (chr.empty()) {
        throw InputError("Location has no chromosome");
    }
    if (start > end) {
        throw InputError("Location start > end: " + chr + ":" + std::to_string(start) +
                         "-" + std::to_string(end));
    }
}

std::string Location::to_string() const {
    return chr + ":" + std::to_string(start) + "-" + std::to_string(end);
}

// Parse an unsigned coordinate, ignoring thousands separators
static bool parse_coordinate(const std::string& text, uint32_t& value) {
    std::string digits;
    for (char c : text) {
        if (c == ',') continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        digits += c;
    }
    if (digits.empty() || digits.size() > 10) return false;

    unsigned long long v = std::stoull(digits);
    if (v > 0xFFFFFFFFULL) return false;

    value = static_cast<uint32_t>(v);
    return true;
}

Location Location::parse(const std::string& text) {
    std::string s = text;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(0, 1);

    size_t colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= s.size()) {
        throw InputError("Invalid location '" + text + "'. Expected CHR:START-END");
    }

    std::string chr = s.substr(0, colon);
    std::string range = s.substr(colon + 1);

    uint32_t start = 0;
    uint32_t end = 0;
    size_t dash = range.find('-');
    if (dash == std::string::npos) {
        if (!parse_coordinate(range, start)) {
            throw InputError("Invalid position in location '" + text + "'");
        }
        end = start;
    } else {
        if (!parse_coordinate(range.substr(0, dash), start) ||
            !parse_coordinate(range.substr(dash + 1), end)) {
            throw InputError("Invalid range in location '" + text + "'");
        }
    }

    return Location(chr, start, end);
}

// ============================================================================
// Level
// ============================================================================

std::string level_to_string(Level level) {
    switch (level) {
        case Level::GENE:       return "Gene";
        case Level::TRANSCRIPT: return "Transcript";
        case Level::EXON:       return "Exon";
        default:                return "Gene";
    }
}

Level parse_level(const std::string& text) {
    std::string lower = text;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "transcript" || lower == "2") return Level::TRANSCRIPT;
    if (lower == "exon" || lower == "3") return Level::EXON;
    return Level::GENE;
}

// ============================================================================
// TSS region
// ============================================================================

TSSRegion::TSSRegion(int offset_5p, int offset_3p) {
    if (offset_5p < 0 || offset_3p < 0) {
        throw InputError("TSS offsets must be non-negative, got [" +
                         std::to_string(offset_5p) + "," + std::to_string(offset_3p) + "]");
    }
    offset_5p_ = static_cast<uint32_t>(offset_5p);
    offset_3p_ = static_cast<uint32_t>(offset_3p);
}

std::string TSSRegion::to_string() const {
    return "[" + std::to_string(offset_5p_) + "," + std::to_string(offset_3p_) + "]";
}

// ============================================================================
// Classifier
// ============================================================================

static uint32_t saturating_sub(uint32_t a, uint32_t b) {
    return a > b ? a - b : 0;
}

int tss_distance(const Location& location, const GenomicFeature& feature) {
    return static_cast<int>(static_cast<int64_t>(feature.tss()) -
                            static_cast<int64_t>(location.mid()));
}

// Promoter window [lo, hi] on the forward strand coordinate axis
static std::pair<uint32_t, uint32_t> promoter_window(const GenomicFeature& feature,
                                                     const TSSRegion& tss_region) {
    uint32_t tss = feature.tss();
    if (feature.is_minus_strand()) {
        return {saturating_sub(tss, tss_region.offset_3p()), tss + tss_region.offset_5p()};
    }
    return {saturating_sub(tss, tss_region.offset_5p()), tss + tss_region.offset_3p()};
}

std::pair<uint32_t, uint32_t> search_window(const GenomicFeature& feature,
                                            const TSSRegion& tss_region) {
    auto [lo, hi] = promoter_window(feature, tss_region);
    return {std::min(lo, feature.start), std::max(hi, feature.end)};
}

bool in_promoter(const Location& location, const GenomicFeature& feature,
                 const TSSRegion& tss_region) {
    auto [lo, hi] = promoter_window(feature, tss_region);
    uint32_t mid = location.mid();
    return mid >= lo && mid <= hi;
}

Classification classify_location(const Location& location,
                                 const GenomicFeature& feature,
                                 const TSSRegion& tss_region,
                                 bool is_exon) {
    Classification result;
    result.tss_dist = tss_distance(location, feature);

    auto [s, e] = search_window(feature, tss_region);
    if (location.start > e || location.end < s) {
        result.is_intergenic = true;
        return result;
    }

    uint32_t mid = location.mid();
    result.is_promoter = in_promoter(location, feature, tss_region);
    result.is_exon = is_exon;
    result.is_intronic = mid >= feature.start && mid <= feature.end;

    return result;
}

Classification classify_with_exon_lookup(const Location& location,
                                         const GenomicFeature& feature,
                                         const TSSRegion& tss_region,
                                         const std::function<bool()>& exon_lookup) {
    auto [s, e] = search_window(feature, tss_region);
    if (location.start > e || location.end < s) {
        return classify_location(location, feature, tss_region, false);
    }
    return classify_location(location, feature, tss_region, exon_lookup());
}

Classification classify_location(const Location& location,
                                 const GenomicFeature& feature,
                                 const TSSRegion& tss_region,
                                 const GeneStore& store) {
    return classify_with_exon_lookup(location, feature, tss_region, [&]() {
        return !store.features_in_exon(location, feature.gene_id).empty();
    });
}

std::string Classification::label() const {
    if (is_intergenic) return INTERGENIC;
    return make_label(is_promoter, is_exon, is_intronic);
}

} // namespace loctogene
