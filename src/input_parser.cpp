#include "input_parser.hpp"
#include "line_reader.hpp"

#include <cctype>
#include <sstream>

namespace loctogene {

static std::string trim(const std::string& text) {
    size_t s = text.find_first_not_of(" \t\r\n");
    if (s == std::string::npos) return "";
    size_t e = text.find_last_not_of(" \t\r\n");
    return text.substr(s, e - s + 1);
}

static bool is_number(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (std::getline(iss, field, '\t')) {
        fields.push_back(field);
    }
    return fields;
}

// ============================================================================
// Locations
// ============================================================================

InputFormat detect_input_format(const std::string& raw_line) {
    std::string line = trim(raw_line);
    if (line.empty() || line[0] == '#') return InputFormat::UNKNOWN;

    if (line.find('\t') != std::string::npos) {
        auto fields = split_tabs(line);
        if (fields.size() >= 3 && !fields[0].empty() &&
            is_number(fields[1]) && is_number(fields[2])) {
            return InputFormat::BED;
        }
        return InputFormat::UNKNOWN;
    }

    size_t colon = line.rfind(':');
    if (colon != std::string::npos && colon > 0 && colon + 1 < line.size() &&
        std::isdigit(static_cast<unsigned char>(line[colon + 1]))) {
        return InputFormat::REGION;
    }

    return InputFormat::UNKNOWN;
}

Location parse_bed_line(const std::string& line) {
    auto fields = split_tabs(trim(line));
    if (fields.size() < 3) {
        throw InputError("BED line needs at least 3 columns: '" + line + "'");
    }
    if (!is_number(fields[1]) || !is_number(fields[2]) ||
        fields[1].size() > 10 || fields[2].size() > 10) {
        throw InputError("Invalid BED coordinates: '" + line + "'");
    }

    unsigned long long start = std::stoull(fields[1]) + 1;
    unsigned long long end = std::stoull(fields[2]);
    if (end > 0xFFFFFFFFULL || start > 0xFFFFFFFFULL) {
        throw InputError("BED coordinates out of range: '" + line + "'");
    }
    // Zero-length BED interval (insertion point): annotate the base after it
    if (end + 1 == start) end = start;

    return Location(fields[0], static_cast<uint32_t>(start), static_cast<uint32_t>(end));
}

Location parse_location_line(const std::string& line) {
    switch (detect_input_format(line)) {
        case InputFormat::BED:
            return parse_bed_line(line);
        case InputFormat::REGION:
            return Location::parse(line);
        default:
            throw InputError("Unrecognized location line: '" + line + "'");
    }
}

bool is_skippable_line(const std::string& raw_line) {
    std::string line = trim(raw_line);
    return line.empty() || line[0] == '#' ||
           line.compare(0, 5, "track") == 0 ||
           line.compare(0, 7, "browser") == 0;
}

std::vector<Location> read_locations(const std::string& path) {
    LineReader reader(path);
    std::vector<Location> locations;

    std::string line;
    while (reader.next(line)) {
        if (is_skippable_line(line)) continue;

        try {
            locations.push_back(parse_location_line(line));
        } catch (const InputError& e) {
            throw InputError(path + ":" + std::to_string(reader.line_number()) + ": " + e.what());
        }
    }

    log(LogLevel::INFO, "Read " + std::to_string(locations.size()) + " locations from " + path);
    return locations;
}

// ============================================================================
// TSS region
// ============================================================================

TSSRegion parse_tss_region(const std::string& text) {
    std::string s = trim(text);
    size_t comma = s.find(',');
    if (comma == std::string::npos) {
        throw InputError("Invalid TSS region '" + text + "'. Expected 5P,3P (e.g. 2000,1000)");
    }

    std::string p5 = trim(s.substr(0, comma));
    std::string p3 = trim(s.substr(comma + 1));

    auto parse_offset = [&](const std::string& value) {
        std::string digits = value;
        if (!digits.empty() && digits[0] == '-') digits.erase(0, 1);
        if (!is_number(digits) || digits.size() > 9) {
            throw InputError("Invalid TSS offset '" + value + "' in '" + text + "'");
        }
        return std::stoi(value);
    };

    return TSSRegion(parse_offset(p5), parse_offset(p3));
}

// ============================================================================
// Config file
// ============================================================================

std::vector<std::string> parse_config_line(const std::string& raw_line) {
    std::vector<std::string> result;
    std::string cfg_line = raw_line;

    size_t hash = cfg_line.find('#');
    if (hash != std::string::npos) cfg_line = cfg_line.substr(0, hash);

    cfg_line = trim(cfg_line);
    if (cfg_line.empty()) return result;

    // "key = value" or raw flags
    size_t eq = cfg_line.find('=');
    if (eq != std::string::npos) {
        std::string key = trim(cfg_line.substr(0, eq));
        std::string val = trim(cfg_line.substr(eq + 1));
        if (!key.empty()) {
            if (key[0] != '-') key = "--" + key;
            result.push_back(key);
            if (!val.empty()) result.push_back(val);
        }
    } else {
        std::istringstream cfg_iss(cfg_line);
        std::string token;
        while (cfg_iss >> token) {
            result.push_back(token);
        }
    }

    return result;
}

std::vector<std::string> read_config_file(const std::string& path) {
    LineReader reader(path);
    std::vector<std::string> args;

    std::string line;
    while (reader.next(line)) {
        auto line_args = parse_config_line(line);
        args.insert(args.end(), line_args.begin(), line_args.end());
    }

    log(LogLevel::DEBUG, "Config " + path + ": " + join(args, " "));
    return args;
}

} // namespace loctogene
