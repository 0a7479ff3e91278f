/**
 * Input Parsing
 *
 * Location lists (region strings or BED), CLI config files and the
 * "5P,3P" TSS region argument.
 */

#ifndef LOCTOGENE_INPUT_PARSER_HPP
#define LOCTOGENE_INPUT_PARSER_HPP

#include "loctogene.hpp"

#include <string>
#include <vector>

namespace loctogene {

/**
 * Input line formats accepted by read_locations
 */
enum class InputFormat {
    REGION,     // chr:start-end or chr:pos, 1-based inclusive
    BED,        // chr<TAB>start<TAB>end[...], 0-based half-open
    UNKNOWN
};

/**
 * Detect the format of a non-header input line
 */
InputFormat detect_input_format(const std::string& line);

/**
 * Parse a BED line into a 1-based inclusive location.
 * BED start is 0-based, so start + 1; end is unchanged.
 * @throws InputError on malformed lines
 */
Location parse_bed_line(const std::string& line);

/**
 * Parse one input line in either accepted format
 * @throws InputError if the format is unknown or the line is malformed
 */
Location parse_location_line(const std::string& line);

/**
 * True for lines read_locations skips: blank, '#' comments and the
 * UCSC "track" / "browser" header lines.
 */
bool is_skippable_line(const std::string& line);

/**
 * Read every location from a plain or gzipped file
 * @throws InputError naming path and line number on the first bad line
 */
std::vector<Location> read_locations(const std::string& path);

/**
 * Parse "5P,3P" (e.g. "2000,1000") into a TSS region
 * @throws InputError on malformed text or negative offsets
 */
TSSRegion parse_tss_region(const std::string& text);

/**
 * Expand one config file line into CLI arguments.
 * "key = value" -> {"--key", "value"}; other lines are split on whitespace.
 * '#' starts a comment.
 */
std::vector<std::string> parse_config_line(const std::string& line);

/**
 * Expand a whole config file into CLI arguments
 * @throws InputError if the file cannot be opened
 */
std::vector<std::string> read_config_file(const std::string& path);

} // namespace loctogene

#endif // LOCTOGENE_INPUT_PARSER_HPP
