/**
 * Line reader for plain and gzip-compressed text files
 */

#ifndef LOCTOGENE_LINE_READER_HPP
#define LOCTOGENE_LINE_READER_HPP

#include "loctogene.hpp"

#include <string>
#include <vector>
#include <zlib.h>

namespace loctogene {

/**
 * Reads a text file line by line through zlib, which reads uncompressed
 * files transparently. Trailing '\n' and '\r' are stripped.
 */
class LineReader {
public:
    /**
     * @throws InputError if the file cannot be opened
     */
    explicit LineReader(const std::string& path)
        : path_(path), buffer_(65536) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw InputError("Cannot open file: " + path);
        }
    }

    ~LineReader() {
        if (gz_) gzclose(gz_);
    }

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /**
     * Read the next line
     * @return false at end of file
     * @throws InputError on a read error
     */
    bool next(std::string& line) {
        line.clear();
        bool got_data = false;

        while (gzgets(gz_, buffer_.data(), static_cast<int>(buffer_.size())) != nullptr) {
            got_data = true;
            line += buffer_.data();
            if (!line.empty() && line.back() == '\n') break;
        }

        if (!got_data) {
            int errnum = 0;
            const char* msg = gzerror(gz_, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                throw InputError("Error reading " + path_ + ": " + (msg ? msg : "unknown error"));
            }
            return false;
        }

        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        ++line_number_;
        return true;
    }

    size_t line_number() const { return line_number_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    gzFile gz_ = nullptr;
    std::vector<char> buffer_;
    size_t line_number_ = 0;
};

} // namespace loctogene

#endif // LOCTOGENE_LINE_READER_HPP
