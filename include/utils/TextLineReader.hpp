#pragma once

#include <string>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace MotifColoc {

/**
 * @brief RAII wrapper for line-oriented reading of text files with HTSlib.
 *
 * hts_open() detects compression, so plain, gzip and bgzip inputs (FASTA,
 * GTF, predictor output) are all read the same way.
 *
 * Thread-safety: one instance per thread.
 *
 * Usage:
 *   TextLineReader reader("genes.gtf.gz");
 *   std::string line;
 *   while (reader.next_line(line)) { ... }
 */
class TextLineReader {
public:
    /**
     * @brief Opens the file for reading.
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit TextLineReader(const std::string& path);

    ~TextLineReader();

    // Disable copy, allow move
    TextLineReader(const TextLineReader&) = delete;
    TextLineReader& operator=(const TextLineReader&) = delete;
    TextLineReader(TextLineReader&&) noexcept;
    TextLineReader& operator=(TextLineReader&&) noexcept;

    /**
     * @brief Reads the next line without its terminator ('\r' is stripped too).
     *
     * @return false at end of file.
     * @throws std::runtime_error on a read error.
     */
    bool next_line(std::string& line);

    /**
     * @brief Number of lines returned so far.
     */
    size_t line_number() const { return line_number_; }

    const std::string& get_path() const { return path_; }

private:
    void release();

    std::string path_;
    htsFile* fp_;
    kstring_t buffer_;
    size_t line_number_;
};

} // namespace MotifColoc
