#include "utils/TextLineReader.hpp"

#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace MotifColoc {

TextLineReader::TextLineReader(const std::string& path)
    : path_(path), fp_(nullptr), buffer_{0, 0, nullptr}, line_number_(0) {
    fp_ = hts_open(path.c_str(), "r");
    if (!fp_) {
        throw std::runtime_error("Failed to open file: " + path);
    }
}

TextLineReader::~TextLineReader() {
    release();
}

TextLineReader::TextLineReader(TextLineReader&& other) noexcept
    : path_(std::move(other.path_)),
      fp_(other.fp_),
      buffer_(other.buffer_),
      line_number_(other.line_number_) {
    other.fp_ = nullptr;
    other.buffer_ = kstring_t{0, 0, nullptr};
}

TextLineReader& TextLineReader::operator=(TextLineReader&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fp_ = other.fp_;
        buffer_ = other.buffer_;
        line_number_ = other.line_number_;
        other.fp_ = nullptr;
        other.buffer_ = kstring_t{0, 0, nullptr};
    }
    return *this;
}

void TextLineReader::release() {
    if (fp_) {
        hts_close(fp_);
        fp_ = nullptr;
    }
    if (buffer_.s) {
        free(buffer_.s);
        buffer_ = kstring_t{0, 0, nullptr};
    }
}

bool TextLineReader::next_line(std::string& line) {
    if (!fp_) {
        return false;
    }

    // hts_getline: >= 0 line length, -1 EOF, < -1 error
    int ret = hts_getline(fp_, KS_SEP_LINE, &buffer_);
    if (ret == -1) {
        return false;
    }
    if (ret < -1) {
        throw std::runtime_error("Read error in " + path_ + " after line " + std::to_string(line_number_));
    }

    line.assign(buffer_.s ? buffer_.s : "", buffer_.l);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    ++line_number_;
    return true;
}

} // namespace MotifColoc
