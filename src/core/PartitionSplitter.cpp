#include "core/PartitionSplitter.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unordered_set>

#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include "utils/TextLineReader.hpp"

namespace MotifColoc {

// ==================================================
// SequenceMap Implementation
// ==================================================

void SequenceMap::add(Sequence sequence) {
    if (index_.count(sequence.id)) {
        throw InputError("Duplicate sequence identifier: " + sequence.id);
    }
    index_.emplace(sequence.id, sequences_.size());
    sequences_.push_back(std::move(sequence));
}

bool SequenceMap::contains(const std::string& id) const {
    return index_.count(id) > 0;
}

const Sequence& SequenceMap::at(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown sequence identifier: " + id);
    }
    return sequences_[it->second];
}

const Sequence* SequenceMap::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &sequences_[it->second];
}

int64_t SequenceMap::total_length() const {
    int64_t total = 0;
    for (const auto& s : sequences_) {
        total += s.length();
    }
    return total;
}

// ==================================================
// PartitionSplitter Implementation
// ==================================================

namespace {

/**
 * Collects FASTA lines one at a time; shared by the stream and HTSlib paths.
 */
class FastaAccumulator {
public:
    explicit FastaAccumulator(std::string source) : source_(std::move(source)) {}

    void feed(const std::string& raw_line, size_t line_number) {
        std::string line = raw_line;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!line.empty() && line[0] == '>') {
            flush();
            size_t begin = 1;
            while (begin < line.size() && std::isspace(static_cast<unsigned char>(line[begin]))) {
                ++begin;
            }
            size_t end = begin;
            while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
                ++end;
            }
            if (end == begin) {
                throw InputError(source_ + ": header without identifier at line " + std::to_string(line_number));
            }
            current_.id = line.substr(begin, end - begin);
            current_.residues.clear();
            in_record_ = true;
            return;
        }

        if (line.empty()) {
            return;
        }

        if (!in_record_) {
            throw InputError(source_ + ": sequence data before the first '>' header at line " +
                             std::to_string(line_number));
        }
        current_.residues += line;
    }

    SequenceMap finish() {
        flush();
        if (sequences_.empty()) {
            throw InputError(source_ + ": no sequence headers found");
        }
        return std::move(sequences_);
    }

private:
    void flush() {
        if (in_record_) {
            if (current_.residues.empty()) {
                LOG_WARNING(source_ + ": sequence '" + current_.id + "' is empty");
            }
            sequences_.add(std::move(current_));
            current_ = Sequence();
            in_record_ = false;
        }
    }

    std::string source_;
    SequenceMap sequences_;
    Sequence current_;
    bool in_record_ = false;
};

}  // namespace

SequenceMap PartitionSplitter::split(std::istream& input) {
    FastaAccumulator acc("<stream>");
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        acc.feed(line, ++line_number);
    }
    return acc.finish();
}

SequenceMap PartitionSplitter::split_file(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw InputError("Sequence input not found: " + path);
    }

    std::unique_ptr<TextLineReader> reader;
    try {
        reader = std::make_unique<TextLineReader>(path);
    } catch (const std::runtime_error& e) {
        throw InputError(e.what());
    }

    FastaAccumulator acc(path);
    std::string line;
    try {
        while (reader->next_line(line)) {
            acc.feed(line, reader->line_number());
        }
    } catch (const InputError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw InputError(e.what());
    }

    SequenceMap sequences = acc.finish();
    LOG_INFO("Loaded " + std::to_string(sequences.size()) + " sequences (" +
             std::to_string(sequences.total_length()) + " bp) from " + path);
    return sequences;
}

std::string PartitionSplitter::partition_file_stem(const std::string& id) {
    std::string stem = id;
    for (char& ch : stem) {
        if (ch == '/' || ch == '\\' || ch == '\0') {
            ch = '_';
        }
    }
    if (stem.empty() || stem == "." || stem == "..") {
        stem.insert(stem.begin(), '_');
    }
    return stem;
}

PartitionFile PartitionSplitter::write_partition(const Sequence& sequence, const std::string& work_dir,
                                                 const std::string& file_stem) {
    namespace fs = std::filesystem;

    const std::string stem = file_stem.empty() ? partition_file_stem(sequence.id) : file_stem;

    PartitionFile part;
    part.partition_id = sequence.id;
    part.sequence_file = (fs::path(work_dir) / (stem + ".fa")).string();
    part.sequence_length = sequence.length();

    std::ofstream out(part.sequence_file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw InputError("Failed to write partition file: " + part.sequence_file);
    }
    out << '>' << sequence.id << '\n' << sequence.residues << '\n';
    out.close();
    if (!out) {
        throw InputError("Failed to write partition file: " + part.sequence_file);
    }

    return part;
}

std::vector<PartitionFile> PartitionSplitter::write_partitions(const SequenceMap& sequences,
                                                               const std::string& work_dir) {
    std::error_code ec;
    std::filesystem::create_directories(work_dir, ec);
    if (ec) {
        throw InputError("Cannot create work directory " + work_dir + ": " + ec.message());
    }

    std::vector<PartitionFile> parts;
    parts.reserve(sequences.size());
    std::unordered_set<std::string> used_stems;
    for (const auto& seq : sequences.all()) {
        std::string stem = partition_file_stem(seq.id);
        if (!used_stems.insert(stem).second) {
            const std::string base = stem;
            for (size_t n = 2; !used_stems.insert(stem).second; ++n) {
                stem = base + "_" + std::to_string(n);
            }
        }
        if (stem != seq.id) {
            LOG_WARNING("Sequence id '" + seq.id + "' is written to partition file " + stem + ".fa");
        }
        parts.push_back(write_partition(seq, work_dir, stem));
        LOG_DEBUG("Partition " + seq.id + ": " + std::to_string(seq.length()) + " bp -> " + parts.back().sequence_file);
    }
    return parts;
}

} // namespace MotifColoc
