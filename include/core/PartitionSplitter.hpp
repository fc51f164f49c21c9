#pragma once

#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/DataStructs.hpp"

namespace MotifColoc {

/**
 * @brief Sequences keyed by identifier, remembering order of first appearance.
 */
class SequenceMap {
public:
    /**
     * @brief Appends a sequence.
     * @throws InputError if the identifier is already present.
     */
    void add(Sequence sequence);

    bool contains(const std::string& id) const;

    /**
     * @throws std::out_of_range if the identifier is unknown.
     */
    const Sequence& at(const std::string& id) const;

    /// Pointer lookup; nullptr if unknown.
    const Sequence* find(const std::string& id) const;

    const std::vector<Sequence>& all() const { return sequences_; }
    size_t size() const { return sequences_.size(); }
    bool empty() const { return sequences_.empty(); }
    int64_t total_length() const;

private:
    std::vector<Sequence> sequences_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * @brief Splits a multi-record FASTA input into single-sequence units.
 *
 * Residue lines are concatenated without their line breaks; every other byte
 * is preserved (case included). The identifier is the header text after '>'
 * up to the first whitespace.
 */
class PartitionSplitter {
public:
    /**
     * @brief Splits FASTA text read from a stream.
     * @throws InputError if the input is empty, has residues before the first
     *         header, a header without identifier, or duplicate identifiers.
     */
    static SequenceMap split(std::istream& input);

    /**
     * @brief Splits a FASTA file (plain or compressed, read through HTSlib).
     * @throws InputError if the file is missing or malformed.
     */
    static SequenceMap split_file(const std::string& path);

    /**
     * @brief Writes one single-record FASTA file per sequence into work_dir.
     *
     * File name is <work_dir>/<stem>.fa with the stem from
     * partition_file_stem(); two ids mapping to the same stem get a numeric
     * suffix. Content is the header line plus the residues on a single line.
     * partition_id keeps the unmodified sequence id.
     *
     * @throws InputError if a file cannot be written.
     */
    static std::vector<PartitionFile> write_partitions(const SequenceMap& sequences, const std::string& work_dir);

    /**
     * @brief Writes a single partition file.
     * @param file_stem File name without ".fa"; empty means partition_file_stem(sequence.id).
     */
    static PartitionFile write_partition(const Sequence& sequence, const std::string& work_dir,
                                         const std::string& file_stem = "");

    /**
     * @brief File name stem for a sequence id that stays inside the work directory.
     *
     * Path separators and NUL become '_'; "", "." and ".." get a leading '_'.
     */
    static std::string partition_file_stem(const std::string& id);
};

} // namespace MotifColoc
