#pragma once

#include "core/sequence.hpp"

#include <cstddef>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fastaclass {

// Thrown by FastaReader::records() when the source cannot be opened.
class SourceNotFound : public std::runtime_error {
public:
    SourceNotFound(const std::string& path, const std::string& reason);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Incremental FASTA parser over a caller-owned stream.
// "\n", "\r\n" and a lone "\r" all end a line. Lines are whitespace-trimmed; blank lines are skipped; lines before the
// first '>' header are discarded. A record is returned only once its end
// is seen (next header or end of stream), with its sequence lines joined
// without separators.
class FastaRecordStream {
public:
    explicit FastaRecordStream(std::istream& in) : in_(in) {}

    // Next complete record, or std::nullopt at end of stream.
    std::optional<Sequence> next();

private:
    // Next physical line, split on '\n' and '\r'. The view stays valid
    // until the following call.
    bool next_line(std::string_view& out);

    std::istream& in_;
    std::string line_;
    size_t pos_ = std::string::npos; // start of the unread part of line_
    std::string header_;
    std::string seq_;
    bool has_header_ = false;
};

// Single-pass range of records that owns its input stream. The stream is
// closed when the range is destroyed, whether or not iteration finished.
class FastaRecordRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Sequence;
        using difference_type = std::ptrdiff_t;
        using pointer = const Sequence*;
        using reference = const Sequence&;

        iterator() = default;

        reference operator*() const { return *range_->current_; }
        pointer operator->() const { return &*range_->current_; }

        iterator& operator++() {
            range_->advance();
            if (!range_->current_) range_ = nullptr;
            return *this;
        }
        // Holds the record *it referred to before the increment.
        class postfix_value {
        public:
            explicit postfix_value(const Sequence& seq) : seq_(seq) {}
            const Sequence& operator*() const { return seq_; }

        private:
            Sequence seq_;
        };

        postfix_value operator++(int) {
            postfix_value prev(**this);
            ++*this;
            return prev;
        }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.range_ == b.range_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) {
            return a.range_ != b.range_;
        }

    private:
        friend class FastaRecordRange;
        explicit iterator(FastaRecordRange* range) : range_(range) {}

        FastaRecordRange* range_ = nullptr;
    };

    explicit FastaRecordRange(std::unique_ptr<std::istream> in);

    FastaRecordRange(const FastaRecordRange&) = delete;
    FastaRecordRange& operator=(const FastaRecordRange&) = delete;
    FastaRecordRange(FastaRecordRange&&) = default;

    // The first call parses the first record; later calls resume where
    // iteration stopped.
    iterator begin();
    iterator end() { return iterator(); }

private:
    void advance() { current_ = stream_.next(); }

    std::unique_ptr<std::istream> in_;
    FastaRecordStream stream_;
    std::optional<Sequence> current_;
    bool started_ = false;
};

// FASTA file reader. Holds only the path; every call opens the file
// afresh and closes it before returning (or when the returned range dies).
class FastaReader {
public:
    explicit FastaReader(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    // True iff the file opens and its first character is '>'.
    // Missing, unreadable or empty files give false.
    bool is_fasta() const;

    // Lazy record sequence from the start of the file.
    // Throws SourceNotFound if the file cannot be opened.
    FastaRecordRange records() const;

private:
    std::string path_;
};

// True iff the next character of the stream is '>'. Does not consume it.
bool looks_like_fasta(std::istream& in);

// Read all records from an input stream.
std::vector<Sequence> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file. Throws SourceNotFound.
std::vector<Sequence> read_fasta(const std::string& path);

} // namespace fastaclass
