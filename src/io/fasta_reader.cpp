#include "io/fasta_reader.hpp"
#include "util/text.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fastaclass {

SourceNotFound::SourceNotFound(const std::string& path, const std::string& reason)
    : std::runtime_error("cannot open " + path + ": " + reason), path_(path) {}

bool FastaRecordStream::next_line(std::string_view& out) {
    while (pos_ == std::string::npos || pos_ > line_.size()) {
        if (!std::getline(in_, line_))
            return false;
        pos_ = 0;
    }
    size_t end = line_.find('\r', pos_);
    if (end == std::string::npos)
        end = line_.size();
    out = std::string_view(line_).substr(pos_, end - pos_);
    pos_ = end + 1;
    return true;
}

std::optional<Sequence> FastaRecordStream::next() {
    std::string_view raw;
    while (next_line(raw)) {
        std::string_view line = trim(raw);
        if (line.empty())
            continue;

        if (line[0] == '>') {
            std::optional<Sequence> finished;
            if (has_header_)
                finished.emplace(header_, seq_);
            header_.assign(line.substr(1));
            seq_.clear();
            has_header_ = true;
            if (finished)
                return finished;
        } else if (has_header_) {
            seq_.append(line);
        }
    }

    // End of stream: flush the last record
    if (has_header_) {
        has_header_ = false;
        std::optional<Sequence> last(std::in_place, header_, seq_);
        header_.clear();
        seq_.clear();
        return last;
    }
    return std::nullopt;
}

FastaRecordRange::FastaRecordRange(std::unique_ptr<std::istream> in)
    : in_(std::move(in)), stream_(*in_) {}

FastaRecordRange::iterator FastaRecordRange::begin() {
    if (!started_) {
        started_ = true;
        advance();
    }
    return current_ ? iterator(this) : iterator();
}

bool FastaReader::is_fasta() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
        return false;

    char first = 0;
    if (!file.get(first))
        return false;
    return first == '>';
}

FastaRecordRange FastaReader::records() const {
    std::error_code ec;
    if (std::filesystem::is_directory(path_, ec))
        throw SourceNotFound(path_, std::strerror(EISDIR));

    auto file = std::make_unique<std::ifstream>(path_);
    if (!file->is_open()) {
        int err = errno;
        throw SourceNotFound(path_, err != 0 ? std::strerror(err) : "open failed");
    }
    return FastaRecordRange(std::move(file));
}

bool looks_like_fasta(std::istream& in) {
    return in.peek() == '>';
}

std::vector<Sequence> read_fasta_stream(std::istream& in) {
    std::vector<Sequence> records;
    FastaRecordStream stream(in);
    while (auto rec = stream.next())
        records.push_back(std::move(*rec));
    return records;
}

std::vector<Sequence> read_fasta(const std::string& path) {
    std::vector<Sequence> records;
    for (const auto& rec : FastaReader(path).records())
        records.push_back(rec);
    return records;
}

} // namespace fastaclass
