#include "core/sequence.hpp"
#include "util/text.hpp"

#include <array>
#include <cstdint>

namespace fastaclass {

// Byte-indexed membership tables for the two reference alphabets.
struct AlphabetTables {
    std::array<bool, 256> nucleotide{};
    std::array<bool, 256> protein{};

    AlphabetTables() {
        for (char c : std::string_view("ACGTU"))
            nucleotide[static_cast<uint8_t>(c)] = true;
        for (char c : std::string_view("ACDEFGHIKLMNPQRSTVWY"))
            protein[static_cast<uint8_t>(c)] = true;
    }
};

static const AlphabetTables& tables() {
    static const AlphabetTables t;
    return t;
}

const char* alphabet_name(Alphabet a) {
    switch (a) {
        case Alphabet::kNucleotide:       return "nucleotide";
        case Alphabet::kProtein:          return "protein";
        case Alphabet::kLikelyNucleotide: return "likely nucleotide";
        case Alphabet::kLikelyProtein:    return "likely protein";
        case Alphabet::kUnknown:          return "unknown";
    }
    return "unknown";
}

Alphabet classify_alphabet(std::string_view seq) {
    const auto& t = tables();

    // Distinct-character pass
    std::array<bool, 256> present{};
    for (char c : seq)
        present[static_cast<uint8_t>(c)] = true;

    bool all_nuc = true;
    bool all_prot = true;
    for (int i = 0; i < 256; i++) {
        if (!present[i]) continue;
        if (!t.nucleotide[i]) all_nuc = false;
        if (!t.protein[i]) all_prot = false;
    }
    if (all_nuc) return Alphabet::kNucleotide;
    if (all_prot) return Alphabet::kProtein;

    // Mixed: a base in both sets counts toward both totals.
    uint64_t nuc_count = 0;
    uint64_t prot_count = 0;
    for (char c : seq) {
        auto b = static_cast<uint8_t>(c);
        if (t.nucleotide[b]) nuc_count++;
        if (t.protein[b]) prot_count++;
    }

    if (nuc_count > prot_count) return Alphabet::kLikelyNucleotide;
    if (prot_count > nuc_count) return Alphabet::kLikelyProtein;
    return Alphabet::kUnknown;
}

Sequence::Sequence(const std::string& header, const std::string& sequence)
    : header_(trim(header)), sequence_(trim(sequence)) {
    to_upper_inplace(sequence_);
}

std::string Sequence::render() const {
    std::string out;
    out.reserve(header_.size() + sequence_.size() + 2);
    out += '>';
    out += header_;
    out += '\n';
    out += sequence_;
    return out;
}

std::ostream& operator<<(std::ostream& os, const Sequence& seq) {
    return os << '>' << seq.header() << '\n' << seq.sequence();
}

} // namespace fastaclass
