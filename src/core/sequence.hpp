#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace fastaclass {

// Alphabet classes, in the order reports list them.
enum class Alphabet {
    kNucleotide = 0,
    kProtein,
    kLikelyNucleotide,
    kLikelyProtein,
    kUnknown,
};

inline constexpr int kNumAlphabets = 5;

// Text label for an alphabet class ("nucleotide", "likely protein", ...).
const char* alphabet_name(Alphabet a);

// Classify already-normalized (uppercase) sequence text.
//   1. all distinct chars in {A,C,G,T,U}         -> kNucleotide
//   2. all distinct chars in the 20 amino acids  -> kProtein
//   3. otherwise compare per-character counts against both sets
//      (A, C, G, T count toward both); ties are kUnknown.
// The empty sequence is kNucleotide.
Alphabet classify_alphabet(std::string_view seq);

// One FASTA record. Header and sequence are whitespace-trimmed on
// construction and the sequence is upper-cased; no other validation.
class Sequence {
public:
    Sequence(const std::string& header, const std::string& sequence);

    const std::string& header() const { return header_; }
    const std::string& sequence() const { return sequence_; }

    size_t length() const { return sequence_.size(); }

    // ">" + header + "\n" + sequence, sequence on a single line.
    std::string render() const;

    Alphabet alphabet() const { return classify_alphabet(sequence_); }

private:
    std::string header_;
    std::string sequence_;
};

std::ostream& operator<<(std::ostream& os, const Sequence& seq);

} // namespace fastaclass
