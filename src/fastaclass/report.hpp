#pragma once

#include "core/sequence.hpp"
#include "io/fasta_reader.hpp"
#include "util/logger.hpp"

#include <array>
#include <cstdint>
#include <ostream>

namespace fastaclass {

// Per-alphabet record counts.
struct AlphabetTally {
    std::array<uint64_t, kNumAlphabets> counts{};
    uint64_t total = 0;

    void add(Alphabet a) {
        counts[static_cast<size_t>(a)]++;
        total++;
    }
    uint64_t count(Alphabet a) const { return counts[static_cast<size_t>(a)]; }
};

// Rendered record, "Length: <n>", "Alphabet: <label>", then a rule of 40 '-'.
void write_record_report(std::ostream& out, const Sequence& rec);

// Tab-separated table:
//   # alphabet\tcount
//   <label>\t<count>     (one line per alphabet, enum order)
//   total\t<count>
void write_summary(std::ostream& out, const AlphabetTally& tally);

// Report every record of reader to out, accumulating into tally.
// Returns the number of records written. Throws SourceNotFound.
uint64_t report_records(const FastaReader& reader, std::ostream& out,
                        AlphabetTally& tally, const Logger& logger);

} // namespace fastaclass
