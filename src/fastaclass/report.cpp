#include "fastaclass/report.hpp"

#include <string>

namespace fastaclass {

static const std::string kRule(40, '-');

void write_record_report(std::ostream& out, const Sequence& rec) {
    out << rec << '\n'
        << "Length: " << rec.length() << '\n'
        << "Alphabet: " << alphabet_name(rec.alphabet()) << '\n'
        << kRule << '\n';
}

void write_summary(std::ostream& out, const AlphabetTally& tally) {
    out << "# alphabet\tcount\n";
    for (int i = 0; i < kNumAlphabets; i++) {
        auto a = static_cast<Alphabet>(i);
        out << alphabet_name(a) << '\t' << tally.count(a) << '\n';
    }
    out << "total\t" << tally.total << '\n';
}

uint64_t report_records(const FastaReader& reader, std::ostream& out,
                        AlphabetTally& tally, const Logger& logger) {
    uint64_t n = 0;
    for (const auto& rec : reader.records()) {
        Alphabet a = rec.alphabet();
        logger.debug("record %llu: '%s' length=%zu alphabet=%s",
                     static_cast<unsigned long long>(n), rec.header().c_str(),
                     rec.length(), alphabet_name(a));
        write_record_report(out, rec);
        tally.add(a);
        n++;
    }
    return n;
}

} // namespace fastaclass
