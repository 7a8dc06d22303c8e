#include "structure_record.hh"
#include "structure_codec.hh"
#include "pseudoknot.hh"
#include "mountain_metric.hh"

#include <iostream>

namespace RnaSS {

    const char StructureRecord::default_nucleotide;

    StructureRecord::StructureRecord(const PairedSites &paired)
        : name_(), sequence_(paired.size(), default_nucleotide), paired_(paired) {}

    StructureRecord::StructureRecord(const std::string &structure,
                                     const BracketAlphabet &alphabet)
        : name_(),
          sequence_(structure.length(), default_nucleotide),
          paired_(decode(structure, alphabet)) {}

    std::string
    StructureRecord::dot_bracket_string(const BracketAlphabet &alphabet) const {
        return encode(paired_, alphabet);
    }

    bool
    StructureRecord::is_pseudoknotted() const {
        return RnaSS::is_pseudoknotted(paired_);
    }

    double
    StructureRecord::mountain_distance(const StructureRecord &other,
                                       double p) const {
        return RnaSS::mountain_distance(paired_, other.paired_, p);
    }

    double
    StructureRecord::normalised_mountain_distance(const StructureRecord &other,
                                                  double p) const {
        return RnaSS::normalised_mountain_distance(paired_, other.paired_, p);
    }

    std::string
    StructureRecord::to_string() const {
        return ">" + name_ + "\n" + sequence_ + "\n" + dot_bracket_string();
    }

    std::ostream &
    operator<<(std::ostream &out, const StructureRecord &record) {
        return out << record.to_string();
    }

} // end namespace RnaSS
