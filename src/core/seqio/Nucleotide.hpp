#ifndef NUCLEOTIDE_H
#define NUCLEOTIDE_H

#include <cstdint>
#include <string>
#include <vector>

namespace seqio {

/**
 * Watson-Crick complement of a nucleotide symbol (IUPAC codes included).
 * Case is preserved; symbols without a complement are returned unchanged.
 */
char complement(char nuc);

/** Reverse complement of a nucleotide sequence. */
std::string reverseComplement(const std::string& seq);

/** Reverse complement of a sequence stored as one nucleotide code per byte. */
std::vector<uint8_t> reverseComplement(const std::vector<uint8_t>& seq);

} // namespace seqio

#endif /* NUCLEOTIDE_H */
