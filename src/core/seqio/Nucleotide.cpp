#include "Nucleotide.hpp"

using namespace std;

namespace seqio {

namespace {

/** Lookup table: byte -> complement byte. */
struct ComplementTable
{
  unsigned char comp[256];

  ComplementTable() {
    for (int i=0; i<256; i++) {
      comp[i] = static_cast<unsigned char>(i);
    }
    const string from = "ACGTRYKMBVDHSWN";
    const string to   = "TGCAYRMKVBHDSWN";
    for (size_t i=0; i<from.size(); i++) {
      unsigned char upper_from = from[i];
      unsigned char upper_to = to[i];
      comp[upper_from] = upper_to;
      comp[upper_from + ('a'-'A')] = upper_to + ('a'-'A');
    }
  }
};

const ComplementTable nuc_table;

} // anonymous namespace

char complement(char nuc) {
  return static_cast<char>(nuc_table.comp[static_cast<unsigned char>(nuc)]);
}

string reverseComplement(const string& seq) {
  string rc;
  rc.reserve(seq.size());
  for (string::const_reverse_iterator it=seq.rbegin(); it!=seq.rend(); ++it) {
    rc.push_back(complement(*it));
  }
  return rc;
}

vector<uint8_t> reverseComplement(const vector<uint8_t>& seq) {
  vector<uint8_t> rc;
  rc.reserve(seq.size());
  for (vector<uint8_t>::const_reverse_iterator it=seq.rbegin(); it!=seq.rend(); ++it) {
    rc.push_back(nuc_table.comp[*it]);
  }
  return rc;
}

} // namespace seqio
