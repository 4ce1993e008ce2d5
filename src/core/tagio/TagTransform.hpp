#ifndef TAGTRANSFORM_H
#define TAGTRANSFORM_H

#include "TagName.hpp"
#include "TagStore.hpp"
#include "TagValue.hpp"
#include <seqan/bam_io.h>
#include <string>

namespace tagio {

/** Tags to be reoriented on reverse-strand alignments. */
struct TagSelection
{
  /** tags whose array/string values are reversed */
  TagList rev;
  /** tags whose sequence values are reverse complemented */
  TagList revcomp;

  bool empty() const { return rev.empty() && revcomp.empty(); }
};

/** Reverses a string by character, keeping UTF-8 sequences intact. */
std::string reverseCharacters(const std::string& s);

/**
 * Reversed copy of a value.
 * Arrays keep their element type; strings are reversed by character.
 * \returns none for any other encoding.
 */
boost::optional<TagValue> reverseValue(const TagValue& value);

/**
 * Reverse complement of a value.
 * Applies to strings and uint8 arrays (one nucleotide per byte).
 * \returns none for any other encoding.
 */
boost::optional<TagValue> reverseComplementValue(const TagValue& value);

/**
 * Rewrites tags of one record into forward-strand orientation.
 *
 * All tags in 'rev' are handled first, in order, then all tags in 'revcomp'.
 * Missing tags and values of non-matching types are skipped. A tag listed
 * in both sets is reversed first and the reversed value is then reverse
 * complemented.
 *
 * \returns  number of tag values replaced
 * \throws   TagMutationFailure if a value could not be replaced
 */
unsigned reorientTags(TagStore& tags, const TagList& rev, const TagList& revcomp);

/** Applies reorientTags() to the aux fields of an alignment record. */
unsigned reorientTags(seqan::BamAlignmentRecord& record, const TagSelection& selection);

} // namespace tagio

#endif /* TAGTRANSFORM_H */
