#ifndef TAGSTORE_H
#define TAGSTORE_H

#include "TagName.hpp"
#include "TagValue.hpp"
#include <boost/optional.hpp>
#include <seqan/bam_io.h>
#include <stdexcept>
#include <string>

namespace tagio {

/** Raised when a tag value cannot be removed from or inserted into a record. */
class TagMutationFailure : public std::runtime_error
{
public:
  TagMutationFailure(const TagName& tag, const std::string& reason);
  const TagName& tag() const { return m_tag; }

private:
  TagName m_tag;
};

/**
 * Typed access to the auxiliary fields of an alignment record.
 *
 * Operates on the raw BAM tag data of a seqan::BamAlignmentRecord
 * (record.tags), which must outlive the TagStore.
 */
class TagStore
{
public:
  explicit TagStore(seqan::CharString& tags);

  /**
   * Look up a tag.
   * \returns the decoded value, or none if the record has no such tag.
   * \throws  TagFormatError if the stored value is malformed.
   */
  boost::optional<TagValue> get(const TagName& tag) const;
  bool contains(const TagName& tag) const;

  /** Removes a tag. Throws TagMutationFailure if it is not present. */
  void remove(const TagName& tag);
  /**
   * Appends a tag. Throws TagMutationFailure if the tag is already present
   * or the value cannot be encoded.
   */
  void insert(const TagName& tag, const TagValue& value);
  /**
   * Remove followed by insert under the same key. If the new value cannot
   * be encoded, TagMutationFailure is thrown before the old value is removed.
   */
  void replace(const TagName& tag, const TagValue& value);

private:
  seqan::CharString& m_tags;

  /** Raw aux bytes of a value, TagFormatError rethrown as TagMutationFailure. */
  std::string encode(const TagName& tag, const TagValue& value) const;
  /** Appends key and raw value bytes to the tag block. */
  void append(const TagName& tag, const std::string& raw);
};

} // namespace tagio

#endif /* TAGSTORE_H */
