#include "TagTransform.hpp"
#include "../seqio/Nucleotide.hpp"

using namespace std;

namespace tagio {

namespace {

typedef boost::optional<TagValue> TMaybeValue;

struct ReverseVisitor : public boost::static_visitor<TMaybeValue>
{
  template <typename T>
  TMaybeValue operator()(const vector<T>& values) const {
    return TagValue(vector<T>(values.rbegin(), values.rend()));
  }

  TMaybeValue operator()(const string& s) const {
    return TagValue(reverseCharacters(s));
  }

  TMaybeValue operator()(const OtherValue&) const {
    return boost::none;
  }
};

struct ReverseComplementVisitor : public boost::static_visitor<TMaybeValue>
{
  TMaybeValue operator()(const string& s) const {
    return TagValue(seqio::reverseComplement(s));
  }

  TMaybeValue operator()(const vector<uint8_t>& codes) const {
    return TagValue(seqio::reverseComplement(codes));
  }

  // wider or signed arrays do not hold nucleotide codes
  template <typename T>
  TMaybeValue operator()(const vector<T>&) const {
    return boost::none;
  }

  TMaybeValue operator()(const OtherValue&) const {
    return boost::none;
  }
};

} // anonymous namespace

string reverseCharacters(const string& s) {
  string rev;
  rev.reserve(s.size());
  size_t end = s.size();
  while (end > 0) {
    size_t begin = end - 1;
    // step back over UTF-8 continuation bytes (10xxxxxx)
    while (begin > 0 && (static_cast<unsigned char>(s[begin]) & 0xC0) == 0x80) {
      --begin;
    }
    rev.append(s, begin, end - begin);
    end = begin;
  }
  return rev;
}

boost::optional<TagValue> reverseValue(const TagValue& value) {
  return boost::apply_visitor(ReverseVisitor(), value);
}

boost::optional<TagValue> reverseComplementValue(const TagValue& value) {
  return boost::apply_visitor(ReverseComplementVisitor(), value);
}

unsigned reorientTags(TagStore& tags, const TagList& rev, const TagList& revcomp) {
  unsigned n_replaced = 0;

  for (const TagName& tag : rev) {
    boost::optional<TagValue> value = tags.get(tag);
    if (!value) {
      continue;
    }
    boost::optional<TagValue> reversed = reverseValue(*value);
    if (reversed) {
      tags.replace(tag, *reversed);
      ++n_replaced;
    }
  }

  for (const TagName& tag : revcomp) {
    boost::optional<TagValue> value = tags.get(tag);
    if (!value) {
      continue;
    }
    boost::optional<TagValue> rc = reverseComplementValue(*value);
    if (rc) {
      tags.replace(tag, *rc);
      ++n_replaced;
    }
  }

  return n_replaced;
}

unsigned reorientTags(seqan::BamAlignmentRecord& record, const TagSelection& selection) {
  if (selection.empty()) {
    return 0;
  }
  TagStore tags(record.tags);
  return reorientTags(tags, selection.rev, selection.revcomp);
}

} // namespace tagio
