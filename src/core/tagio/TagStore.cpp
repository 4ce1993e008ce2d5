#include "TagStore.hpp"

using namespace std;
using namespace seqan;

namespace tagio {

namespace {

CharString tagKey(const TagName& tag) {
  CharString key;
  appendValue(key, tag.data()[0]);
  appendValue(key, tag.data()[1]);
  return key;
}

} // anonymous namespace

TagMutationFailure::TagMutationFailure(const TagName& tag, const string& reason)
: runtime_error("Cannot update tag '" + tag.str() + "': " + reason), m_tag(tag)
{}

TagStore::TagStore(CharString& tags)
: m_tags(tags)
{}

boost::optional<TagValue> TagStore::get(const TagName& tag) const {
  BamTagsDict tags_dict(m_tags);
  unsigned idx = 0;
  if (!findTagKey(idx, tags_dict, tagKey(tag))) {
    return boost::none;
  }
  // value starts with the type character
  CharString raw = getTagValue(tags_dict, idx);
  return decodeTagValue(string(toCString(raw), length(raw)));
}

bool TagStore::contains(const TagName& tag) const {
  BamTagsDict tags_dict(m_tags);
  unsigned idx = 0;
  return findTagKey(idx, tags_dict, tagKey(tag));
}

void TagStore::remove(const TagName& tag) {
  BamTagsDict tags_dict(m_tags);
  if (!eraseTag(tags_dict, tagKey(tag))) {
    throw TagMutationFailure(tag, "tag is not present");
  }
}

void TagStore::insert(const TagName& tag, const TagValue& value) {
  if (contains(tag)) {
    throw TagMutationFailure(tag, "tag is already present");
  }
  append(tag, encode(tag, value));
}

void TagStore::replace(const TagName& tag, const TagValue& value) {
  // encode first, a value that cannot be stored leaves the old one in place
  string raw = encode(tag, value);
  remove(tag);
  append(tag, raw);
}

string TagStore::encode(const TagName& tag, const TagValue& value) const {
  try {
    return encodeTagValue(value);
  } catch (const TagFormatError& e) {
    throw TagMutationFailure(tag, "cannot encode " + typeDescriptor(value) + " value: " + e.what());
  }
}

void TagStore::append(const TagName& tag, const string& raw) {
  appendValue(m_tags, tag.data()[0]);
  appendValue(m_tags, tag.data()[1]);
  for (char c : raw) {
    appendValue(m_tags, c);
  }
}

} // namespace tagio
