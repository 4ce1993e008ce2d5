#include "TagName.hpp"

using namespace std;

namespace tagio {

TagName::TagName(char c1, char c2) {
  m_key[0] = c1;
  m_key[1] = c2;
}

string TagName::str() const {
  return string(m_key, 2);
}

bool TagName::operator==(const TagName& other) const {
  return m_key[0] == other.m_key[0] && m_key[1] == other.m_key[1];
}

InvalidTagName::InvalidTagName(const string& name)
: invalid_argument("Tag name must be exactly 2 characters: " + name), m_name(name)
{}

TagList validateTagNames(const vector<string>& names) {
  TagList tags;
  tags.reserve(names.size());
  for (const string& name : names) {
    if (name.size() != 2) {
      throw InvalidTagName(name);
    }
    tags.push_back(TagName(name[0], name[1]));
  }
  return tags;
}

} // namespace tagio
