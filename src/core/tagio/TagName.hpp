#ifndef TAGNAME_H
#define TAGNAME_H

#include <stdexcept>
#include <string>
#include <vector>

namespace tagio {

/**
 * Two-byte key of an auxiliary SAM/BAM field (e.g. "BC", "QT").
 * Instances are created by validateTagNames().
 */
class TagName
{
public:
  TagName(char c1, char c2);

  /** Tag key as a two-character string. */
  std::string str() const;
  const char* data() const { return m_key; }

  bool operator==(const TagName& other) const;

private:
  char m_key[2];
};

typedef std::vector<TagName> TagList;

/** Raised when a user-supplied tag name is not exactly two characters long. */
class InvalidTagName : public std::invalid_argument
{
public:
  explicit InvalidTagName(const std::string& name);
  /** The offending tag name. */
  const std::string& name() const { return m_name; }

private:
  std::string m_name;
};

/**
 * Converts user-supplied tag names into tag keys.
 *
 * Input order and duplicates are kept. Validation stops at the first name
 * that is not exactly two bytes long.
 *
 * \param names  Tag names as given on the command line or in the config file.
 * \returns      One TagName per input name.
 * \throws       InvalidTagName naming the first malformed entry.
 */
TagList validateTagNames(const std::vector<std::string>& names);

} // namespace tagio

#endif /* TAGNAME_H */
