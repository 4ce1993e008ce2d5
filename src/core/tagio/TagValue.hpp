#ifndef TAGVALUE_H
#define TAGVALUE_H

#include <boost/variant.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tagio {

/**
 * Any aux value the tag transformations do not operate on
 * (single characters, scalar numbers, hex strings).
 * Keeps the raw BAM bytes, starting with the type character.
 */
struct OtherValue
{
  std::string raw;

  explicit OtherValue(const std::string& bytes) : raw(bytes) {}
  char type() const { return raw.empty() ? '\0' : raw[0]; }
  bool operator==(const OtherValue& other) const { return raw == other.raw; }
};

/**
 * Decoded value of a BAM auxiliary field.
 *
 * One arm per array element type ('B' values), one for strings ('Z')
 * and a fallback arm for all other encodings.
 */
typedef boost::variant<
  std::vector<uint8_t>,  // B:C
  std::vector<uint16_t>, // B:S
  std::vector<uint32_t>, // B:I
  std::vector<int8_t>,   // B:c
  std::vector<int16_t>,  // B:s
  std::vector<int32_t>,  // B:i
  std::vector<float>,    // B:f
  std::string,           // Z
  OtherValue
> TagValue;

/** Raw aux data could not be decoded or a value could not be encoded. */
class TagFormatError : public std::runtime_error
{
public:
  explicit TagFormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Decodes a raw BAM aux value.
 *
 * \param raw  Type character followed by the value bytes (little-endian).
 *             A trailing NUL of 'Z' values is optional.
 * \throws     TagFormatError on truncated or unknown array data.
 */
TagValue decodeTagValue(const std::string& raw);

/**
 * Encodes a value into raw BAM aux bytes (type character first,
 * 'Z' values NUL-terminated).
 *
 * \throws TagFormatError if the value cannot be represented
 *         (string with embedded NUL, array longer than INT32_MAX).
 */
std::string encodeTagValue(const TagValue& value);

/** SAM type descriptor of a value, e.g. "Z", "B:C", "i". */
std::string typeDescriptor(const TagValue& value);

} // namespace tagio

#endif /* TAGVALUE_H */
