#include "TagValue.hpp"
#include "../stringio.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

using namespace std;

namespace tagio {

namespace {

/** BAM array subtype character for element type T. */
template <typename T> struct ArrayType;
template <> struct ArrayType<uint8_t>  { static const char code = 'C'; };
template <> struct ArrayType<uint16_t> { static const char code = 'S'; };
template <> struct ArrayType<uint32_t> { static const char code = 'I'; };
template <> struct ArrayType<int8_t>   { static const char code = 'c'; };
template <> struct ArrayType<int16_t>  { static const char code = 's'; };
template <> struct ArrayType<int32_t>  { static const char code = 'i'; };
template <> struct ArrayType<float>    { static const char code = 'f'; };

// 'B', subtype, int32 element count
const size_t ARRAY_HEADER_LEN = 6;

size_t elementSize(char subtype) {
  switch (subtype) {
    case 'c':
    case 'C':
      return 1;
    case 's':
    case 'S':
      return 2;
    case 'i':
    case 'I':
    case 'f':
      return 4;
    default:
      return 0;
  }
}

bool isBigEndianHost() {
  const uint16_t one = 1;
  return *reinterpret_cast<const unsigned char*>(&one) == 0;
}

// BAM stores all numbers little-endian
template <typename T>
T fromLittleEndian(const char* bytes) {
  char buf[sizeof(T)];
  memcpy(buf, bytes, sizeof(T));
  if (isBigEndianHost()) {
    reverse(buf, buf + sizeof(T));
  }
  T value;
  memcpy(&value, buf, sizeof(T));
  return value;
}

template <typename T>
void appendLittleEndian(string& out, T value) {
  char buf[sizeof(T)];
  memcpy(buf, &value, sizeof(T));
  if (isBigEndianHost()) {
    reverse(buf, buf + sizeof(T));
  }
  out.append(buf, sizeof(T));
}

template <typename T>
vector<T> readArray(const string& raw, size_t n_elem) {
  vector<T> values;
  values.reserve(n_elem);
  const char* p = raw.data() + ARRAY_HEADER_LEN;
  for (size_t i=0; i<n_elem; i++, p+=sizeof(T)) {
    values.push_back(fromLittleEndian<T>(p));
  }
  return values;
}

template <typename T>
void writeArray(string& out, const vector<T>& values) {
  if (values.size() > static_cast<size_t>(numeric_limits<int32_t>::max())) {
    throw TagFormatError(stringio::format("array with %lu elements exceeds BAM limit",
                                          static_cast<unsigned long>(values.size())));
  }
  out += 'B';
  out += ArrayType<T>::code;
  appendLittleEndian(out, static_cast<int32_t>(values.size()));
  for (T v : values) {
    appendLittleEndian(out, v);
  }
}

struct RawEncoder : public boost::static_visitor<string>
{
  template <typename T>
  string operator()(const vector<T>& values) const {
    string raw;
    writeArray(raw, values);
    return raw;
  }

  string operator()(const string& s) const {
    if (s.find('\0') != string::npos) {
      throw TagFormatError("string value contains a NUL byte");
    }
    string raw("Z");
    raw += s;
    raw += '\0';
    return raw;
  }

  string operator()(const OtherValue& value) const {
    return value.raw;
  }
};

struct TypeDescriptor : public boost::static_visitor<string>
{
  template <typename T>
  string operator()(const vector<T>&) const {
    return string("B:") + ArrayType<T>::code;
  }

  string operator()(const string&) const {
    return "Z";
  }

  string operator()(const OtherValue& value) const {
    return string(1, value.type());
  }
};

} // anonymous namespace

TagValue decodeTagValue(const string& raw) {
  if (raw.empty()) {
    throw TagFormatError("empty aux value");
  }

  if (raw[0] == 'Z') {
    string s = raw.substr(1);
    if (!s.empty() && s[s.size()-1] == '\0') {
      s.erase(s.size()-1);
    }
    return TagValue(s);
  }

  if (raw[0] != 'B') {
    return TagValue(OtherValue(raw));
  }

  if (raw.size() < ARRAY_HEADER_LEN) {
    throw TagFormatError("truncated array header");
  }
  char subtype = raw[1];
  size_t elem_size = elementSize(subtype);
  if (elem_size == 0) {
    throw TagFormatError(stringio::format("unknown array element type '%c'", subtype));
  }
  int32_t n_elem = fromLittleEndian<int32_t>(raw.data() + 2);
  if (n_elem < 0 || raw.size() < ARRAY_HEADER_LEN + static_cast<size_t>(n_elem)*elem_size) {
    throw TagFormatError(stringio::format("truncated array of %d elements", n_elem));
  }

  size_t n = static_cast<size_t>(n_elem);
  switch (subtype) {
    case 'C': return TagValue(readArray<uint8_t>(raw, n));
    case 'S': return TagValue(readArray<uint16_t>(raw, n));
    case 'I': return TagValue(readArray<uint32_t>(raw, n));
    case 'c': return TagValue(readArray<int8_t>(raw, n));
    case 's': return TagValue(readArray<int16_t>(raw, n));
    case 'i': return TagValue(readArray<int32_t>(raw, n));
    default:  return TagValue(readArray<float>(raw, n));
  }
}

string encodeTagValue(const TagValue& value) {
  return boost::apply_visitor(RawEncoder(), value);
}

string typeDescriptor(const TagValue& value) {
  return boost::apply_visitor(TypeDescriptor(), value);
}

} // namespace tagio
