#include "Utf8Decoder.hpp"

namespace ptymux {
namespace {
const int SEQUENCE_INVALID = -1;
const int SEQUENCE_INCOMPLETE = 0;

inline bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

/**
 * Classifies the sequence starting at `pos`: its length when it is complete
 * and valid, SEQUENCE_INCOMPLETE when the input ends inside a sequence that
 * could still become valid, SEQUENCE_INVALID otherwise. Overlong forms,
 * surrogates and code points above U+10FFFF are invalid.
 */
int classifySequence(const string& bytes, size_t pos) {
  const unsigned char lead = (unsigned char)bytes[pos];
  if (lead < 0x80) {
    return 1;
  }

  int length;
  unsigned char secondMin = 0x80;
  unsigned char secondMax = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      secondMin = 0xA0;
    } else if (lead == 0xED) {
      secondMax = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      secondMin = 0x90;
    } else if (lead == 0xF4) {
      secondMax = 0x8F;
    }
  } else {
    return SEQUENCE_INVALID;
  }

  const size_t available = bytes.size() - pos;
  for (int i = 1; i < length; i++) {
    if (size_t(i) >= available) {
      return SEQUENCE_INCOMPLETE;
    }
    const unsigned char c = (unsigned char)bytes[pos + i];
    if (i == 1) {
      if (c < secondMin || c > secondMax) {
        return SEQUENCE_INVALID;
      }
    } else if (!isContinuation(c)) {
      return SEQUENCE_INVALID;
    }
  }
  return length;
}
}  // namespace

void Utf8Decoder::feed(const char* data, size_t count, string* out) {
  if (count == 0) {
    return;
  }
  string bytes;
  bytes.reserve(tail.size() + count);
  bytes.append(tail);
  bytes.append(data, count);
  tail.clear();
  decodeBuffer(bytes, false, out);
}

void Utf8Decoder::finish(string* out) {
  if (tail.empty()) {
    return;
  }
  string bytes;
  bytes.swap(tail);
  decodeBuffer(bytes, true, out);
}

string Utf8Decoder::decode(const string& bytes) {
  Utf8Decoder decoder;
  string text;
  decoder.feed(bytes, &text);
  decoder.finish(&text);
  return text;
}

void Utf8Decoder::decodeBuffer(const string& bytes, bool endOfStream,
                               string* out) {
  size_t pos = 0;
  size_t runStart = 0;
  while (pos < bytes.size()) {
    int length = classifySequence(bytes, pos);
    if (length > 0) {
      pos += length;
      continue;
    }
    if (length == SEQUENCE_INCOMPLETE && !endOfStream) {
      break;
    }
    out->append(bytes, runStart, pos - runStart);
    out->append(UTF8_REPLACEMENT_CHARACTER);
    pos++;
    runStart = pos;
  }
  out->append(bytes, runStart, pos - runStart);
  if (pos < bytes.size()) {
    tail.assign(bytes, pos, string::npos);
    VLOG(4) << "Holding back " << tail.size() << " bytes of a partial sequence";
  }
}
}  // namespace ptymux
