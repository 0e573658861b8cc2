#include "Utf8Splitter.hpp"

namespace wb {
namespace {
inline bool inRange(unsigned char c, unsigned char lo, unsigned char hi) {
  return c >= lo && c <= hi;
}
}  // namespace

int Utf8Splitter::sequenceLength(const unsigned char *data, size_t available) {
  unsigned char lead = data[0];
  if (lead < 0x80) {
    return 1;
  }

  int length;
  // Bounds for the second byte, which are tighter than 80..BF for a few lead
  // bytes (overlongs, surrogates and code points above U+10FFFF).
  unsigned char secondLo = 0x80, secondHi = 0xBF;
  if (inRange(lead, 0xC2, 0xDF)) {
    length = 2;
  } else if (lead == 0xE0) {
    length = 3;
    secondLo = 0xA0;
  } else if (inRange(lead, 0xE1, 0xEC) || inRange(lead, 0xEE, 0xEF)) {
    length = 3;
  } else if (lead == 0xED) {
    length = 3;
    secondHi = 0x9F;
  } else if (lead == 0xF0) {
    length = 4;
    secondLo = 0x90;
  } else if (inRange(lead, 0xF1, 0xF3)) {
    length = 4;
  } else if (lead == 0xF4) {
    length = 4;
    secondHi = 0x8F;
  } else {
    return 0;
  }

  for (int a = 1; a < length; a++) {
    if (size_t(a) >= available) {
      return -1;
    }
    unsigned char lo = (a == 1) ? secondLo : 0x80;
    unsigned char hi = (a == 1) ? secondHi : 0xBF;
    if (!inRange(data[a], lo, hi)) {
      return 0;
    }
  }
  return length;
}

string Utf8Splitter::push(const char *data, size_t length) {
  string input;
  input.reserve(carry.size() + length);
  input.append(carry);
  input.append(data, length);
  carry.clear();

  const unsigned char *bytes =
      reinterpret_cast<const unsigned char *>(input.data());
  size_t total = input.size();
  string text;
  text.reserve(total);

  size_t runStart = 0;
  size_t i = 0;
  while (i < total) {
    if (bytes[i] < 0x80) {
      i++;
      continue;
    }
    int seqLen = sequenceLength(bytes + i, total - i);
    if (seqLen > 0) {
      i += seqLen;
      continue;
    }
    text.append(input, runStart, i - runStart);
    if (seqLen < 0) {
      // Incomplete character at the end of the chunk, wait for the rest
      carry = input.substr(i);
      return text;
    }
    droppedBytes++;
    i++;
    runStart = i;
  }
  text.append(input, runStart, total - runStart);
  return text;
}
}  // namespace wb
