#include "TestHeaders.hpp"
#include "Utf8Splitter.hpp"

using namespace wb;

namespace {
string pushAll(Utf8Splitter *splitter, const string &bytes) {
  return splitter->push(bytes.data(), bytes.length());
}
}  // namespace

TEST_CASE("ASCII passes straight through", "[Utf8Splitter]") {
  Utf8Splitter splitter;
  REQUIRE(pushAll(&splitter, "hello\r\n") == "hello\r\n");
  REQUIRE(splitter.pending().empty());
}

TEST_CASE("A character split across reads is emitted once, whole",
          "[Utf8Splitter]") {
  // U+00E9, U+20AC and U+1F600
  const string text = "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80!";
  for (size_t cut = 0; cut <= text.length(); cut++) {
    Utf8Splitter splitter;
    string first = pushAll(&splitter, text.substr(0, cut));
    string second = pushAll(&splitter, text.substr(cut));
    INFO("cut at " << cut);
    REQUIRE(first + second == text);
    REQUIRE(splitter.pending().empty());
    REQUIRE(splitter.getDroppedBytes() == 0);
  }
}

TEST_CASE("Byte at a time reassembles a four byte character",
          "[Utf8Splitter]") {
  Utf8Splitter splitter;
  const string emoji = "\xF0\x9F\x98\x80";
  REQUIRE(pushAll(&splitter, emoji.substr(0, 1)).empty());
  REQUIRE(pushAll(&splitter, emoji.substr(1, 1)).empty());
  REQUIRE(pushAll(&splitter, emoji.substr(2, 1)).empty());
  REQUIRE(splitter.pending().length() == 3);
  REQUIRE(pushAll(&splitter, emoji.substr(3, 1)) == emoji);
}

TEST_CASE("Invalid bytes are dropped", "[Utf8Splitter]") {
  Utf8Splitter splitter;
  // Stray continuation byte, overlong encoding and a surrogate
  REQUIRE(pushAll(&splitter, "a\x80" "b\xC0\xAF" "c\xED\xA0\x80" "d") ==
          "abcd");
  REQUIRE(splitter.getDroppedBytes() == 6);
}

TEST_CASE("A broken sequence does not swallow the next character",
          "[Utf8Splitter]") {
  Utf8Splitter splitter;
  REQUIRE(pushAll(&splitter, "\xE2\x82").empty());
  // The pending lead bytes cannot be continued by 'x'
  REQUIRE(pushAll(&splitter, "x") == "x");
  REQUIRE(splitter.getDroppedBytes() == 2);
}

TEST_CASE("Sequence length classification", "[Utf8Splitter]") {
  const unsigned char ascii[] = {'A'};
  const unsigned char twoByte[] = {0xC3, 0xA9};
  const unsigned char partial[] = {0xE2, 0x82};
  const unsigned char beyondUnicode[] = {0xF4, 0x90, 0x80, 0x80};
  REQUIRE(Utf8Splitter::sequenceLength(ascii, 1) == 1);
  REQUIRE(Utf8Splitter::sequenceLength(twoByte, 2) == 2);
  REQUIRE(Utf8Splitter::sequenceLength(partial, 2) == -1);
  REQUIRE(Utf8Splitter::sequenceLength(beyondUnicode, 4) == 0);
}
