#include "test_support.hpp"

#include "wenjiao/dedup_context.hpp"
#include "wenjiao/text_utils.hpp"
#include "wenjiao/token_extractor.hpp"

#include <string>
#include <vector>

namespace {

using namespace wenjiao;

std::vector<std::string> texts(const std::vector<Token> &tokens) {
  std::vector<std::string> out;
  for (const auto &t : tokens) {
    out.push_back(t.text);
  }
  return out;
}

void test_latin_tokens() {
  auto tokens = extract_tokens("The (model), version 2024 of it works!");
  CHECK((texts(tokens) ==
         std::vector<std::string>{"The", "model", "version", "works"}));

  CHECK(tokens[1].start == 5);
  CHECK(tokens[1].end == 10);
  CHECK(tokens[1].byte_start == 5);

  // Apostrophes and hyphens survive inside tokens
  auto inner = extract_tokens("don't state-of-the-art");
  CHECK((texts(inner) == std::vector<std::string>{"don't", "state-of-the-art"}));
}

void test_mixed_line() {
  const std::string line = "本研究采用了machien learning方法";
  CHECK(classify(line) == Script::Latin);

  auto tokens = extract_tokens(line);
  CHECK((texts(tokens) == std::vector<std::string>{"machien", "learning"}));
  CHECK(tokens[0].start == 6);
  CHECK(tokens[0].end == 13);
  CHECK(tokens[1].start == 14);
  CHECK(tokens[1].end == 22);

  // Offsets address the same characters as the token text
  for (const auto &t : tokens) {
    CHECK(line.substr(t.byte_start, t.byte_end - t.byte_start) == t.text);
    CHECK(t.end <= char_count(line));
  }
}

void test_chinese_line() {
  const std::string line = "我们在这个实验中使用了GPU和AI技术进行大量的数据处理";
  CHECK(classify(line) == Script::Chinese);

  auto tokens = extract_tokens(line);
  CHECK(tokens.size() == 1);
  CHECK(tokens[0].text == "GPU");
  CHECK(tokens[0].start == 11);
  CHECK(tokens[0].end == 14);

  // Pure Chinese yields nothing
  CHECK(extract_tokens("这是一个没有英文的句子。").empty());
}

void test_short_and_numeric_tokens_dropped() {
  CHECK(extract_tokens("an ox is at 12 345").empty());
  CHECK(texts(extract_tokens("v2 abc1")) == std::vector<std::string>{"abc1"});
}

void test_dedup_context() {
  DedupContext dedup;

  dedup.mark("Machien");
  CHECK(dedup.seen_on_line("Machien"));
  CHECK(dedup.seen_on_line("machien"));
  CHECK(dedup.seen_on_line("MACHIEN"));
  CHECK(dedup.seen_in_document("machien"));

  dedup.begin_line();
  CHECK(!dedup.seen_on_line("machien"));
  CHECK(dedup.seen_in_document("Machien"));
  CHECK(dedup.line_size() == 0);
  CHECK(dedup.document_size() == 2);

  // Lowercase tokens occupy a single entry
  dedup.mark("teh");
  CHECK(dedup.document_size() == 3);
}

} // namespace

int main() {
  test_latin_tokens();
  test_mixed_line();
  test_chinese_line();
  test_short_and_numeric_tokens_dropped();
  test_dedup_context();
  return 0;
}
