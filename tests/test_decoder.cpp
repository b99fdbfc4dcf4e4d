#include "test_support.hpp"

#include "wenjiao/document_decoder.hpp"
#include "wenjiao/engine.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace {

using namespace wenjiao;
using wenjiao::test::make_dictionary;
namespace fs = std::filesystem;

fs::path write_temp(const std::string &name, const std::string &content) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

/// Serves a fixed text for any path
class FixedDecoder final : public DocumentDecoder {
public:
  explicit FixedDecoder(std::string text) : text_{std::move(text)} {}

  [[nodiscard]] DecodeOutcome
  decode(const std::filesystem::path &) const override {
    DecodeOutcome out;
    out.text = text_;
    return out;
  }

private:
  std::string text_;
};

void test_plain_text() {
  const fs::path path = write_temp("wenjiao_plain.txt", "第一行\nsecond line\n");

  PlainTextDecoder decoder;
  auto out = decoder.decode(path);
  CHECK(out.status == DecodeStatus::Ok);
  CHECK(out.error.empty());
  CHECK(out.text == "第一行\nsecond line\n");

  fs::remove(path);
}

void test_bom_stripped() {
  const fs::path path = write_temp("wenjiao_bom.md", "\xEF\xBB\xBF# 标题\n");

  auto out = PlainTextDecoder{}.decode(path);
  CHECK(out.status == DecodeStatus::Ok);
  CHECK(out.text == "# 标题\n");

  fs::remove(path);
}

void test_failures() {
  PlainTextDecoder decoder;

  auto missing = decoder.decode("/nonexistent/wenjiao/input.txt");
  CHECK(missing.status == DecodeStatus::NotFound);
  CHECK(missing.error.find("/nonexistent/wenjiao/input.txt") !=
        std::string::npos);
  CHECK(missing.text.empty());

  const fs::path docx = write_temp("wenjiao_report.DOCX", "PK\x03\x04");
  auto unsupported = decoder.decode(docx);
  CHECK(unsupported.status == DecodeStatus::UnsupportedFormat);
  CHECK(!unsupported.error.empty());
  fs::remove(docx);

  const fs::path binary = write_temp("wenjiao_binary.txt", "abc\xFF\xFE");
  auto invalid = decoder.decode(binary);
  CHECK(invalid.status == DecodeStatus::InvalidEncoding);
  CHECK(invalid.text.empty());
  fs::remove(binary);

  // Directories are not documents
  auto dir = decoder.decode(fs::temp_directory_path());
  CHECK(dir.status == DecodeStatus::NotFound);
}

void test_engine_file_analysis() {
  const fs::path path =
      write_temp("wenjiao_engine.txt", "the machien works\n我我认为\n");

  Engine engine(Config{}, make_dictionary(), nullptr);
  auto out = engine.analyze_large_file(path);
  CHECK(out.status == DecodeStatus::Ok);
  CHECK(out.error.empty());

  auto expected = engine.analyze_text("the machien works\n我我认为\n");
  CHECK(out.result.issues == expected.issues);
  CHECK(out.result.stats == expected.stats);
  CHECK(out.result.issues.size() == 2);

  fs::remove(path);
}

void test_engine_decode_error_propagates() {
  Engine engine(Config{}, make_dictionary(), nullptr);

  auto out = engine.analyze_large_file("/nonexistent/wenjiao/input.txt");
  CHECK(out.status == DecodeStatus::NotFound);
  CHECK(!out.error.empty());
  CHECK(out.result.issues.empty());
  CHECK(out.result.stats.empty());
}

void test_engine_custom_decoder() {
  Engine engine(Config{}, make_dictionary(), nullptr);
  engine.set_decoder(std::make_unique<FixedDecoder>("teh model"));

  auto out = engine.analyze_large_file("any.docx");
  CHECK(out.status == DecodeStatus::Ok);
  CHECK(out.result.issues.size() == 1);
  CHECK(out.result.stats.at("total_words") == 2);

  // A null decoder keeps the current one
  engine.set_decoder(nullptr);
  CHECK(engine.analyze_large_file("other.doc").result.issues.size() == 1);
}

} // namespace

int main() {
  test_plain_text();
  test_bom_stripped();
  test_failures();
  test_engine_file_analysis();
  test_engine_decode_error_propagates();
  test_engine_custom_decoder();
  return 0;
}
