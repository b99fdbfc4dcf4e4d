/**
 * @file document_decoder.cpp
 * @brief Plain text decoder
 */

#include "wenjiao/document_decoder.hpp"
#include "wenjiao/text_utils.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace wenjiao {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

DecodeOutcome failure(DecodeStatus status, std::string error) {
  DecodeOutcome out;
  out.status = status;
  out.error = std::move(error);
  return out;
}

} // namespace

DecodeOutcome PlainTextDecoder::decode(const std::filesystem::path &path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return failure(DecodeStatus::NotFound,
                   "File not found: " + path.string());
  }

  const std::string ext = to_lower_ascii(path.extension().string());
  if (ext == ".doc" || ext == ".docx") {
    return failure(DecodeStatus::UnsupportedFormat,
                   "Unsupported document format '" + ext +
                       "': convert to plain text first");
  }

  std::ifstream file{path, std::ios::binary};
  if (!file.is_open()) {
    return failure(DecodeStatus::ReadError,
                   "Cannot open file: " + path.string());
  }

  DecodeOutcome out;
  out.text.assign(std::istreambuf_iterator<char>(file),
                  std::istreambuf_iterator<char>());
  if (file.bad()) {
    return failure(DecodeStatus::ReadError,
                   "Read error in file: " + path.string());
  }

  if (std::string_view{out.text}.starts_with(kUtf8Bom)) {
    out.text.erase(0, kUtf8Bom.size());
  }

  if (!is_valid_utf8(out.text)) {
    return failure(DecodeStatus::InvalidEncoding,
                   "File is not valid UTF-8: " + path.string());
  }

  return out;
}

} // namespace wenjiao
