/**
 * @file document_decoder.hpp
 * @brief Turns a file on disk into analyzable UTF-8 text
 */

#pragma once

#include <filesystem>
#include <string>

#include "wenjiao/types.hpp"

namespace wenjiao {

/// Decoded document or the reason it could not be decoded
struct DecodeOutcome {
  std::string text;
  DecodeStatus status = DecodeStatus::Ok;
  std::string error;
};

/**
 * @brief Document format collaborator
 *
 * The engine only analyzes text; richer formats plug in here.
 */
class DocumentDecoder {
public:
  virtual ~DocumentDecoder() = default;

  [[nodiscard]] virtual DecodeOutcome
  decode(const std::filesystem::path &path) const = 0;
};

/**
 * @brief Plain UTF-8 text files (.txt, .md, no extension, ...)
 *
 * Strips a leading BOM. Word processor formats (.doc, .docx) and invalid
 * UTF-8 are rejected.
 */
class PlainTextDecoder final : public DocumentDecoder {
public:
  [[nodiscard]] DecodeOutcome
  decode(const std::filesystem::path &path) const override;
};

} // namespace wenjiao
