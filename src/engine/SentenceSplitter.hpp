// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

/// @brief Cuts streamed assistant text into sentences for pipelined synthesis.
///
/// A sentence ends at ". ", "! ", "? ", "… " or a newline. Text without a
/// boundary stays buffered until more arrives or finish() is called.
class SentenceSplitter
{
  public:
    /// @brief Appends text and returns the sentences it completed, trimmed and non-empty.
    [[nodiscard]] auto feed(std::string_view text) -> std::vector<std::string>;

    /// @brief Returns the buffered remainder as a last sentence, if it holds anything but whitespace.
    [[nodiscard]] auto finish() -> std::vector<std::string>;

    void reset() { _buffer.clear(); }

    [[nodiscard]] auto pending() const -> std::string_view { return _buffer; }

  private:
    std::string _buffer;
};

} // namespace voicetutor
