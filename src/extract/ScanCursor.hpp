//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/ScanCursor.hpp
// Purpose: Common cursor management for the per-language source scanners.
//
// The comment strippers and the Python tokenizer share this CRTP cursor so
// position and line tracking behave identically across languages.
//
// Key Invariants:
//   - Position tracking maintains 1-based line numbers
//   - EOF is indicated by returning '\0' from peek operations
//   - Newlines increment line
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace thymus::extract
{

/// @brief CRTP base class for scanner cursor management.
/// @details Provides peek(), get(), eof(), and location tracking.
/// Derived class must provide source() returning std::string_view.
template <typename Derived>
class ScanCursor
{
  public:
    /// @brief Peek at the current character without consuming it.
    /// @return The current character, or '\0' if at end of source.
    [[nodiscard]] char peek() const
    {
        auto src = static_cast<const Derived *>(this)->source();
        return pos_ < src.size() ? src[pos_] : '\0';
    }

    /// @brief Peek at a character ahead of current position.
    /// @param offset Number of characters ahead to look.
    /// @return The character at offset, or '\0' if beyond end.
    [[nodiscard]] char peek(std::size_t offset) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx < src.size() ? src[idx] : '\0';
    }

    /// @brief Check whether at least @p count characters remain.
    [[nodiscard]] bool has(std::size_t count) const
    {
        return pos_ + count <= static_cast<const Derived *>(this)->source().size();
    }

    /// @brief Check whether @p text appears at the current position (plus @p offset).
    [[nodiscard]] bool lookingAt(std::string_view text, std::size_t offset = 0) const
    {
        auto src = static_cast<const Derived *>(this)->source();
        std::size_t idx = pos_ + offset;
        return idx <= src.size() && src.substr(idx, text.size()) == text;
    }

    /// @brief Consume and return the current character.
    /// @return The consumed character, or '\0' if at end of source.
    char get()
    {
        auto src = static_cast<const Derived *>(this)->source();
        if (pos_ >= src.size())
            return '\0';
        char c = src[pos_++];
        if (c == '\n')
            line_++;
        return c;
    }

    /// @brief Check whether the cursor has reached the end of the source.
    [[nodiscard]] bool eof() const
    {
        return pos_ >= static_cast<const Derived *>(this)->source().size();
    }

    /// @brief Get the current position in the source.
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// @brief Get the current line number (1-based).
    [[nodiscard]] uint32_t line() const noexcept { return line_; }

  protected:
    std::size_t pos_{0}; ///< Current position in source.
    uint32_t line_{1};   ///< 1-based line number.
};

/// @brief Skip horizontal whitespace (space, tab, CR), leaving newlines in place.
template <typename Cursor>
inline void skipHorizontalWhitespace(Cursor &cur)
{
    while (!cur.eof())
    {
        char c = cur.peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f')
            cur.get();
        else
            break;
    }
}

/// @brief Skip until newline or EOF (the newline itself is not consumed).
template <typename Cursor>
inline void skipToEndOfLine(Cursor &cur)
{
    while (!cur.eof() && cur.peek() != '\n')
        cur.get();
}

} // namespace thymus::extract
