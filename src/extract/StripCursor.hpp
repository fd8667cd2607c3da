//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/StripCursor.hpp
// Purpose: Cursor that copies source text while blanking comment regions.
//
// Key invariants:
//   - The output always has the same length as the source.
//   - Blanked characters become spaces except newlines, which are kept so
//     line numbers in the stripped text match the original.
//
// Ownership/Lifetime:
//   - Borrows the source view; owns the output buffer until take() moves it out.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "extract/ScanCursor.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace thymus::extract
{

class StripCursor : public ScanCursor<StripCursor>
{
  public:
    explicit StripCursor(std::string_view src) : src_(src), out_(src) {}

    [[nodiscard]] std::string_view source() const noexcept
    {
        return src_;
    }

    /// @brief Character at absolute index @p idx, or '\0' when out of range.
    [[nodiscard]] char at(std::size_t idx) const noexcept
    {
        return idx < src_.size() ? src_[idx] : '\0';
    }

    /// @brief Consume @p count characters, leaving them in the output.
    void keep(std::size_t count = 1)
    {
        for (std::size_t i = 0; i < count && !eof(); ++i)
            get();
    }

    /// @brief Consume @p count characters, replacing them with spaces.
    void blank(std::size_t count = 1)
    {
        for (std::size_t i = 0; i < count && !eof(); ++i)
        {
            if (peek() != '\n')
                out_[pos_] = ' ';
            get();
        }
    }

    /// @brief Advance to absolute position @p target, keeping the text.
    void keepTo(std::size_t target)
    {
        while (pos_ < target && !eof())
            get();
    }

    /// @brief Move the stripped output out of the cursor.
    std::string take()
    {
        return std::move(out_);
    }

  private:
    std::string_view src_;
    std::string out_;
};

} // namespace thymus::extract
