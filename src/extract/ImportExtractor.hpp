//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/ImportExtractor.hpp
// Purpose: Entry points of the multi-language import extractor.
// Key invariants:
//   - Results preserve order of first appearance and contain no duplicates.
//   - Unknown languages, unreadable files and unparsable Python all yield an
//     empty list; extraction never reports an error to the caller.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "extract/Language.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::extract
{

/// @brief Extract import specifiers from in-memory @p content written in @p lang.
std::vector<std::string> extractImports(std::string_view content, Language lang);

/// @brief Read @p path and extract its import specifiers.
/// @details The language is chosen from the path's extension.
/// @param maxBytes Files larger than this are treated as unreadable; 0 disables.
std::vector<std::string> extractImportsFromFile(const std::string &path, std::uintmax_t maxBytes = 0);

} // namespace thymus::extract
