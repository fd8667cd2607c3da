//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loader.hpp
// Purpose: Shared helper for loading project files into memory.
// Key invariants: A successful load holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>

namespace thymus::support
{

/// @brief Load a file into memory.
///
/// Opens @p path in binary mode and reads the entire file. Files larger than
/// @p maxBytes (when non-zero) are rejected before any data is read.
///
/// @param path Filesystem path to the file.
/// @param maxBytes Size cap in bytes; 0 disables the cap.
/// @return File contents on success; otherwise a diagnostic describing the failure.
Expected<std::string> loadSourceFile(const std::string &path, std::uintmax_t maxBytes = 0);

/// @brief Read at most @p limit leading bytes of @p path.
/// @return The bytes read; empty when the file cannot be opened.
std::string loadFilePrefix(const std::string &path, std::size_t limit);

} // namespace thymus::support
