//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/path_utils.hpp
// Purpose: Declare helpers for normalizing and splitting project file paths.
// Key invariants: Normalized paths always use forward slashes and have dot
// segments resolved; no helper touches the file system.
// Ownership/Lifetime: All helpers return owned strings.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string>
#include <string_view>

namespace thymus::support
{

/// @brief Normalize @p path lexically.
/// @param path Arbitrary path, possibly using backslashes.
/// @return Path with dot segments collapsed, forward slashes and no trailing
///         slash; "." for an empty input.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief Replace every backslash in @p path with a forward slash.
[[nodiscard]] std::string toForwardSlashes(std::string_view path);

/// @brief Compute the final component of @p path.
/// @param path Path expressed with forward slashes.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string fileName(std::string_view path);

/// @brief Directory part of @p path ("" when there is no slash).
[[nodiscard]] std::string dirname(std::string_view path);

/// @brief Basename with the final extension removed.
/// @details A leading dot is part of the stem, so ".env" has stem ".env".
[[nodiscard]] std::string stem(std::string_view path);

/// @brief Final extension of @p path including the dot, or "" when absent.
[[nodiscard]] std::string extension(std::string_view path);

/// @brief Join two path fragments with a single slash.
[[nodiscard]] std::string joinPath(std::string_view base, std::string_view leaf);

/// @brief Express @p path relative to @p root using forward slashes.
/// @return Relative path, or an empty string when @p path is not inside @p root.
[[nodiscard]] std::string relativeTo(std::string_view path, std::string_view root);

/// @brief Resolve a `./` or `../` import of @p sourceFile against its directory.
/// @return Normalized path; specifiers not starting with '.' are returned unchanged.
[[nodiscard]] std::string resolveRelativeImport(std::string_view sourceFile, std::string_view importSpec);

} // namespace thymus::support
