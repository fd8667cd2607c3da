//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/path_utils.cpp
// Purpose: Implement lexical path helpers shared by discovery, rules and graph.
// Key invariants: Normalization always yields forward slashes and resolves dot
// segments.
//
//===----------------------------------------------------------------------===//

#include "support/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace thymus::support
{

std::string toForwardSlashes(std::string_view path)
{
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::string normalizePath(std::string_view path)
{
    std::string sanitized = toForwardSlashes(path);
    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    while (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    return generic;
}

std::string fileName(std::string_view path)
{
    if (path.empty())
        return {};
    size_t pos = path.find_last_of('/');
    if (pos == std::string_view::npos)
        return std::string(path);
    if (pos + 1 >= path.size())
        return {};
    return std::string(path.substr(pos + 1));
}

std::string dirname(std::string_view path)
{
    size_t pos = path.find_last_of('/');
    if (pos == std::string_view::npos)
        return {};
    return std::string(path.substr(0, pos));
}

std::string stem(std::string_view path)
{
    std::string name = fileName(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return name;
    return name.substr(0, dot);
}

std::string extension(std::string_view path)
{
    std::string name = fileName(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    return name.substr(dot);
}

std::string joinPath(std::string_view base, std::string_view leaf)
{
    if (base.empty())
        return std::string(leaf);
    if (leaf.empty())
        return std::string(base);
    std::string out(base);
    if (out.back() != '/')
        out.push_back('/');
    out.append(leaf.front() == '/' ? leaf.substr(1) : leaf);
    return out;
}

std::string relativeTo(std::string_view path, std::string_view root)
{
    std::error_code ec;
    std::filesystem::path absPath = std::filesystem::absolute(std::filesystem::path(path), ec);
    if (ec)
        return {};
    std::filesystem::path absRoot = std::filesystem::absolute(std::filesystem::path(root), ec);
    if (ec)
        return {};

    std::filesystem::path rel = absPath.lexically_normal().lexically_relative(absRoot.lexically_normal());
    std::string out = rel.generic_string();
    if (out.empty() || out == "." || out.rfind("..", 0) == 0)
        return {};
    return out;
}

std::string resolveRelativeImport(std::string_view sourceFile, std::string_view importSpec)
{
    if (importSpec.empty() || importSpec.front() != '.')
        return std::string(importSpec);
    return normalizePath(joinPath(dirname(toForwardSlashes(sourceFile)), importSpec));
}

} // namespace thymus::support
