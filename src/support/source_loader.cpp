//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loader.cpp
// Purpose: Standardise how analysis passes load project files into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Links: src/support/source_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "support/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace thymus::support
{

Expected<std::string> loadSourceFile(const std::string &path, std::uintmax_t maxBytes)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Expected<std::string>(makeError({path, 0}, "unable to open " + path));

    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0)
        return Expected<std::string>(makeError({path, 0}, "unable to size " + path));
    if (maxBytes != 0 && static_cast<std::uintmax_t>(fileSize) > maxBytes)
    {
        return Expected<std::string>(makeError(
            {path, 0},
            "file too large: " + path + " (limit: " + std::to_string(maxBytes) + " bytes)"));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return Expected<std::string>(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return Expected<std::string>(makeError({path, 0}, "out of memory reading " + path));
    }
}

std::string loadFilePrefix(const std::string &path, std::size_t limit)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return {};
    std::string buffer(limit, '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(limit));
    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return buffer;
}

} // namespace thymus::support
