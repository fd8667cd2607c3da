//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/SwiftExtractor.cpp
// Purpose: Swift import extraction.
//
// Handles `import Foo`, `@testable import Foo` and kind-qualified imports such
// as `import struct Foundation.Date`; the top-level module name is reported.
// String interpolation `\(...)` stays inside the string via the escape rule.
//
//===----------------------------------------------------------------------===//

#include "extract/CStyleStripper.hpp"
#include "extract/LanguageExtractors.hpp"

namespace thymus::extract
{

std::string stripSwiftComments(std::string_view source)
{
    CStyleSyntax syntax;
    syntax.nestedBlockComments = true;
    syntax.tripleDoubleQuotes = true;
    syntax.singleQuoteLiterals = false;
    return stripCStyleComments(source, syntax);
}

ImportVector extractSwiftImports(std::string_view source)
{
    static const std::regex kImport(
        R"((?:@testable\s+)?import\s+(?:(?:struct|class|enum|protocol|typealias|func|var|let)\s+)?(\w+))");

    return detail::collectLineStartImports(stripSwiftComments(source), kImport);
}

} // namespace thymus::extract
