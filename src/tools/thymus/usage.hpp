//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Help and version text for the thymus command-line tool.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace thymus::tools
{

void printVersion();

void printUsage();

} // namespace thymus::tools
