//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/thymus/version.hpp
// Purpose: Project version constants shared by the library and the CLI.
//
//===----------------------------------------------------------------------===//
#pragma once

#define THYMUS_VERSION_MAJOR 0
#define THYMUS_VERSION_MINOR 9
#define THYMUS_VERSION_PATCH 0
#define THYMUS_VERSION_STR "0.9.0"
