//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/entfs/Format.hpp
// Purpose: Stable public entry point for the ENTFS on-disk records.
// Key invariants: Re-exports only the record types and the image reader/builder.
// Ownership/Lifetime: Types mirror definitions in entfs::fs and retain their semantics.
// Links: src/fs/Layout.hpp
#pragma once

#include "entfs/version.h"
#include "fs/Extent.hpp"
#include "fs/Image.hpp"
#include "fs/ImageReader.hpp"
#include "fs/Inode.hpp"
#include "fs/Layout.hpp"
#include "fs/MkfsError.hpp"
#include "fs/Node.hpp"
#include "fs/Superblock.hpp"

/// @file include/entfs/Format.hpp
/// @brief Public aggregation header exposing the ENTFS record types to tools
///        such as mkfs.entfs and entfs-inspect.
