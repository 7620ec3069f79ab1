//===----------------------------------------------------------------------===//
//
// Part of the ENTFS project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
/**
 * @file version.h
 * @brief Centralized version information for the ENTFS image tools.
 *
 * Include this header wherever version information is needed.
 * Update version numbers HERE ONLY when releasing new versions.
 */
#pragma once

#define ENTFS_VERSION_MAJOR 0
#define ENTFS_VERSION_MINOR 1
#define ENTFS_VERSION_PATCH 0

#define ENTFS_VERSION_STRING "0.1.0"
#define ENTFS_VERSION_FULL "ENTFS 0.1.0"

// On-disk format revision written to Superblock::version
#define ENTFS_FORMAT_VERSION 1
