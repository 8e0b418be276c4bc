/**
 * @file ustar-view.hxx
 * @brief Zero-copy reader for POSIX/USTAR tar archives held in memory.
 */

#pragma once

#include <ustar-view/archive-entry.hxx>
#include <ustar-view/archive.hxx>
#include <ustar-view/constants.hxx>
#include <ustar-view/entry-iterator.hxx>
#include <ustar-view/error.hxx>
#include <ustar-view/header.hxx>
