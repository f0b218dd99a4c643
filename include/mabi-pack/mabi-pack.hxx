/**
 * @file mabi-pack.hxx
 * @brief Convenience header for the whole public API.
 */

#pragma once

#include <mabi-pack/archive-reader.hxx>
#include <mabi-pack/archive-writer.hxx>
#include <mabi-pack/byte-cursor.hxx>
#include <mabi-pack/directory-table.hxx>
#include <mabi-pack/entry-filter.hxx>
#include <mabi-pack/entry-stream.hxx>
#include <mabi-pack/entry.hxx>
#include <mabi-pack/error.hxx>
#include <mabi-pack/keystream-filter.hxx>
#include <mabi-pack/keystream.hxx>
#include <mabi-pack/version-strategy.hxx>
