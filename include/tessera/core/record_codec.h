#pragma once
/**
 * @file record_codec.h
 * @brief Length-prefixed text fields for append-only record files
 *
 * A field is written as "<length>:<bytes>" so keys may contain spaces or
 * newlines. Records are whitespace separated; a torn final record fails to
 * parse and is reported by the reader.
 */

#include "tessera/core/types.h"
#include <istream>
#include <ostream>
#include <string>

namespace tessera::core {

/**
 * @brief Write one length-prefixed field followed by a space
 */
void write_field(std::ostream& out, const std::string& value);

/**
 * @brief Read one length-prefixed field
 * @return false on end of stream or malformed input
 */
bool read_field(std::istream& in, std::string& value);

/**
 * @brief Write an unsigned number followed by a space
 */
void write_number(std::ostream& out, UInt64 value);

/**
 * @brief Read an unsigned number
 * @return false on end of stream or malformed input
 */
bool read_number(std::istream& in, UInt64& value);

} // namespace tessera::core
