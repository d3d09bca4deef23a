/**
 * @file record_codec.cpp
 * @brief Length-prefixed field encoding
 */

#include "tessera/core/record_codec.h"

namespace tessera::core {

namespace {

constexpr UInt64 MAX_FIELD_LENGTH = 16u * 1024u * 1024u;

} // anonymous namespace

void write_field(std::ostream& out, const std::string& value) {
    out << value.size() << ':' << value << ' ';
}

bool read_field(std::istream& in, std::string& value) {
    UInt64 length = 0;
    if (!(in >> length)) {
        return false;
    }
    if (length > MAX_FIELD_LENGTH || in.get() != ':') {
        return false;
    }

    value.assign(static_cast<SizeT>(length), '\0');
    if (length > 0 && !in.read(value.data(), static_cast<std::streamsize>(length))) {
        return false;
    }
    return true;
}

void write_number(std::ostream& out, UInt64 value) {
    out << value << ' ';
}

bool read_number(std::istream& in, UInt64& value) {
    return static_cast<bool>(in >> value);
}

} // namespace tessera::core
