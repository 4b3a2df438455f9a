#ifndef WIRE_DOT_HPP
#define WIRE_DOT_HPP

// The protobuf-style framing used inside Olm and Megolm messages.

#include <cstdint>
#include <string>
#include <string_view>

namespace wire {

inline void put_varint(std::string& out, uint64_t value)
{
  while (value >= 0x80) {
    out += static_cast<char>((value & 0x7f) | 0x80);
    value >>= 7;
  }
  out += static_cast<char>(value);
}

// Field with wire type 0.
inline void put_uint(std::string& out, unsigned char tag, uint64_t value)
{
  out += static_cast<char>(tag);
  put_varint(out, value);
}

// Field with wire type 2.
inline void put_bytes(std::string& out, unsigned char tag, std::string_view b)
{
  out += static_cast<char>(tag);
  put_varint(out, b.size());
  out.append(b.data(), b.size());
}

} // namespace wire

#endif // WIRE_DOT_HPP
