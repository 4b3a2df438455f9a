#ifndef PILL_DOT_HPP
#define PILL_DOT_HPP

#include <array>
#include <ostream>
#include <string>
#include <string_view>

// 128 random bits in z-base-32: transaction ids, which must never
// repeat for an access token, and temporary file names.

class Pill {
public:
  auto static constexpr octets = 16;
  auto static constexpr digits = (octets * 8 + 4) / 5;

  Pill();

  // For known values; bytes must be exactly octets long.
  explicit Pill(std::string_view bytes);

  bool operator==(Pill const& that) const { return text_ == that.text_; }
  bool operator!=(Pill const& that) const { return !(*this == that); }

  std::string const& as_string() const { return text_; }

private:
  void encode_();

  std::array<unsigned char, octets> bytes_;
  std::string                       text_;

  friend std::ostream& operator<<(std::ostream& s, Pill const& p)
  {
    return s << p.text_;
  }
};

#endif // PILL_DOT_HPP
