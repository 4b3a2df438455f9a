#ifndef ROOMADDRESS_DOT_HPP
#define ROOMADDRESS_DOT_HPP

#include <ostream>
#include <string>
#include <string_view>

// A recipient as given on the command line: a sigil, a localpart and
// the server name, as in "!opaque:example.org" or "#name:example.org".

class RoomAddress {
public:
  enum class form {
    room_id, // !
    alias,   // #
    user_id, // @, which we parse but cannot send to
  };

  RoomAddress() = default;

  // Throws std::invalid_argument if address is none of the three forms.
  explicit RoomAddress(std::string_view address);

  static bool validate(std::string_view address);

  form               kind() const { return kind_; }
  std::string const& localpart() const { return localpart_; }
  std::string const& server() const { return server_; }

  bool sendable() const { return kind_ != form::user_id; }

  std::string as_string() const;

  void set_kind(form k) { kind_ = k; }
  void set_localpart(std::string_view l) { localpart_ = l; }
  void set_server(std::string_view s) { server_ = s; }

private:
  form        kind_{form::room_id};
  std::string localpart_;
  std::string server_;
};

char const* form_name(RoomAddress::form f);

inline std::ostream& operator<<(std::ostream& s, RoomAddress const& addr)
{
  return s << addr.as_string();
}

#endif // ROOMADDRESS_DOT_HPP
