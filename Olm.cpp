#include "Olm.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <glog/logging.h>

#include "Base64.hpp"
#include "Matrix-json.hpp"
#include "wire.hpp"

namespace {
auto constexpr protocol_version = '\x03';
auto constexpr mac_length       = 8;

auto constexpr root_info = "OLM_ROOT";
auto constexpr keys_info = "OLM_KEYS";

unsigned char constexpr message_key_seed = 0x01;

// One-time key ids are base64 of a big endian counter, as other
// clients make them.
std::string key_id_for(uint32_t n)
{
  std::string be;
  for (auto shift : {24, 16, 8, 0})
    be += static_cast<char>((n >> shift) & 0xff);
  return Base64::enc(be);
}

std::optional<std::string> dec_key(Json::Value const& v, size_t size)
{
  if (!v.isString())
    return {};
  try {
    auto k = Base64::dec(v.asString());
    if (k.size() == size)
      return k;
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "bad key encoding: " << e.what();
  }
  return {};
}
} // namespace

namespace Olm {

Account::Account() = default;

Account::Account(Crypto::Curve25519 identity, Crypto::Ed25519 fingerprint)
  : identity_(std::move(identity))
  , fingerprint_(std::move(fingerprint))
{
}

std::optional<Account> Account::from_json(Json::Value const& v)
{
  if (!v.isObject())
    return {};

  auto const curve = dec_key(v["curve25519"], Crypto::key_size);
  auto const ed    = dec_key(v["ed25519"], Crypto::key_size);
  if (!curve || !ed)
    return {};

  Account acct{Crypto::Curve25519(*curve), Crypto::Ed25519(*ed)};

  auto const& otks = v["one_time_keys"];
  if (!otks.isNull() && !otks.isObject())
    return {};
  for (auto const& id : otks.getMemberNames()) {
    auto const k = dec_key(otks[id], Crypto::key_size);
    if (!k)
      return {};
    acct.one_time_keys_.emplace(id, Crypto::Curve25519(*k));
  }

  auto const& next = v["next_key_id"];
  if (!next.isNull()) {
    if (!next.isUInt())
      return {};
    acct.next_key_id_ = next.asUInt();
  }

  return acct;
}

Json::Value Account::to_json() const
{
  Json::Value v{Json::objectValue};
  v["curve25519"] = Base64::enc(identity_.private_key());
  v["ed25519"]    = Base64::enc(fingerprint_.seed());

  Json::Value otks{Json::objectValue};
  for (auto const& [id, key] : one_time_keys_) {
    otks[id] = Base64::enc(key.private_key());
  }
  v["one_time_keys"] = otks;
  v["next_key_id"]   = next_key_id_;
  return v;
}

std::string Account::curve25519_key() const
{
  return Base64::enc(identity_.public_key());
}

std::string Account::ed25519_key() const
{
  return Base64::enc(fingerprint_.public_key());
}

std::string Account::sign(std::string_view message) const
{
  return Base64::enc(fingerprint_.sign(message));
}

void Account::sign_json(Json::Value&       obj,
                        std::string const& user_id,
                        std::string const& device_id) const
{
  auto unsigned_part = obj["unsigned"];
  obj.removeMember("unsigned");
  auto signatures = obj["signatures"];
  obj.removeMember("signatures");

  auto const sig = sign(Matrix::canonical_json(obj));

  signatures[user_id][fmt::format("ed25519:{}", device_id)] = sig;
  obj["signatures"] = signatures;
  if (!unsigned_part.isNull())
    obj["unsigned"] = unsigned_part;
}

Json::Value Account::device_keys(std::string const& user_id,
                                 std::string const& device_id) const
{
  Json::Value dk{Json::objectValue};
  dk["user_id"]   = user_id;
  dk["device_id"] = device_id;

  Json::Value algorithms{Json::arrayValue};
  algorithms.append(algorithm);
  algorithms.append("m.megolm.v1.aes-sha2");
  dk["algorithms"] = algorithms;

  dk["keys"][fmt::format("curve25519:{}", device_id)] = curve25519_key();
  dk["keys"][fmt::format("ed25519:{}", device_id)]    = ed25519_key();

  sign_json(dk, user_id, device_id);
  return dk;
}

Json::Value Account::generate_one_time_keys(size_t             count,
                                            std::string const& user_id,
                                            std::string const& device_id)
{
  Json::Value keys{Json::objectValue};
  for (size_t i = 0; i < count; ++i) {
    auto const id = key_id_for(next_key_id_++);
    Crypto::Curve25519 otk;

    Json::Value signed_key{Json::objectValue};
    signed_key["key"] = Base64::enc(otk.public_key());
    sign_json(signed_key, user_id, device_id);

    keys[fmt::format("signed_curve25519:{}", id)] = signed_key;
    one_time_keys_.emplace(id, std::move(otk));
  }
  return keys;
}

bool verify_signed_json(Json::Value const& obj,
                        std::string const& user_id,
                        std::string const& key_id,
                        std::string const& ed25519_key)
{
  if (!obj.isObject())
    return false;

  auto const& sigs = obj["signatures"];
  if (!sigs.isObject() || !sigs[user_id].isObject())
    return false;

  auto const& sig = sigs[user_id][key_id];
  if (!sig.isString())
    return false;

  auto stripped = obj;
  stripped.removeMember("signatures");
  stripped.removeMember("unsigned");

  try {
    return Crypto::Ed25519::verify(Base64::dec(ed25519_key),
                                   Matrix::canonical_json(stripped),
                                   Base64::dec(sig.asString()));
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "signature by " << user_id << " " << key_id << ": "
                 << e.what();
    return false;
  }
}

Message encrypt(Account const&   ours,
                std::string_view their_identity_key,
                std::string_view their_one_time_key,
                std::string_view plaintext)
{
  Crypto::Curve25519 const base_key;
  Crypto::Curve25519 const ratchet_key;

  // Triple Diffie-Hellman
  auto const secret = ours.identity().agree(their_one_time_key)
                      + base_key.agree(their_identity_key)
                      + base_key.agree(their_one_time_key);

  auto const root_chain = Crypto::hkdf_sha256(secret, "", root_info, 64);
  auto const chain_key  = root_chain.substr(32, 32);

  auto const message_key = Crypto::hmac_sha256(
      chain_key, std::string(1, static_cast<char>(message_key_seed)));

  auto const keys    = Crypto::hkdf_sha256(message_key, "", keys_info, 80);
  auto const aes_key = keys.substr(0, 32);
  auto const mac_key = keys.substr(32, 32);
  auto const iv      = keys.substr(64, 16);

  auto const ciphertext = Crypto::aes256_cbc_encrypt(aes_key, iv, plaintext);

  std::string msg(1, protocol_version);
  wire::put_bytes(msg, 0x0A, ratchet_key.public_key());
  wire::put_uint(msg, 0x10, 0); // chain index
  wire::put_bytes(msg, 0x22, ciphertext);
  msg += Crypto::hmac_sha256(mac_key, msg).substr(0, mac_length);

  std::string pre_key(1, protocol_version);
  wire::put_bytes(pre_key, 0x0A, their_one_time_key);
  wire::put_bytes(pre_key, 0x12, base_key.public_key());
  wire::put_bytes(pre_key, 0x1A, ours.identity().public_key());
  wire::put_bytes(pre_key, 0x22, msg);

  return Message{0, Base64::enc(pre_key)};
}

} // namespace Olm
