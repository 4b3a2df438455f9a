#include "Crypto.hpp"

#include <stdexcept>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <glog/logging.h>

namespace {
// OpenSSL wants a non-null pointer even for zero length input.
unsigned char const* uc(std::string_view s)
{
  static unsigned char const empty[1]{};
  return s.empty() ? empty : reinterpret_cast<unsigned char const*>(s.data());
}

std::string raw_public(EVP_PKEY* pkey)
{
  unsigned char pub[Crypto::key_size];
  size_t        len = sizeof(pub);
  CHECK_EQ(EVP_PKEY_get_raw_public_key(pkey, pub, &len), 1);
  CHECK_EQ(len, sizeof(pub));
  return std::string(reinterpret_cast<char*>(pub), len);
}

EVP_PKEY* new_private_key(int type, std::string_view priv)
{
  if (priv.size() != Crypto::key_size)
    throw std::invalid_argument("private key must be 32 octets");
  auto const pkey = EVP_PKEY_new_raw_private_key(type, nullptr, uc(priv),
                                                 priv.size());
  CHECK_NOTNULL(pkey);
  return pkey;
}

EVP_PKEY* new_public_key(int type, std::string_view pub)
{
  if (pub.size() != Crypto::key_size)
    throw std::invalid_argument("public key must be 32 octets");
  auto const pkey = EVP_PKEY_new_raw_public_key(type, nullptr, uc(pub),
                                                pub.size());
  if (pkey == nullptr) {
    ERR_clear_error();
    throw std::invalid_argument("unusable public key");
  }
  return pkey;
}
} // namespace

namespace Crypto {

std::string random_bytes(size_t n)
{
  std::string bfr(n, '\0');
  CHECK_EQ(RAND_bytes(reinterpret_cast<unsigned char*>(bfr.data()),
                      static_cast<int>(n)),
           1)
      << "RAND_bytes failed";
  return bfr;
}

std::string sha256(std::string_view data)
{
  unsigned char md[SHA256_DIGEST_LENGTH];
  unsigned int  md_len = sizeof(md);
  CHECK_EQ(EVP_Digest(uc(data), data.size(), md, &md_len, EVP_sha256(),
                      nullptr),
           1);
  return std::string(reinterpret_cast<char*>(md), md_len);
}

std::string hmac_sha256(std::string_view key, std::string_view data)
{
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int  md_len = 0;
  CHECK_NOTNULL(HMAC(EVP_sha256(), uc(key), static_cast<int>(key.size()),
                     uc(data), data.size(), md, &md_len));
  CHECK_EQ(md_len, static_cast<unsigned>(mac_size));
  return std::string(reinterpret_cast<char*>(md), md_len);
}

std::string hkdf_sha256(std::string_view ikm,
                        std::string_view salt,
                        std::string_view info,
                        size_t           length)
{
  auto const ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_PKEY_derive_init(ctx), 1);
  CHECK_EQ(EVP_PKEY_CTX_set_hkdf_md(ctx, EVP_sha256()), 1);
  // No salt set is the same as HashLen zeros: HMAC pads its key with zeros.
  if (!salt.empty()) {
    CHECK_EQ(EVP_PKEY_CTX_set1_hkdf_salt(ctx, uc(salt),
                                         static_cast<int>(salt.size())),
             1);
  }
  CHECK_EQ(
      EVP_PKEY_CTX_set1_hkdf_key(ctx, uc(ikm), static_cast<int>(ikm.size())),
      1);
  if (!info.empty()) {
    CHECK_EQ(EVP_PKEY_CTX_add1_hkdf_info(ctx, uc(info),
                                         static_cast<int>(info.size())),
             1);
  }

  std::string out(length, '\0');
  auto        out_len = length;
  CHECK_EQ(EVP_PKEY_derive(ctx, reinterpret_cast<unsigned char*>(out.data()),
                           &out_len),
           1);
  CHECK_EQ(out_len, length);
  EVP_PKEY_CTX_free(ctx);
  return out;
}

std::string aes256_cbc_encrypt(std::string_view key,
                               std::string_view iv,
                               std::string_view plaintext)
{
  CHECK_EQ(key.size(), 32u);
  CHECK_EQ(iv.size(), 16u);

  auto const ctx = EVP_CIPHER_CTX_new();
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_EncryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, uc(key), uc(iv)),
           1);

  std::string out(plaintext.size() + 16, '\0');
  auto const  o = reinterpret_cast<unsigned char*>(out.data());

  int len = 0;
  CHECK_EQ(EVP_EncryptUpdate(ctx, o, &len, uc(plaintext),
                             static_cast<int>(plaintext.size())),
           1);
  int fin = 0;
  CHECK_EQ(EVP_EncryptFinal_ex(ctx, o + len, &fin), 1);
  EVP_CIPHER_CTX_free(ctx);

  out.resize(static_cast<size_t>(len + fin));
  return out;
}

std::optional<std::string> aes256_cbc_decrypt(std::string_view key,
                                              std::string_view iv,
                                              std::string_view ciphertext)
{
  CHECK_EQ(key.size(), 32u);
  CHECK_EQ(iv.size(), 16u);

  auto const ctx = EVP_CIPHER_CTX_new();
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, uc(key), uc(iv)),
           1);

  std::string out(ciphertext.size() + 16, '\0');
  auto const  o = reinterpret_cast<unsigned char*>(out.data());

  int  len = 0;
  int  fin = 0;
  auto ok  = EVP_DecryptUpdate(ctx, o, &len, uc(ciphertext),
                              static_cast<int>(ciphertext.size()))
                == 1
            && EVP_DecryptFinal_ex(ctx, o + len, &fin) == 1;
  EVP_CIPHER_CTX_free(ctx);

  if (!ok) {
    ERR_clear_error();
    return {};
  }
  out.resize(static_cast<size_t>(len + fin));
  return out;
}

Curve25519::Curve25519()
  : Curve25519(random_bytes(key_size))
{
}

Curve25519::Curve25519(std::string_view priv)
{
  auto const pkey = new_private_key(EVP_PKEY_X25519, priv);
  private_        = std::string(priv);
  public_         = raw_public(pkey);
  EVP_PKEY_free(pkey);
}

std::string Curve25519::agree(std::string_view their_public) const
{
  auto const peer = new_public_key(EVP_PKEY_X25519, their_public);
  auto const ours = new_private_key(EVP_PKEY_X25519, private_);

  auto const ctx = EVP_PKEY_CTX_new(ours, nullptr);
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_PKEY_derive_init(ctx), 1);

  unsigned char secret[key_size];
  size_t        len = sizeof(secret);

  // Fails for small order points, which only a hostile peer sends.
  auto const ok = EVP_PKEY_derive_set_peer(ctx, peer) == 1
                  && EVP_PKEY_derive(ctx, secret, &len) == 1;

  EVP_PKEY_CTX_free(ctx);
  EVP_PKEY_free(ours);
  EVP_PKEY_free(peer);

  if (!ok) {
    ERR_clear_error();
    throw std::invalid_argument("X25519 key agreement failed");
  }
  return std::string(reinterpret_cast<char*>(secret), len);
}

Ed25519::Ed25519()
  : Ed25519(random_bytes(key_size))
{
}

Ed25519::Ed25519(std::string_view seed)
{
  auto const pkey = new_private_key(EVP_PKEY_ED25519, seed);
  seed_           = std::string(seed);
  public_         = raw_public(pkey);
  EVP_PKEY_free(pkey);
}

std::string Ed25519::sign(std::string_view message) const
{
  auto const pkey = new_private_key(EVP_PKEY_ED25519, seed_);
  auto const ctx  = EVP_MD_CTX_new();
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey), 1);

  unsigned char sig[signature_size];
  size_t        sig_len = sizeof(sig);
  CHECK_EQ(EVP_DigestSign(ctx, sig, &sig_len, uc(message), message.size()), 1);
  CHECK_EQ(sig_len, sizeof(sig));

  EVP_MD_CTX_free(ctx);
  EVP_PKEY_free(pkey);
  return std::string(reinterpret_cast<char*>(sig), sig_len);
}

bool Ed25519::verify(std::string_view public_key_bytes,
                     std::string_view message,
                     std::string_view signature)
{
  if (signature.size() != signature_size)
    return false;

  EVP_PKEY* pkey = nullptr;
  try {
    pkey = new_public_key(EVP_PKEY_ED25519, public_key_bytes);
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "Ed25519 verify: " << e.what();
    return false;
  }

  auto const ctx = EVP_MD_CTX_new();
  CHECK_NOTNULL(ctx);
  CHECK_EQ(EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey), 1);
  auto const ok = EVP_DigestVerify(ctx, uc(signature), signature.size(),
                                   uc(message), message.size())
                  == 1;
  EVP_MD_CTX_free(ctx);
  EVP_PKEY_free(pkey);

  if (!ok)
    ERR_clear_error();
  return ok;
}

} // namespace Crypto
