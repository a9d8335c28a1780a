#include "crypto.hpp"
#include "protocol.hpp"
#include <cstring>
#include <openssl/bio.h>
#include <openssl/core_names.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <stdexcept>

// ASN.1 DigestInfo header for SHA-1, followed on the wire by the 20-byte hash.
static const uint8_t kSha1DigestInfo[] = {0x30, 0x21, 0x30, 0x09, 0x06, 0x05, 0x2b, 0x0e, 0x03, 0x02, 0x1a, 0x05, 0x00, 0x04, 0x14};

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};
using PkeyCtx = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) const {
    BIO_free(bio);
  }
};
using Bio = std::unique_ptr<BIO, BioDeleter>;

struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const {
    BN_CTX_free(ctx);
  }
};
using BnCtx = std::unique_ptr<BN_CTX, BnCtxDeleter>;

PrivateKey generate_rsa_key(int bits) {
  PkeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_PKEY_CTX");
  }

  if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
    throw std::runtime_error("keygen_init");
  }

  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
    throw std::runtime_error("Failed to set RSA key size");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &pkey) <= 0) {
    throw std::runtime_error("keygen");
  }
  return PrivateKey(pkey);
}

std::string private_key_to_pem(EVP_PKEY* key) {
  Bio bio(BIO_new(BIO_s_mem()));
  if (!bio) {
    throw std::runtime_error("Failed to create BIO");
  }
  if (PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("Failed to serialize private key");
  }
  char* data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(len));
}

PrivateKey private_key_from_pem(const std::string& pem) {
  Bio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  if (!bio) {
    return nullptr;
  }
  PrivateKey key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key || EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
    return nullptr;
  }
  return key;
}

std::vector<uint8_t> to_little_endian_padded(const std::vector<uint8_t>& big_endian, size_t size) {
  // Skip leading sign/zero bytes.
  size_t start = 0;
  while (start < big_endian.size() && big_endian[start] == 0)
    ++start;
  size_t len = big_endian.size() - start;
  if (len > size) {
    throw std::runtime_error("Value does not fit in " + std::to_string(size) + " bytes");
  }

  std::vector<uint8_t> result(size, 0);
  for (size_t i = 0; i < len; ++i) {
    result[i] = big_endian[big_endian.size() - 1 - i];
  }
  return result;
}

std::vector<uint8_t> to_big_endian(const std::vector<uint8_t>& little_endian) {
  size_t len = little_endian.size();
  while (len > 0 && little_endian[len - 1] == 0)
    --len;
  std::vector<uint8_t> result(len);
  for (size_t i = 0; i < len; ++i) {
    result[i] = little_endian[len - 1 - i];
  }
  return result;
}

static std::vector<uint8_t> bn_to_bytes(const BIGNUM* bn) {
  std::vector<uint8_t> out(static_cast<size_t>(BN_num_bytes(bn)));
  BN_bn2bin(bn, out.data());
  return out;
}

std::vector<uint8_t> encode_public_key_struct(const BIGNUM* n, const BIGNUM* e) {
  if (BN_num_bits(n) != RSA_KEY_BITS) {
    throw std::runtime_error("Modulus must be " + std::to_string(RSA_KEY_BITS) + " bits, got " + std::to_string(BN_num_bits(n)));
  }

  BnCtx ctx(BN_CTX_new());
  Bignum r32(BN_new());
  Bignum n0(BN_new());
  Bignum n0inv(BN_new());
  Bignum rr(BN_new());
  if (!ctx || !r32 || !n0 || !n0inv || !rr) {
    throw std::runtime_error("Failed to allocate BIGNUM");
  }

  // n0inv = -(n^-1) mod 2^32
  if (!BN_set_bit(r32.get(), 32) || !BN_nnmod(n0.get(), n, r32.get(), ctx.get()) || !BN_mod_inverse(n0inv.get(), n0.get(), r32.get(), ctx.get()) ||
      !BN_sub(n0inv.get(), r32.get(), n0inv.get())) {
    throw std::runtime_error("Failed to compute n0inv");
  }

  // rr = (2^2048)^2 mod n
  if (!BN_set_bit(rr.get(), RSA_KEY_BITS * 2) || !BN_mod(rr.get(), rr.get(), n, ctx.get())) {
    throw std::runtime_error("Failed to compute R^2 mod n");
  }

  std::vector<uint8_t> out(ANDROID_PUBKEY_STRUCT_SIZE, 0);
  uint8_t* p = out.data();
  put_u32_le(p, RSA_MODULUS_WORDS);
  p += 4;
  put_u32_le(p, static_cast<uint32_t>(BN_get_word(n0inv.get())));
  p += 4;

  std::vector<uint8_t> modulus = to_little_endian_padded(bn_to_bytes(n), RSA_MODULUS_BYTES);
  std::memcpy(p, modulus.data(), RSA_MODULUS_BYTES);
  p += RSA_MODULUS_BYTES;

  std::vector<uint8_t> rr_le = to_little_endian_padded(bn_to_bytes(rr.get()), RSA_MODULUS_BYTES);
  std::memcpy(p, rr_le.data(), RSA_MODULUS_BYTES);
  p += RSA_MODULUS_BYTES;

  put_u32_le(p, static_cast<uint32_t>(BN_get_word(e)));
  return out;
}

std::vector<uint8_t> encode_public_key(const BIGNUM* n, const BIGNUM* e, const std::string& label) {
  std::vector<uint8_t> raw = encode_public_key_struct(n, e);
  std::string text = base64_encode(raw.data(), raw.size());
  text += ' ';
  text += label;
  std::vector<uint8_t> out(text.begin(), text.end());
  out.push_back('\0');
  return out;
}

std::vector<uint8_t> encode_public_key(EVP_PKEY* key, const std::string& label) {
  BIGNUM* n = nullptr;
  BIGNUM* e = nullptr;
  if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n) != 1) {
    throw std::runtime_error("Failed to read RSA modulus");
  }
  Bignum n_owner(n);
  if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &e) != 1) {
    throw std::runtime_error("Failed to read RSA exponent");
  }
  Bignum e_owner(e);
  return encode_public_key(n, e, label);
}

std::vector<uint8_t> sign_auth_token(EVP_PKEY* key, const std::vector<uint8_t>& token) {
  if (token.size() != AUTH_TOKEN_SIZE) {
    throw std::runtime_error("Auth token must be " + std::to_string(AUTH_TOKEN_SIZE) + " bytes, got " + std::to_string(token.size()));
  }

  std::vector<uint8_t> digest_info(kSha1DigestInfo, kSha1DigestInfo + sizeof(kSha1DigestInfo));
  digest_info.insert(digest_info.end(), token.begin(), token.end());

  PkeyCtx ctx(EVP_PKEY_CTX_new(key, nullptr));
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP_PKEY_CTX for signing");
  }
  if (EVP_PKEY_sign_init(ctx.get()) <= 0) {
    throw std::runtime_error("Failed to init signing");
  }
  // No signature md: OpenSSL pads the input as-is (type 1 PKCS#1 v1.5).
  if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0) {
    throw std::runtime_error("Failed to set RSA padding");
  }

  size_t sig_len = 0;
  if (EVP_PKEY_sign(ctx.get(), nullptr, &sig_len, digest_info.data(), digest_info.size()) <= 0) {
    throw std::runtime_error("Failed to determine signature length");
  }
  std::vector<uint8_t> signature(sig_len);
  if (EVP_PKEY_sign(ctx.get(), signature.data(), &sig_len, digest_info.data(), digest_info.size()) <= 0) {
    throw std::runtime_error("Failed to sign auth token");
  }
  signature.resize(sig_len);
  return signature;
}

std::string base64_encode(const uint8_t* data, size_t len) {
  // EVP_EncodeBlock also writes a trailing NUL.
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
  out.resize(static_cast<size_t>(written));
  return out;
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& out) {
  if (text.size() % 4 != 0) {
    return false;
  }
  out.assign(3 * text.size() / 4, 0);
  int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
  if (written < 0) {
    return false;
  }
  // EVP_DecodeBlock counts the '=' padding as zero bytes.
  size_t padding = 0;
  if (!text.empty() && text[text.size() - 1] == '=')
    ++padding;
  if (text.size() > 1 && text[text.size() - 2] == '=')
    ++padding;
  out.resize(static_cast<size_t>(written) - padding);
  return true;
}
