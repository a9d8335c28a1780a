#pragma once
// Crypto module: RSA-2048 key generation and PEM (PKCS#8) persistence,
// raw PKCS#1 v1.5 signing of pre-hashed auth tokens, and the daemon's
// custom public key structure (not X.509/PKCS8).
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <string>
#include <vector>

// Modulus size for a 2048-bit key: 64 32-bit words, 256 bytes.
#define RSA_KEY_BITS 2048
#define RSA_MODULUS_WORDS (RSA_KEY_BITS / 32)
#define RSA_MODULUS_BYTES (RSA_KEY_BITS / 8)

// word count + n0inv + modulus + R^2 + exponent
#define ANDROID_PUBKEY_STRUCT_SIZE (4 + 4 + RSA_MODULUS_BYTES + RSA_MODULUS_BYTES + 4)

// Auth tokens are SHA-1 sized.
#define AUTH_TOKEN_SIZE 20

struct EvpPkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};
using PrivateKey = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

struct BignumDeleter {
  void operator()(BIGNUM* bn) const {
    BN_free(bn);
  }
};
using Bignum = std::unique_ptr<BIGNUM, BignumDeleter>;

// Generate an RSA key with public exponent 65537. Throws on OpenSSL failure.
PrivateKey generate_rsa_key(int bits = RSA_KEY_BITS);

// PKCS#8 PEM text for `key`.
std::string private_key_to_pem(EVP_PKEY* key);

// Parse PEM text. Returns null if the text is not an RSA private key.
PrivateKey private_key_from_pem(const std::string& pem);

// Big-endian magnitude (leading zero/sign bytes allowed) to little-endian,
// zero-padded to `size`. Throws if the value needs more than `size` bytes.
std::vector<uint8_t> to_little_endian_padded(const std::vector<uint8_t>& big_endian, size_t size);

// Inverse of the above: reverses and drops the zero padding.
std::vector<uint8_t> to_big_endian(const std::vector<uint8_t>& little_endian);

// Raw 524-byte structure:
//   uint32_t modulus_size_words  (64)
//   uint32_t n0inv               (-1 / n[0] mod 2^32)
//   uint8_t  modulus[256]        (little-endian)
//   uint8_t  rr[256]             (R^2 mod n, R = 2^2048, little-endian)
//   uint32_t exponent
std::vector<uint8_t> encode_public_key_struct(const BIGNUM* n, const BIGNUM* e);

// AUTH_RSAPUBLICKEY payload: base64(struct) + " " + label + "\0".
std::vector<uint8_t> encode_public_key(const BIGNUM* n, const BIGNUM* e, const std::string& label);
std::vector<uint8_t> encode_public_key(EVP_PKEY* key, const std::string& label);

// Sign a 20-byte token that the daemon has already hashed. The SHA-1
// DigestInfo prefix is prepended by hand and the 35-byte result is signed
// with PKCS#1 v1.5 padding and no further digest.
std::vector<uint8_t> sign_auth_token(EVP_PKEY* key, const std::vector<uint8_t>& token);

std::string base64_encode(const uint8_t* data, size_t len);
// Returns false on malformed input.
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);
