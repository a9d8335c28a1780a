#pragma once
// KeyStore: persists the client's RSA identity under a storage directory.
//
// Files:
// - `adbkey`      PKCS#8 PEM private key (mode 0600)
// - `adbkey.pub`  encoded public key blob, sent as the AUTH_RSAPUBLICKEY payload
//
// The daemon remembers trust per key, so an existing private key is never
// replaced; only a missing or unreadable one causes regeneration.
#include "crypto.hpp"
#include <string>
#include <vector>

struct KeyPair {
  PrivateKey private_key;
  std::vector<uint8_t> public_key; // base64 struct + " label\0"
};

class KeyStore {
  std::string storage_dir;
  std::string label;

  bool read_file(const std::string& path, std::string& out) const;
  // Write via a temp file + rename so a crash never leaves a torn key.
  void write_file(const std::string& path, const std::string& data, bool secret) const;

public:
  KeyStore(const std::string& storage_dir, const std::string& label);

  std::string private_key_path() const;
  std::string public_key_path() const;

  // Load the persisted pair, or generate and persist a new one.
  // Throws AdbError(IoError) if the directory or files cannot be written.
  KeyPair load_or_generate();
};
