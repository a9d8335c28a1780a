#include "keystore.hpp"
#include "error.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

KeyStore::KeyStore(const std::string& storage_dir, const std::string& label) : storage_dir(storage_dir), label(label) {}

std::string KeyStore::private_key_path() const {
  return (fs::path(storage_dir) / "adbkey").string();
}

std::string KeyStore::public_key_path() const {
  return (fs::path(storage_dir) / "adbkey.pub").string();
}

bool KeyStore::read_file(const std::string& path, std::string& out) const {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

void KeyStore::write_file(const std::string& path, const std::string& data, bool secret) const {
  std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw AdbError(ErrorKind::IoError, "cannot open " + tmp + " for writing");
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      throw AdbError(ErrorKind::IoError, "failed writing " + tmp);
    }
  }

  std::error_code ec;
  if (secret) {
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
      Logger::log(Logger::WARN, "could not restrict permissions on " + tmp + ": " + ec.message());
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw AdbError(ErrorKind::IoError, "cannot move key into place at " + path);
  }
}

KeyPair KeyStore::load_or_generate() {
  std::error_code ec;
  fs::create_directories(storage_dir, ec);
  if (ec) {
    throw AdbError(ErrorKind::IoError, "cannot create key directory " + storage_dir + ": " + ec.message());
  }

  KeyPair keys;

  std::string pem;
  if (read_file(private_key_path(), pem)) {
    keys.private_key = private_key_from_pem(pem);
    if (!keys.private_key) {
      Logger::log(Logger::WARN, "private key at " + private_key_path() + " is unreadable; generating a new one (device will ask to trust it again)");
    }
  }

  if (keys.private_key) {
    // The blob is always derived from the private key; the file is only a copy.
    keys.public_key = encode_public_key(keys.private_key.get(), label);
    std::string expected(keys.public_key.begin(), keys.public_key.end());
    std::string blob;
    if (!read_file(public_key_path(), blob) || blob.empty()) {
      write_file(public_key_path(), expected, false);
      Logger::log(Logger::INFO, "Re-derived public key blob at " + public_key_path());
    } else if (blob != expected) {
      Logger::log(Logger::WARN, "public key at " + public_key_path() + " does not match the private key; rewriting it");
      write_file(public_key_path(), expected, false);
    } else {
      Logger::log(Logger::DEBUG, "Loaded existing keys from " + storage_dir);
    }
    return keys;
  }

  keys.private_key = generate_rsa_key();
  keys.public_key = encode_public_key(keys.private_key.get(), label);

  write_file(private_key_path(), private_key_to_pem(keys.private_key.get()), true);
  write_file(public_key_path(), std::string(keys.public_key.begin(), keys.public_key.end()), false);

  Logger::log(Logger::INFO, "Generated new RSA-" + std::to_string(RSA_KEY_BITS) + " key pair in " + storage_dir);
  return keys;
}
