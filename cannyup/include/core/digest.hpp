//! # File Digests
//!
//! SHA-256 fingerprints (OpenSSL EVP) used to check that a staged copy is
//! byte-identical to the build artifact before it replaces the installed
//! binary, and to record which toolchain installer script was executed.

#ifndef CANNYUP_CORE_DIGEST_HPP
#define CANNYUP_CORE_DIGEST_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace cannyup {

/// Returns "sha256:<64 hex chars>" for the file's contents, or an empty
/// string if the file cannot be read.
std::string sha256_file(const std::filesystem::path& path);

/// Same format as sha256_file(), over an in-memory buffer.
std::string sha256_bytes(std::string_view data);

} // namespace cannyup

#endif // CANNYUP_CORE_DIGEST_HPP
