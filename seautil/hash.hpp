// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEAUTIL_HASH_HPP
#define SEAUTIL_HASH_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace seautil
{

/** Number of bytes in a SHA-256 digest.  */
constexpr size_t DIGEST_BYTES = 32;

/**
 * The raw output of a SHA-256 hash.  It is also used as seed for the
 * deterministic Random generator.
 */
using Digest = std::array<unsigned char, DIGEST_BYTES>;

/**
 * Returns the lower-case hex encoding of a digest.
 */
std::string DigestToHex (const Digest& d);

/**
 * Returns true if all bytes of the digest are zero.  This is used as marker
 * for "unseeded" random generators.
 */
bool IsNullDigest (const Digest& d);

/**
 * Streaming SHA-256 hasher.  Data is fed in through operator<<, and
 * Finalise returns the digest.
 */
class Sha256
{

private:

  /**
   * Holder for the OpenSSL digest context.  It is not exposed in the header,
   * so that users of the hasher do not depend on OpenSSL headers.
   */
  class State;

  std::unique_ptr<State> state;

public:

  Sha256 ();
  ~Sha256 ();

  Sha256 (const Sha256&) = delete;
  void operator= (const Sha256&) = delete;

  Sha256& operator<< (const std::string& data);
  Sha256& operator<< (const Digest& data);

  /**
   * Finalises the hash and returns the digest.  The hasher must not be
   * used anymore afterwards.
   */
  Digest Finalise ();

  /**
   * Hashes a single string.
   */
  static Digest Hash (const std::string& data);

};

} // namespace seautil

#endif // SEAUTIL_HASH_HPP
