// Copyright (C) 2019-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include <glog/logging.h>

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace seautil
{

std::string
DigestToHex (const Digest& d)
{
  std::ostringstream out;
  out << std::hex << std::setfill ('0');
  for (const unsigned char b : d)
    out << std::setw (2) << static_cast<int> (b);

  return out.str ();
}

bool
IsNullDigest (const Digest& d)
{
  for (const unsigned char b : d)
    if (b != 0)
      return false;

  return true;
}

class Sha256::State
{

private:

  EVP_MD_CTX* ctx;

  /** Set once the digest has been extracted.  */
  bool finalised = false;

public:

  State ()
    : ctx(EVP_MD_CTX_new ())
  {
    CHECK (ctx != nullptr);
    CHECK_EQ (EVP_DigestInit_ex (ctx, EVP_sha256 (), nullptr), 1);
  }

  ~State ()
  {
    EVP_MD_CTX_free (ctx);
  }

  State (const State&) = delete;
  void operator= (const State&) = delete;

  void
  Update (const unsigned char* data, const size_t len)
  {
    CHECK (!finalised) << "Sha256 instance has already been finalised";
    CHECK_EQ (EVP_DigestUpdate (ctx, data, len), 1);
  }

  Digest
  Finalise ()
  {
    CHECK (!finalised) << "Sha256 instance has already been finalised";
    finalised = true;

    Digest res;
    unsigned len;
    CHECK_EQ (EVP_DigestFinal_ex (ctx, res.data (), &len), 1);
    CHECK_EQ (len, DIGEST_BYTES);

    return res;
  }

};

Sha256::Sha256 ()
  : state(std::make_unique<State> ())
{}

Sha256::~Sha256 () = default;

Sha256&
Sha256::operator<< (const std::string& data)
{
  state->Update (reinterpret_cast<const unsigned char*> (data.data ()),
                 data.size ());
  return *this;
}

Sha256&
Sha256::operator<< (const Digest& data)
{
  state->Update (data.data (), data.size ());
  return *this;
}

Digest
Sha256::Finalise ()
{
  return state->Finalise ();
}

Digest
Sha256::Hash (const std::string& data)
{
  Sha256 hasher;
  hasher << data;
  return hasher.Finalise ();
}

} // namespace seautil
