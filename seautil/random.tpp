// Copyright (C) 2020-2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/* Template code for random.hpp.  */

#include <glog/logging.h>

#include <algorithm>
#include <iterator>

namespace seautil
{

template <typename Iterator>
  void
  Random::Shuffle (Iterator begin, Iterator end)
{
  auto remaining = std::distance (begin, end);
  for (; remaining > 1; ++begin, --remaining)
    {
      const Iterator other = std::next (begin, NextInt (remaining));
      if (other != begin)
        std::iter_swap (begin, other);
    }
}

template <typename T>
  const T&
  Random::Pick (const std::vector<T>& choices)
{
  CHECK (!choices.empty ()) << "Cannot pick from empty choices";
  return choices[NextInt (choices.size ())];
}

} // namespace seautil
