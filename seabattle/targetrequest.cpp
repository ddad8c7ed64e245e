// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "targetrequest.hpp"

#include <glog/logging.h>

namespace seabattle
{

TargetRequest::Outcome
TargetRequest::Await (const std::chrono::milliseconds timeout, FireOrder& out)
{
  std::unique_lock<std::mutex> lock(mut);
  CHECK (state == State::IDLE) << "Target request is already pending";

  state = State::PENDING;
  VLOG (1) << "Waiting up to " << timeout.count () << " ms for a target";

  const bool resolved = cvResolved.wait_for (lock, timeout, [this] ()
    {
      return state != State::PENDING;
    });

  const State final = state;
  state = State::IDLE;

  if (!resolved)
    {
      VLOG (1) << "Target request timed out";
      return Outcome::TIMEOUT;
    }

  switch (final)
    {
    case State::SELECTED:
      out = order;
      return Outcome::SELECTED;

    case State::CANCELLED:
      return Outcome::CANCELLED;

    default:
      LOG (FATAL)
          << "Invalid resolved state of target request: "
          << static_cast<int> (final);
    }
}

bool
TargetRequest::Supply (const FireOrder& o)
{
  std::lock_guard<std::mutex> lock(mut);
  if (state != State::PENDING)
    {
      VLOG (1) << "No pending target request for " << o.target;
      return false;
    }

  order = o;
  state = State::SELECTED;
  cvResolved.notify_all ();

  return true;
}

bool
TargetRequest::Cancel ()
{
  std::lock_guard<std::mutex> lock(mut);
  if (state != State::PENDING)
    return false;

  state = State::CANCELLED;
  cvResolved.notify_all ();

  return true;
}

bool
TargetRequest::IsPending () const
{
  std::lock_guard<std::mutex> lock(mut);
  return state == State::PENDING;
}

std::string
OutcomeToString (const TargetRequest::Outcome o)
{
  switch (o)
    {
    case TargetRequest::Outcome::SELECTED:
      return "selected";
    case TargetRequest::Outcome::TIMEOUT:
      return "timeout";
    case TargetRequest::Outcome::CANCELLED:
      return "cancelled";
    }

  LOG (FATAL) << "Invalid outcome: " << static_cast<int> (o);
}

} // namespace seabattle
