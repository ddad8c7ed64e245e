// Copyright (C) 2025 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SEABATTLE_TARGETREQUEST_HPP
#define SEABATTLE_TARGETREQUEST_HPP

#include "munitions.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace seabattle
{

/**
 * Request for a human player's next fire order.  The engine thread opens a
 * request with Await and blocks until the UI thread supplies an order,
 * the request is cancelled or the timeout expires.  Each request is resolved
 * at most once; supplying or cancelling while no request is pending has
 * no effect.
 */
class TargetRequest
{

public:

  /** Possible ways in which a request can end.  */
  enum class Outcome
  {
    SELECTED,
    TIMEOUT,
    CANCELLED,
  };

private:

  /** State of the current request.  */
  enum class State
  {
    IDLE,
    PENDING,
    SELECTED,
    CANCELLED,
  };

  /** Lock for this instance.  */
  mutable std::mutex mut;

  /** Condition variable notified when the pending request is resolved.  */
  std::condition_variable cvResolved;

  State state = State::IDLE;

  /** The order supplied, if state is SELECTED.  */
  FireOrder order;

public:

  TargetRequest () = default;

  TargetRequest (const TargetRequest&) = delete;
  void operator= (const TargetRequest&) = delete;

  /**
   * Opens a new request and blocks until it is resolved or the timeout
   * expires.  If an order is supplied, it is returned in out.  Must not be
   * called while another request is pending.
   */
  Outcome Await (std::chrono::milliseconds timeout, FireOrder& out);

  /**
   * Resolves the pending request with the given order.  Returns false
   * if there is no pending request.
   */
  bool Supply (const FireOrder& o);

  /**
   * Cancels the pending request.  Returns false if there is none.
   */
  bool Cancel ();

  /**
   * Returns true if a request is currently waiting for resolution.
   */
  bool IsPending () const;

};

std::string OutcomeToString (TargetRequest::Outcome o);

} // namespace seabattle

#endif // SEABATTLE_TARGETREQUEST_HPP
