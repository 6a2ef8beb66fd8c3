// Copyright 2024 Tenstorrent Corporation.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <bitset>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>
#include "PlicMap.hpp"

namespace TT_VPLIC
{

  using SourceSet = std::bitset<PlicMap::NUM_SOURCES>;

  /// Callback driving the guest external-interrupt-pending line: called with
  /// true to assert and false to deassert.
  using SignalCallback = std::function<void(bool asserted)>;


  /// Assigned/pending/active indicator sets of the virtual PLIC. All sets
  /// and the guest signal share a single lock so that each transition
  /// (inject, claim, complete) and the resulting signal change is atomic with
  /// respect to other callers. Source 0 is never a member of any set; ids 0
  /// and >= NUM_SOURCES are ignored by the mutators.
  ///
  /// A source is never pending and active at the same time. Like a PLIC
  /// gateway, a request for a source that is in service is latched in the
  /// deferred set and becomes pending when the source is completed.
  class IrqState
  {
  public:

    IrqState() = default;

    IrqState(const IrqState&) = delete;
    IrqState& operator=(const IrqState&) = delete;

    /// Define the callback used to assert/deassert the guest signal. The
    /// callback is invoked with the state lock held and must not call back
    /// into this object.
    void setSignalCallback(const SignalCallback& cb)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      signal_ = cb;
    }

    /// Return true if the given id is a valid source id.
    static bool isValidId(unsigned id)
    { return id > 0 and id < PlicMap::NUM_SOURCES; }

    bool isPending(unsigned id) const;
    bool isActive(unsigned id) const;
    bool isAssigned(unsigned id) const;

    /// Return true if a request arrived for the given source while it was
    /// active.
    bool isDeferred(unsigned id) const;

    /// Add/remove the given id to/from the pending set. Adding an active id
    /// latches it in the deferred set instead. Return false if id is not a
    /// valid source id. No signal change.
    bool setPending(unsigned id, bool flag);

    /// Add/remove the given id to/from the active set. Adding removes the id
    /// from the pending set. Return false if id is not a valid source id.
    bool setActive(unsigned id, bool flag);

    /// Add/remove the given id to/from the assigned set.
    bool setAssigned(unsigned id, bool flag);

    /// Return the smallest pending id or none if nothing is pending.
    std::optional<unsigned> lowestPending() const;

    bool pendingEmpty() const;

    /// Return the 32 pending bits of sources [32*word, 32*word + 31].
    uint32_t pendingWord(unsigned word) const;

    SourceSet pendingSet() const;
    SourceSet activeSet() const;
    SourceSet assignedSet() const;
    SourceSet deferredSet() const;

    /// Return the current level of the guest signal as last driven by this
    /// object.
    bool signalAsserted() const;

    /// Mark pending every source whose bit is set in the given pending word
    /// (additive: no pending bit is cleared). Active sources are deferred.
    /// Assert the guest signal if the pending set is non-empty afterwards.
    void injectWord(unsigned word, uint32_t bits);

    /// Mark the given source pending and assert the guest signal. If the
    /// source is active, defer the request until it is completed and leave
    /// the signal unchanged. Return false leaving the state unchanged if id
    /// is not a valid source id.
    bool inject(unsigned id);

    /// Move the lowest pending source to the active set and return its id.
    /// Return 0 if nothing is pending.
    unsigned claimLowest();

    /// Move the first of the given candidates that is still pending to the
    /// active set and return its id. Return 0 if no candidate is pending.
    unsigned claimFirstOf(std::span<const unsigned> candidates);

    /// Retire the given source: remove the id from the active set, make it
    /// pending again (asserting the guest signal) if a request was deferred
    /// while it was active, and deassert the guest signal if nothing is
    /// pending. Return true if the id was active.
    bool complete(unsigned id);

    /// Clear all sets except the assigned set and deassert the signal.
    void reset();

  private:

    void driveSignal(bool level);

    /// Make the given valid id pending or deferred if it is active. Lock
    /// must be held.
    void request(unsigned id);

    mutable std::mutex mutex_;
    SourceSet assigned_;
    SourceSet pending_;
    SourceSet active_;
    SourceSet deferred_;
    bool signalLevel_ = false;
    SignalCallback signal_ = nullptr;
  };
}
