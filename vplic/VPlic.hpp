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

#include <cstdint>
#include <optional>
#include <vector>
#include "MmioDevice.hpp"
#include "PlicMap.hpp"
#include "IrqState.hpp"
#include "HostPassthrough.hpp"

namespace TT_VPLIC
{

  struct VPlicParams
  {
    uint64_t base = 0;                    // Guest physical address of device.
    std::optional<uint64_t> size;         // Size of device region in bytes.
    unsigned contexts = 1;                // Number of interrupt contexts.
    std::optional<uint64_t> hostBase;     // Host PLIC address, defaults to base.
    bool filterClaims = true;             // Honor enable/threshold/priority on claim.
    std::vector<unsigned> assignedIrqs{}; // Sources reserved for this device.
  };


  /// Virtual PLIC for a guest. Priority, enable and threshold registers are
  /// forwarded to the host PLIC. Pending bits and claim/complete are
  /// virtualized: a source goes from idle to pending (inject), from pending
  /// to active (claim: read of a claim/complete register) and from active
  /// back to idle (complete: write of a claim/complete register, which is
  /// also forwarded to the host). The guest external interrupt line is
  /// asserted when a source is injected and deasserted on completion when
  /// nothing is left pending.
  ///
  /// All contexts share one pending set and one active set: a source is
  /// claimed by at most one context at a time.
  class VPlic : public MmioDevice
  {
  public:

    /// Define a virtual PLIC with the given parameters. Throw
    /// std::invalid_argument if the size is missing or does not cover the
    /// control registers of all contexts or if the number of contexts is out
    /// of bounds. The host accessor callbacks must be defined (see
    /// setHostReadCb/setHostWriteCb) before passthrough registers are used.
    explicit VPlic(const VPlicParams& params);

    DeviceType type() const override
    { return DeviceType::PlicGlobal; }

    unsigned contextCount() const
    { return contexts_; }

    uint64_t hostBase() const
    { return host_.hostBase(); }

    bool filtersClaims() const
    { return filterClaims_; }

    /// Handle a guest read. Only 4-byte accesses are accepted. Return true on
    /// success setting value. Return false setting cause if the access is
    /// rejected. A rejected read claims nothing.
    bool read(uint64_t addr, unsigned size, uint64_t& value, FaultCause& cause) override;

    /// Handle a guest write. Only 4-byte accesses are accepted. Return true
    /// on success. Return false setting cause if the access is rejected. A
    /// completion whose host write fails has already updated the virtual
    /// state.
    bool write(uint64_t addr, unsigned size, uint64_t value, FaultCause& cause) override;

    /// Make the given source pending and assert the guest signal. Return
    /// false if id is not a valid source id (1 to 1023).
    bool inject(unsigned id)
    { return state_.inject(id); }

    /// Claim on behalf of the given context: move the selected pending source
    /// to the active set and set id to it, or set id to 0 if nothing is
    /// claimable. Return false setting cause if the context is out of bounds
    /// or if the host could not be read for claim filtering.
    bool claim(unsigned context, uint32_t& id, FaultCause& cause);

    /// Complete the given source on behalf of the given context and forward
    /// the completion to the host. Return false setting cause if the context
    /// is out of bounds or if the host write fails.
    bool complete(unsigned context, uint32_t id, FaultCause& cause);

    /// Reserve the given source for this device. Return false if id is not a
    /// valid source id.
    bool assignIrq(unsigned id)
    { return state_.setAssigned(id, true); }

    /// Define the callback driving the guest external interrupt line.
    void setSignalCallback(const SignalCallback& cb)
    { state_.setSignalCallback(cb); }

    void setHostReadCb(const HostReadCallback& cb)
    { host_.setReadCb(cb); }

    void setHostWriteCb(const HostWriteCallback& cb)
    { host_.setWriteCb(cb); }

    HostPassthrough& host()
    { return host_; }

    const IrqState& state() const
    { return state_; }

    /// Clear pending and active sources and deassert the guest signal.
    void reset()
    { state_.reset(); }

    /// Print each guest access to the standard error stream.
    void enableTrace(bool flag)
    { trace_ = flag; }

  private:

    /// Fill candidates with the pending sources the given context may claim
    /// in order of preference: enabled for the context with priority above
    /// the context threshold, highest priority first, lowest id first among
    /// equal priorities. Return false if a host register cannot be read.
    bool claimCandidates(unsigned context, std::vector<unsigned>& candidates) const;

    void traceAccess(const char* tag, uint64_t addr, const PlicMap::RegLocation& loc,
                     uint64_t value, FaultCause cause) const;

    unsigned contexts_ = 1;
    bool filterClaims_ = true;
    bool trace_ = false;
    HostPassthrough host_;
    IrqState state_;
  };
}
