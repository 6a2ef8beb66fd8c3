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
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>
#include "HostPassthrough.hpp"

namespace TT_VPLIC
{

  /// Software model of the host PLIC register file used when the virtual
  /// PLIC runs without real hardware. Registers are 32-bit words allocated
  /// on first write and reading as zero before that. Writes to a
  /// claim/complete register are recorded as completions and do not change
  /// the register file; reads of a claim/complete register return zero.
  class SimHostPlic
  {
  public:

    /// A completion written to the claim/complete register of a context.
    struct Completion
    {
      unsigned context = 0;
      uint32_t id = 0;

      bool operator==(const Completion&) const = default;
    };

    /// Define a host PLIC covering [base, base + size - 1].
    SimHostPlic(uint64_t base, uint64_t size)
      : base_(base), size_(size)
    { }

    SimHostPlic(const SimHostPlic&) = delete;
    SimHostPlic& operator=(const SimHostPlic&) = delete;

    uint64_t base() const { return base_; }
    uint64_t size() const { return size_; }

    /// Read size bytes (1, 2, 4 or 8) at the given address. Return false if
    /// the access is outside the controller, misaligned or of an invalid
    /// size.
    bool read(uint64_t addr, unsigned size, uint64_t& data);

    /// Write size bytes (1, 2, 4 or 8) at the given address. See read for
    /// failure conditions.
    bool write(uint64_t addr, unsigned size, uint64_t data);

    /// Return the 32-bit register at the given word-aligned address without
    /// side effects.
    uint32_t peek(uint64_t addr) const;

    /// Set the 32-bit register at the given word-aligned address without side
    /// effects. Return false if the address is outside the controller.
    bool poke(uint64_t addr, uint32_t value);

    /// Return the completions written so far in order.
    std::vector<Completion> completions() const;

    void clearCompletions();

    /// Make the given passthrough access the host through this model. This
    /// object must outlive the passthrough.
    void attach(HostPassthrough& passthrough);

  private:

    bool inRange(uint64_t addr, unsigned size) const
    { return addr >= base_ and size <= size_ and addr - base_ <= size_ - size; }

    /// Return true if the given word address is a claim/complete register
    /// setting context to its context id.
    bool isClaimComplete(uint64_t wordAddr, unsigned& context) const;

    uint32_t readWord(uint64_t wordAddr) const;
    void writeWord(uint64_t wordAddr, uint32_t value);

    uint64_t base_ = 0;
    uint64_t size_ = 0;
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, uint32_t> regs_;
    std::vector<Completion> completions_;
  };
}
