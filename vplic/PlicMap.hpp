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
#include "Fault.hpp"

namespace TT_VPLIC
{

  /// Memory map of a PLIC (riscv-plic-1.0.0). Offsets are relative to the
  /// base of the device.
  namespace PlicMap
  {
    /// Number of source ids including the reserved source 0.
    constexpr unsigned NUM_SOURCES = 1024;

    /// Largest number of contexts the memory map can address.
    constexpr unsigned MAX_CONTEXTS = 15872;

    constexpr uint64_t PRIORITY_OFFSET = 0x000000;
    constexpr uint64_t PRIORITY_STRIDE = 4;

    constexpr uint64_t PENDING_OFFSET = 0x001000;
    constexpr uint64_t PENDING_WORDS  = NUM_SOURCES / 32;

    constexpr uint64_t ENABLE_OFFSET = 0x002000;
    constexpr uint64_t ENABLE_STRIDE = 0x80;    // 32 words per context.

    constexpr uint64_t CONTEXT_CTRL_OFFSET   = 0x200000;
    constexpr uint64_t CONTEXT_STRIDE        = 0x1000;
    constexpr uint64_t THRESHOLD_OFFSET      = 0x00;   // Within context block.
    constexpr uint64_t CLAIM_COMPLETE_OFFSET = 0x04;   // Within context block.

    constexpr uint64_t PRIORITY_END = PRIORITY_OFFSET + NUM_SOURCES * PRIORITY_STRIDE;
    constexpr uint64_t PENDING_END  = PENDING_OFFSET + PENDING_WORDS * 4;
    constexpr uint64_t ENABLE_END   = ENABLE_OFFSET + MAX_CONTEXTS * ENABLE_STRIDE;
    constexpr uint64_t CONTEXT_END  = CONTEXT_CTRL_OFFSET + MAX_CONTEXTS * CONTEXT_STRIDE;

    static_assert(PRIORITY_END == PENDING_OFFSET);
    static_assert(ENABLE_END <= CONTEXT_CTRL_OFFSET);

    /// Offset of the priority register of the given source.
    constexpr uint64_t priorityOffset(unsigned source)
    { return PRIORITY_OFFSET + source * PRIORITY_STRIDE; }

    /// Offset of the pending word holding bits of sources [32*word, 32*word + 31].
    constexpr uint64_t pendingOffset(unsigned word)
    { return PENDING_OFFSET + word * 4; }

    /// Offset of the given enable word of the given context.
    constexpr uint64_t enableOffset(unsigned context, unsigned word = 0)
    { return ENABLE_OFFSET + context * ENABLE_STRIDE + word * 4; }

    constexpr uint64_t thresholdOffset(unsigned context)
    { return CONTEXT_CTRL_OFFSET + context * CONTEXT_STRIDE + THRESHOLD_OFFSET; }

    constexpr uint64_t claimCompleteOffset(unsigned context)
    { return CONTEXT_CTRL_OFFSET + context * CONTEXT_STRIDE + CLAIM_COMPLETE_OFFSET; }

    /// End of the control registers of a device with the given number of
    /// contexts. A device region must extend past this address.
    constexpr uint64_t controlEnd(unsigned contexts)
    { return contexts * CONTEXT_STRIDE + CONTEXT_CTRL_OFFSET + CLAIM_COMPLETE_OFFSET; }


    enum class Region : uint32_t
      {
        Priority, Pending, Enable, Threshold, ClaimComplete, Unmapped
      };


    /// Result of classifying an offset. The meaning of index depends on the
    /// region: source id for Priority, word index for Pending, context id for
    /// Enable/Threshold/ClaimComplete. For Enable, word is the enable word
    /// within the context.
    struct RegLocation
    {
      Region region = Region::Unmapped;
      unsigned index = 0;
      unsigned word = 0;

      bool operator==(const RegLocation&) const = default;
    };


    /// Classify the given offset for a device with the given number of
    /// contexts. Return FaultCause::None filling loc on success. Return
    /// FaultCause::Unmapped if the offset is misaligned or hits no register
    /// and FaultCause::InvalidContext if the decoded context is out of bounds
    /// (loc still holds the decoded region and context in that case).
    constexpr FaultCause
    classify(uint64_t offset, unsigned contexts, RegLocation& loc)
    {
      loc = RegLocation{};

      if ((offset & 3) != 0)
        return FaultCause::Unmapped;

      if (offset < PRIORITY_END)
        {
          loc.region = Region::Priority;
          loc.index = (offset - PRIORITY_OFFSET) / PRIORITY_STRIDE;
          return FaultCause::None;
        }

      if (offset >= PENDING_OFFSET and offset < PENDING_END)
        {
          loc.region = Region::Pending;
          loc.index = (offset - PENDING_OFFSET) / 4;
          return FaultCause::None;
        }

      if (offset >= ENABLE_OFFSET and offset < ENABLE_END)
        {
          uint64_t rel = offset - ENABLE_OFFSET;
          loc.region = Region::Enable;
          loc.index = rel / ENABLE_STRIDE;
          loc.word = (rel % ENABLE_STRIDE) / 4;
          return loc.index < contexts ? FaultCause::None : FaultCause::InvalidContext;
        }

      if (offset >= CONTEXT_CTRL_OFFSET and offset < CONTEXT_END)
        {
          uint64_t rel = offset - CONTEXT_CTRL_OFFSET;
          uint64_t reg = rel % CONTEXT_STRIDE;
          if (reg == THRESHOLD_OFFSET)
            loc.region = Region::Threshold;
          else if (reg == CLAIM_COMPLETE_OFFSET)
            loc.region = Region::ClaimComplete;
          else
            return FaultCause::Unmapped;   // Reserved part of context block.
          loc.index = rel / CONTEXT_STRIDE;
          return loc.index < contexts ? FaultCause::None : FaultCause::InvalidContext;
        }

      return FaultCause::Unmapped;
    }


    constexpr const char*
    regionName(Region region)
    {
      switch (region)
        {
        case Region::Priority:      return "priority";
        case Region::Pending:       return "pending";
        case Region::Enable:        return "enable";
        case Region::Threshold:     return "threshold";
        case Region::ClaimComplete: return "claim/complete";
        case Region::Unmapped:      return "unmapped";
        }
      return "unmapped";
    }
  }
}
