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

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include "VPlic.hpp"

using namespace TT_VPLIC;


/// Return the size of the device region described by the given parameters.
/// Throw std::invalid_argument if the region cannot hold the registers of
/// all contexts.
static uint64_t
checkedSize(const VPlicParams& params)
{
  std::ostringstream oss;

  if (params.contexts == 0 or params.contexts > PlicMap::MAX_CONTEXTS)
    {
      oss << "Invalid PLIC context count " << params.contexts << " (must be in 1 to "
          << PlicMap::MAX_CONTEXTS << ")";
      throw std::invalid_argument(oss.str());
    }

  if (not params.size.has_value())
    throw std::invalid_argument("Size must be specified for virtual PLIC");

  uint64_t size = *params.size;
  uint64_t end = params.base + PlicMap::controlEnd(params.contexts);
  if (size <= PlicMap::controlEnd(params.contexts) or params.base + size < params.base)
    {
      oss << std::hex << "End address 0x" << end << " exceeds region [0x" << params.base
          << ", 0x" << (params.base + size) << ")";
      throw std::invalid_argument(oss.str());
    }

  return size;
}


VPlic::VPlic(const VPlicParams& params)
  : MmioDevice(params.base, checkedSize(params)),
    contexts_(params.contexts),
    filterClaims_(params.filterClaims),
    host_(params.hostBase.value_or(params.base))
{
  for (auto id : params.assignedIrqs)
    {
      if (not state_.setAssigned(id, true))
        {
          std::ostringstream oss;
          oss << "Invalid assigned PLIC source id " << id;
          throw std::invalid_argument(oss.str());
        }
    }
}


void
VPlic::traceAccess(const char* tag, uint64_t addr, const PlicMap::RegLocation& loc,
                   uint64_t value, FaultCause cause) const
{
  if (not trace_)
    return;

  std::cerr << "Info: vplic " << tag << " 0x" << std::hex << addr << std::dec
            << " " << PlicMap::regionName(loc.region) << "[" << loc.index << "]";
  if (cause == FaultCause::None)
    std::cerr << " value 0x" << std::hex << value << std::dec << '\n';
  else
    std::cerr << " fault " << faultName(cause) << '\n';
}


bool
VPlic::read(uint64_t addr, unsigned size, uint64_t& value, FaultCause& cause)
{
  PlicMap::RegLocation loc;
  cause = FaultCause::None;

  if (size != 4)
    cause = FaultCause::InvalidWidth;
  else if (not containsAddr(addr) or not containsAddr(addr + size - 1))
    cause = FaultCause::Unmapped;
  else
    cause = PlicMap::classify(addr - base(), contexts_, loc);

  if (cause != FaultCause::None)
    {
      traceAccess("read", addr, loc, 0, cause);
      return false;
    }

  uint64_t offset = addr - base();
  uint64_t data = 0;
  bool ok = true;

  switch (loc.region)
    {
    case PlicMap::Region::Priority:
    case PlicMap::Region::Enable:
    case PlicMap::Region::Threshold:
      ok = host_.read(offset, size, data);
      if (not ok)
        cause = FaultCause::HostAccess;
      break;

    case PlicMap::Region::Pending:
      data = state_.pendingWord(loc.index);
      break;

    case PlicMap::Region::ClaimComplete:
      {
        uint32_t id = 0;
        ok = claim(loc.index, id, cause);
        data = id;
      }
      break;

    default:
      ok = false;
      cause = FaultCause::Unmapped;
      break;
    }

  traceAccess("read", addr, loc, data, cause);
  if (ok)
    value = data;
  return ok;
}


bool
VPlic::write(uint64_t addr, unsigned size, uint64_t value, FaultCause& cause)
{
  PlicMap::RegLocation loc;
  cause = FaultCause::None;

  if (size != 4)
    cause = FaultCause::InvalidWidth;
  else if (not containsAddr(addr) or not containsAddr(addr + size - 1))
    cause = FaultCause::Unmapped;
  else
    cause = PlicMap::classify(addr - base(), contexts_, loc);

  if (cause != FaultCause::None)
    {
      traceAccess("write", addr, loc, value, cause);
      return false;
    }

  uint64_t offset = addr - base();
  uint32_t data = static_cast<uint32_t>(value);
  bool ok = true;

  switch (loc.region)
    {
    case PlicMap::Region::Priority:
    case PlicMap::Region::Enable:
    case PlicMap::Region::Threshold:
      ok = host_.write(offset, size, data);
      if (not ok)
        cause = FaultCause::HostAccess;
      break;

    case PlicMap::Region::Pending:
      // Hypervisor injection path: bits are added, never cleared.
      state_.injectWord(loc.index, data);
      break;

    case PlicMap::Region::ClaimComplete:
      ok = complete(loc.index, data, cause);
      break;

    default:
      ok = false;
      cause = FaultCause::Unmapped;
      break;
    }

  traceAccess("write", addr, loc, data, cause);
  return ok;
}


bool
VPlic::claimCandidates(unsigned context, std::vector<unsigned>& candidates) const
{
  candidates.clear();

  SourceSet pending = state_.pendingSet();
  if (pending.none())
    return true;

  uint64_t threshold = 0;
  if (not host_.read(PlicMap::thresholdOffset(context), 4, threshold))
    return false;

  std::vector<std::pair<unsigned, uint32_t>> eligible;  // (id, priority)

  for (unsigned word = 0; word < PlicMap::PENDING_WORDS; ++word)
    {
      bool anyPending = false;
      for (unsigned i = 0; i < 32 and not anyPending; ++i)
        anyPending = pending.test(word*32 + i);
      if (not anyPending)
        continue;

      uint64_t enable = 0;
      if (not host_.read(PlicMap::enableOffset(context, word), 4, enable))
        return false;

      for (unsigned i = 0; i < 32; ++i)
        {
          unsigned id = word*32 + i;
          if (not IrqState::isValidId(id) or not pending.test(id) or ((enable >> i) & 1) == 0)
            continue;

          uint64_t priority = 0;
          if (not host_.read(PlicMap::priorityOffset(id), 4, priority))
            return false;
          if (static_cast<uint32_t>(priority) > static_cast<uint32_t>(threshold))
            eligible.emplace_back(id, static_cast<uint32_t>(priority));
        }
    }

  // Ids are in ascending order: a stable sort keeps the lowest id first among
  // equal priorities.
  std::stable_sort(eligible.begin(), eligible.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });

  candidates.reserve(eligible.size());
  for (const auto& entry : eligible)
    candidates.push_back(entry.first);

  return true;
}


bool
VPlic::claim(unsigned context, uint32_t& id, FaultCause& cause)
{
  id = 0;
  cause = FaultCause::None;

  if (context >= contexts_)
    {
      cause = FaultCause::InvalidContext;
      return false;
    }

  if (not filterClaims_)
    {
      id = state_.claimLowest();
      return true;
    }

  std::vector<unsigned> candidates;
  if (not claimCandidates(context, candidates))
    {
      cause = FaultCause::HostAccess;
      return false;
    }

  id = state_.claimFirstOf(candidates);
  return true;
}


bool
VPlic::complete(unsigned context, uint32_t id, FaultCause& cause)
{
  cause = FaultCause::None;

  if (context >= contexts_)
    {
      cause = FaultCause::InvalidContext;
      return false;
    }

  state_.complete(id);

  if (not host_.write(PlicMap::claimCompleteOffset(context), 4, id))
    {
      cause = FaultCause::HostAccess;
      return false;
    }

  return true;
}
