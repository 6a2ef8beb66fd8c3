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

#include "SimHostPlic.hpp"
#include "PlicMap.hpp"

using namespace TT_VPLIC;


bool
SimHostPlic::isClaimComplete(uint64_t wordAddr, unsigned& context) const
{
  PlicMap::RegLocation loc;
  auto cause = PlicMap::classify(wordAddr - base_, PlicMap::MAX_CONTEXTS, loc);
  if (cause != FaultCause::None or loc.region != PlicMap::Region::ClaimComplete)
    return false;
  context = loc.index;
  return true;
}


uint32_t
SimHostPlic::readWord(uint64_t wordAddr) const
{
  unsigned context = 0;
  if (isClaimComplete(wordAddr, context))
    return 0;

  auto iter = regs_.find(wordAddr);
  if (iter == regs_.end())
    return 0;
  return iter->second;
}


void
SimHostPlic::writeWord(uint64_t wordAddr, uint32_t value)
{
  unsigned context = 0;
  if (isClaimComplete(wordAddr, context))
    {
      completions_.push_back(Completion{context, value});
      return;
    }
  regs_[wordAddr] = value;
}


bool
SimHostPlic::read(uint64_t addr, unsigned size, uint64_t& data)
{
  if (not HostPassthrough::isValidSize(size) or (addr & (size - 1)) != 0)
    return false;
  if (not inRange(addr, size))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);

  if (size == 8)
    {
      uint64_t low = readWord(addr);
      uint64_t high = readWord(addr + 4);
      data = (high << 32) | low;
      return true;
    }

  uint64_t wordAddr = addr & ~uint64_t(3);
  unsigned shift = (addr - wordAddr) * 8;
  uint64_t mask = (size == 4) ? 0xffffffff : ((uint64_t(1) << (size*8)) - 1);
  data = (readWord(wordAddr) >> shift) & mask;
  return true;
}


bool
SimHostPlic::write(uint64_t addr, unsigned size, uint64_t data)
{
  if (not HostPassthrough::isValidSize(size) or (addr & (size - 1)) != 0)
    return false;
  if (not inRange(addr, size))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);

  if (size == 8)
    {
      writeWord(addr, static_cast<uint32_t>(data));
      writeWord(addr + 4, static_cast<uint32_t>(data >> 32));
      return true;
    }

  if (size == 4)
    {
      writeWord(addr, static_cast<uint32_t>(data));
      return true;
    }

  uint64_t wordAddr = addr & ~uint64_t(3);
  unsigned shift = (addr - wordAddr) * 8;
  uint32_t mask = ((uint32_t(1) << (size*8)) - 1) << shift;
  uint32_t word = readWord(wordAddr);
  word = (word & ~mask) | ((static_cast<uint32_t>(data) << shift) & mask);
  writeWord(wordAddr, word);
  return true;
}


uint32_t
SimHostPlic::peek(uint64_t addr) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto iter = regs_.find(addr & ~uint64_t(3));
  return iter == regs_.end() ? 0 : iter->second;
}


bool
SimHostPlic::poke(uint64_t addr, uint32_t value)
{
  if (not inRange(addr & ~uint64_t(3), 4))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  regs_[addr & ~uint64_t(3)] = value;
  return true;
}


std::vector<SimHostPlic::Completion>
SimHostPlic::completions() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return completions_;
}


void
SimHostPlic::clearCompletions()
{
  std::lock_guard<std::mutex> lock(mutex_);
  completions_.clear();
}


void
SimHostPlic::attach(HostPassthrough& passthrough)
{
  passthrough.setReadCb([this](uint64_t addr, unsigned size, uint64_t& data) {
    return read(addr, size, data);
  });
  passthrough.setWriteCb([this](uint64_t addr, unsigned size, uint64_t data) {
    return write(addr, size, data);
  });
}
