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

#include "IrqState.hpp"

using namespace TT_VPLIC;


bool
IrqState::isPending(unsigned id) const
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.test(id);
}


bool
IrqState::isActive(unsigned id) const
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return active_.test(id);
}


bool
IrqState::isAssigned(unsigned id) const
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return assigned_.test(id);
}


bool
IrqState::isDeferred(unsigned id) const
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  return deferred_.test(id);
}


bool
IrqState::setPending(unsigned id, bool flag)
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (flag)
    request(id);
  else
    pending_.reset(id);
  return true;
}


bool
IrqState::setActive(unsigned id, bool flag)
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  active_.set(id, flag);
  if (flag)
    pending_.reset(id);
  return true;
}


bool
IrqState::setAssigned(unsigned id, bool flag)
{
  if (not isValidId(id))
    return false;
  std::lock_guard<std::mutex> lock(mutex_);
  assigned_.set(id, flag);
  return true;
}


std::optional<unsigned>
IrqState::lowestPending() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.none())
    return std::nullopt;
  for (unsigned id = 1; id < PlicMap::NUM_SOURCES; ++id)
    if (pending_.test(id))
      return id;
  return std::nullopt;
}


bool
IrqState::pendingEmpty() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.none();
}


uint32_t
IrqState::pendingWord(unsigned word) const
{
  if (word >= PlicMap::PENDING_WORDS)
    return 0;

  std::lock_guard<std::mutex> lock(mutex_);
  uint32_t value = 0;
  for (unsigned i = 0; i < 32; ++i)
    if (pending_.test(word*32 + i))
      value |= uint32_t(1) << i;
  return value;
}


SourceSet
IrqState::pendingSet() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_;
}


SourceSet
IrqState::activeSet() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}


SourceSet
IrqState::assignedSet() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return assigned_;
}


SourceSet
IrqState::deferredSet() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return deferred_;
}


bool
IrqState::signalAsserted() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return signalLevel_;
}


void
IrqState::driveSignal(bool level)
{
  signalLevel_ = level;
  if (signal_)
    signal_(level);
}


void
IrqState::request(unsigned id)
{
  if (active_.test(id))
    deferred_.set(id);
  else
    pending_.set(id);
}


void
IrqState::injectWord(unsigned word, uint32_t bits)
{
  if (word >= PlicMap::PENDING_WORDS)
    return;

  std::lock_guard<std::mutex> lock(mutex_);
  for (unsigned i = 0; i < 32; ++i)
    {
      unsigned id = word*32 + i;
      if (((bits >> i) & 1) and isValidId(id))
        request(id);
    }

  if (pending_.any())
    driveSignal(true);
}


bool
IrqState::inject(unsigned id)
{
  if (not isValidId(id))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);
  request(id);
  if (pending_.test(id))
    driveSignal(true);
  return true;
}


unsigned
IrqState::claimLowest()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (unsigned id = 1; id < PlicMap::NUM_SOURCES; ++id)
    {
      if (pending_.test(id))
        {
          pending_.reset(id);
          active_.set(id);
          return id;
        }
    }
  return 0;
}


unsigned
IrqState::claimFirstOf(std::span<const unsigned> candidates)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (unsigned id : candidates)
    {
      if (isValidId(id) and pending_.test(id))
        {
          pending_.reset(id);
          active_.set(id);
          return id;
        }
    }
  return 0;
}


bool
IrqState::complete(unsigned id)
{
  std::lock_guard<std::mutex> lock(mutex_);

  bool wasActive = isValidId(id) and active_.test(id);
  if (wasActive)
    {
      active_.reset(id);
      if (deferred_.test(id))
        {
          deferred_.reset(id);
          pending_.set(id);
          driveSignal(true);
        }
    }

  if (pending_.none())
    driveSignal(false);

  return wasActive;
}


void
IrqState::reset()
{
  std::lock_guard<std::mutex> lock(mutex_);
  pending_.reset();
  active_.reset();
  deferred_.reset();
  driveSignal(false);
}
