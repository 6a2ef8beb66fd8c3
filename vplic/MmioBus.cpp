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

#include <iostream>
#include "MmioBus.hpp"

using namespace TT_VPLIC;


bool
MmioBus::registerDevice(const std::shared_ptr<MmioDevice>& device)
{
  if (not device or device->size() == 0)
    {
      std::cerr << "Error: Cannot register an empty device\n";
      return false;
    }

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& dev : devices_)
    {
      if (dev->overlaps(device->base(), device->size()))
        {
          std::cerr << "Error: Device " << deviceTypeName(device->type()) << " at 0x"
                    << std::hex << device->base() << " overlaps device "
                    << deviceTypeName(dev->type()) << " at 0x" << dev->base()
                    << std::dec << '\n';
          return false;
        }
    }

  devices_.push_back(device);
  return true;
}


std::shared_ptr<MmioDevice>
MmioBus::findDevice(uint64_t addr) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& dev : devices_)
    if (dev->containsAddr(addr))
      return dev;
  return nullptr;
}


size_t
MmioBus::deviceCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}


void
MmioBus::reportFault(const char* tag, uint64_t addr, unsigned size,
                     const AccessResult& result) const
{
  if (not trace_ or result.ok)
    return;
  std::cerr << "Info: Guest " << tag << " access fault at 0x" << std::hex << addr
            << std::dec << " size " << size << ": " << faultName(result.cause) << '\n';
}


AccessResult
MmioBus::read(uint64_t addr, unsigned size) const
{
  AccessResult result;
  result.device = findDevice(addr);
  if (not result.device)
    {
      result.ok = false;
      result.cause = FaultCause::Unmapped;
    }
  else
    {
      uint64_t value = 0;
      result.ok = result.device->read(addr, size, value, result.cause);
      if (result.ok)
        result.value = value;
    }

  reportFault("load", addr, size, result);
  return result;
}


AccessResult
MmioBus::write(uint64_t addr, unsigned size, uint64_t value) const
{
  AccessResult result;
  result.device = findDevice(addr);
  if (not result.device)
    {
      result.ok = false;
      result.cause = FaultCause::Unmapped;
    }
  else
    result.ok = result.device->write(addr, size, value, result.cause);

  reportFault("store", addr, size, result);
  return result;
}
