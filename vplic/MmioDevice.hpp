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
#include <string_view>
#include "Fault.hpp"

namespace TT_VPLIC
{

  /// Class tag reported by an emulated device to the dispatch layer.
  enum class DeviceType : uint32_t
    {
      PlicGlobal,   // Virtual PLIC, global (non per-hart) part.
    };


  constexpr std::string_view
  deviceTypeName(DeviceType type)
  {
    switch (type)
      {
      case DeviceType::PlicGlobal: return "plic-global";
      }
    return "unknown";
  }


  /// Emulated memory mapped device occupying the guest physical range
  /// [base, base + size - 1]. Trapped guest accesses within that range are
  /// delivered to read/write with absolute guest physical addresses.
  class MmioDevice
  {
  public:

    MmioDevice(uint64_t base, uint64_t size)
      : base_(base), size_(size)
    { }

    virtual ~MmioDevice() = default;

    MmioDevice(const MmioDevice&) = delete;
    MmioDevice& operator=(const MmioDevice&) = delete;

    virtual DeviceType type() const = 0;

    uint64_t base() const { return base_; }
    uint64_t size() const { return size_; }

    bool containsAddr(uint64_t addr) const
    { return addr >= base_ and addr - base_ < size_; }

    bool overlaps(uint64_t base, uint64_t size) const
    { return (base < (base_ + size_)) and (base_ < (base + size)); }

    /// Handle a guest read of size bytes at addr. Return true on success
    /// setting value. Return false setting cause if the access is rejected.
    virtual bool read(uint64_t addr, unsigned size, uint64_t& value, FaultCause& cause) = 0;

    /// Handle a guest write of size bytes at addr. Return true on success.
    /// Return false setting cause if the access is rejected.
    virtual bool write(uint64_t addr, unsigned size, uint64_t value, FaultCause& cause) = 0;

  private:

    uint64_t base_ = 0;
    uint64_t size_ = 0;
  };
}
