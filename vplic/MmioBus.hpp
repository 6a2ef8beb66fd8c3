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
#include <memory>
#include <mutex>
#include <vector>
#include "MmioDevice.hpp"

namespace TT_VPLIC
{

  /// Outcome of a guest access routed through the bus. A fault is to be
  /// delivered to the guest as an access fault at the faulting address.
  struct AccessResult
  {
    bool ok = true;
    FaultCause cause = FaultCause::None;
    uint64_t value = 0;                        // Value read (reads only).
    std::shared_ptr<MmioDevice> device;        // Device hit or null.
  };


  /// Route trapped guest MMIO accesses to the registered devices by address
  /// range.
  class MmioBus
  {
  public:

    /// Register the given device. Return false if it overlaps an already
    /// registered device or has an empty range.
    bool registerDevice(const std::shared_ptr<MmioDevice>& device);

    /// Return the device covering the given address or null.
    std::shared_ptr<MmioDevice> findDevice(uint64_t addr) const;

    size_t deviceCount() const;

    /// Deliver a guest read. An access that hits no device faults with
    /// FaultCause::Unmapped.
    AccessResult read(uint64_t addr, unsigned size) const;

    /// Deliver a guest write. An access that hits no device faults with
    /// FaultCause::Unmapped.
    AccessResult write(uint64_t addr, unsigned size, uint64_t value) const;

    /// Print faults as they are delivered.
    void enableTrace(bool flag)
    { trace_ = flag; }

  private:

    void reportFault(const char* tag, uint64_t addr, unsigned size,
                     const AccessResult& result) const;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<MmioDevice>> devices_;
    bool trace_ = false;
  };
}
