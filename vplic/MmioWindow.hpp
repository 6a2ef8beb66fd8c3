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
#include "HostPassthrough.hpp"

namespace TT_VPLIC
{

  /// Host-virtual mapping of a physical register window. Physical address
  /// physBase is visible to the host at virtBase. Accesses are volatile and
  /// of the exact requested width so they reach the device as issued.
  class MmioWindow
  {
  public:

    MmioWindow(uint64_t physBase, uint64_t size, void* virtBase)
      : physBase_(physBase), size_(size), virtBase_(static_cast<uint8_t*>(virtBase))
    { }

    uint64_t physBase() const { return physBase_; }
    uint64_t size() const     { return size_; }

    /// Return true if [addr, addr + size) lies within the window.
    bool contains(uint64_t addr, unsigned size) const
    {
      return addr >= physBase_ and size <= size_ and addr - physBase_ <= size_ - size;
    }

    /// Read size bytes (1, 2, 4 or 8) at the given physical address. Return
    /// false if the access is outside the window, misaligned, or of an
    /// unsupported size.
    bool read(uint64_t addr, unsigned size, uint64_t& data) const
    {
      if (not HostPassthrough::isValidSize(size) or (addr & (size - 1)) != 0)
        return false;
      if (not virtBase_ or not contains(addr, size))
        return false;

      // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      volatile uint8_t* ptr = virtBase_ + (addr - physBase_);

      // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
      switch (size)
        {
        case 1: data = *ptr; break;
        case 2: data = *reinterpret_cast<volatile uint16_t*>(ptr); break;
        case 4: data = *reinterpret_cast<volatile uint32_t*>(ptr); break;
        case 8: data = *reinterpret_cast<volatile uint64_t*>(ptr); break;
        default: return false;
        }
      // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
      return true;
    }

    /// Write size bytes (1, 2, 4 or 8) at the given physical address. See
    /// read for failure conditions.
    bool write(uint64_t addr, unsigned size, uint64_t data) const
    {
      if (not HostPassthrough::isValidSize(size) or (addr & (size - 1)) != 0)
        return false;
      if (not virtBase_ or not contains(addr, size))
        return false;

      // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      volatile uint8_t* ptr = virtBase_ + (addr - physBase_);

      // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
      switch (size)
        {
        case 1: *ptr = static_cast<uint8_t>(data); break;
        case 2: *reinterpret_cast<volatile uint16_t*>(ptr) = static_cast<uint16_t>(data); break;
        case 4: *reinterpret_cast<volatile uint32_t*>(ptr) = static_cast<uint32_t>(data); break;
        case 8: *reinterpret_cast<volatile uint64_t*>(ptr) = data; break;
        default: return false;
        }
      // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
      return true;
    }

    /// Make the given passthrough access the host through this window. The
    /// window must outlive the passthrough.
    void attach(HostPassthrough& passthrough) const
    {
      passthrough.setReadCb([this](uint64_t addr, unsigned size, uint64_t& data) {
        return read(addr, size, data);
      });
      passthrough.setWriteCb([this](uint64_t addr, unsigned size, uint64_t data) {
        return write(addr, size, data);
      });
    }

  private:

    uint64_t physBase_ = 0;
    uint64_t size_ = 0;
    uint8_t* virtBase_ = nullptr;
  };
}
