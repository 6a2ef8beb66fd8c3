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
#include <functional>

namespace TT_VPLIC
{

  /// Read a host physical register: addr, size in bytes, value read. Return
  /// true on success.
  using HostReadCallback = std::function<bool(uint64_t addr, unsigned size, uint64_t& data)>;

  /// Write a host physical register: addr, size in bytes, value to write.
  /// Return true on success.
  using HostWriteCallback = std::function<bool(uint64_t addr, unsigned size, uint64_t data)>;


  /// Forward register accesses of the virtual PLIC to the host PLIC. The host
  /// controller is assumed to have the same layout as the virtual one: the
  /// register at offset x of the virtual device is at hostBase + x on the
  /// host. The object is not usable until the read/write callbacks are
  /// defined.
  class HostPassthrough
  {
  public:

    explicit HostPassthrough(uint64_t hostBase)
      : hostBase_(hostBase)
    { }

    uint64_t hostBase() const
    { return hostBase_; }

    /// Return the host physical address mirroring the given register offset.
    uint64_t hostAddr(uint64_t offset) const
    { return hostBase_ + offset; }

    void setReadCb(const HostReadCallback& cb)
    { read_ = cb; }

    void setWriteCb(const HostWriteCallback& cb)
    { write_ = cb; }

    /// Return true if both access callbacks are defined.
    bool connected() const
    { return read_ != nullptr and write_ != nullptr; }

    /// Return true if size is a supported access size (1, 2, 4 or 8).
    static bool isValidSize(unsigned size)
    { return size == 1 or size == 2 or size == 4 or size == 8; }

    /// Read the host register mirroring the given offset. Return true on
    /// success. Return false leaving data unmodified if size is not
    /// supported, if the host address is not aligned to size, if no read
    /// callback is defined or if the callback fails.
    bool read(uint64_t offset, unsigned size, uint64_t& data) const;

    /// Write the host register mirroring the given offset. Return true on
    /// success. See read for failure conditions.
    bool write(uint64_t offset, unsigned size, uint64_t data) const;

  private:

    bool checkAccess(const char* tag, uint64_t addr, unsigned size) const;

    uint64_t hostBase_ = 0;
    HostReadCallback read_ = nullptr;
    HostWriteCallback write_ = nullptr;
  };
}
