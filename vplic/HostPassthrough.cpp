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
#include "HostPassthrough.hpp"

using namespace TT_VPLIC;


bool
HostPassthrough::checkAccess(const char* tag, uint64_t addr, unsigned size) const
{
  if (not isValidSize(size))
    {
      std::cerr << "Error: Host PLIC " << tag << ": invalid size " << size
                << " at address 0x" << std::hex << addr << std::dec << '\n';
      return false;
    }

  if ((addr & (size - 1)) != 0)
    {
      std::cerr << "Error: Host PLIC " << tag << ": misaligned address 0x"
                << std::hex << addr << std::dec << " for size " << size << '\n';
      return false;
    }

  return true;
}


bool
HostPassthrough::read(uint64_t offset, unsigned size, uint64_t& data) const
{
  uint64_t addr = hostAddr(offset);
  if (not checkAccess("read", addr, size))
    return false;

  if (not read_)
    {
      std::cerr << "Error: Host PLIC read: no host accessor defined\n";
      return false;
    }

  uint64_t value = 0;
  if (not read_(addr, size, value))
    {
      std::cerr << "Error: Host PLIC read failed at address 0x" << std::hex << addr
                << std::dec << '\n';
      return false;
    }

  data = value;
  return true;
}


bool
HostPassthrough::write(uint64_t offset, unsigned size, uint64_t data) const
{
  uint64_t addr = hostAddr(offset);
  if (not checkAccess("write", addr, size))
    return false;

  if (not write_)
    {
      std::cerr << "Error: Host PLIC write: no host accessor defined\n";
      return false;
    }

  if (not write_(addr, size, data))
    {
      std::cerr << "Error: Host PLIC write failed at address 0x" << std::hex << addr
                << std::dec << '\n';
      return false;
    }

  return true;
}
