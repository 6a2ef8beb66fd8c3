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

namespace TT_VPLIC
{

  /// Reason a guest access to the virtual PLIC was rejected. The dispatcher
  /// turns it into a guest-visible access fault. Except for HostAccess, a
  /// rejected access leaves the interrupt state unchanged.
  enum class FaultCause : uint32_t
    {
      None           = 0,
      InvalidWidth   = 1,    // Access size is not 4 bytes.
      InvalidContext = 2,    // Decoded context id >= number of contexts.
      Unmapped       = 3,    // Offset matches no register.
      HostAccess     = 4     // Host controller access reported failure.
    };


  /// Return a printable name for the given fault cause.
  constexpr std::string_view
  faultName(FaultCause cause)
  {
    switch (cause)
      {
      case FaultCause::None:           return "none";
      case FaultCause::InvalidWidth:   return "invalid-width";
      case FaultCause::InvalidContext: return "invalid-context";
      case FaultCause::Unmapped:       return "unmapped";
      case FaultCause::HostAccess:     return "host-access";
      }
    return "unknown";
  }
}
