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
#include <iosfwd>
#include <memory>
#include "vplic/MmioBus.hpp"


namespace TT_VPLIC
{

  struct Args;
  class PlicConfig;
  class VPlic;
  class SimHostPlic;


  /// Model a session of the virtual PLIC driver: define the device from the
  /// command line and the configuration file, connect it to a host PLIC
  /// model and to the guest interrupt line, and run a command script.
  class Session
  {
  public:

    Session();

    ~Session();

    /// Define the virtual PLIC, the host PLIC model and the bus. Command
    /// line values override configuration values. Return null on failure.
    std::shared_ptr<VPlic> defineSystem(const Args& args, const PlicConfig& config);

    /// Run the commands of the file named in the arguments or of the
    /// standard input. Return true if all commands succeeded.
    bool run(const Args& args);

    /// Run the commands of the given stream writing results to out.
    bool runCommands(std::istream& in, std::ostream& out);

    /// Number of times the guest interrupt line changed level.
    uint64_t signalEdges() const
    { return signalEdges_; }

    /// Print the number of guest line changes and of completions forwarded
    /// to the host. Called at the end of a verbose run.
    void reportSummary(std::ostream& out) const;

  private:

    std::shared_ptr<VPlic> plic_;
    std::unique_ptr<SimHostPlic> host_;
    MmioBus bus_;
    bool signalLevel_ = false;
    uint64_t signalEdges_ = 0;
  };
}
