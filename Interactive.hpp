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
#include <string>
#include <unordered_map>
#include <vector>
#include "vplic/Fault.hpp"


namespace TT_VPLIC
{

  class VPlic;
  class MmioBus;
  class SimHostPlic;


  /// Execute commands driving a virtual PLIC: guest accesses routed through
  /// the bus and hypervisor actions applied to the device. Results go to the
  /// output stream given at construction, diagnostics to the standard error
  /// stream.
  class Interactive
  {
  public:

    using StringVec = std::vector<std::string>;
    using StringMap = std::unordered_map<std::string, std::string>;

    /// The host model may be null in which case the peek/poke host commands
    /// fail.
    Interactive(VPlic& plic, MmioBus& bus, SimHostPlic* host, std::ostream& out);

    /// Read commands from the given stream until end of file or a quit
    /// command. Return true if all commands succeeded and false otherwise.
    bool interact(std::istream& in);

    /// Execute the given command line. Set done to true if the command is a
    /// quit command. Return true on success and false on failure.
    bool executeLine(const std::string& line, bool& done);

    /// Print the available commands.
    void helpCommand();

  private:

    bool readCommand(const std::string& line, const StringVec& tokens,
                     const StringMap& keywords);

    bool writeCommand(const std::string& line, const StringVec& tokens,
                      const StringMap& keywords);

    bool injectCommand(const std::string& line, const StringVec& tokens);

    bool claimCommand(const std::string& line, const StringVec& tokens);

    bool completeCommand(const std::string& line, const StringVec& tokens);

    bool peekCommand(const std::string& line, const StringVec& tokens);

    bool pokeCommand(const std::string& line, const StringVec& tokens);

    void stateCommand();

    /// Get the access size from the size=N keyword. Default is 4.
    static bool accessSize(const StringMap& keywords, unsigned& size);

    /// Print the fault of a guest access.
    void printFault(const char* tag, uint64_t addr, FaultCause cause);

    VPlic& plic_;
    MmioBus& bus_;
    SimHostPlic* host_ = nullptr;
    std::ostream& out_;
  };

}
