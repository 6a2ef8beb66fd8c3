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
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <vector>
#include <boost/program_options.hpp>


namespace TT_VPLIC
{

  struct VPlicParams;

  /// Parse/maintain arguments provided on the command line.
  struct Args
  {
    /// Parse command line arguments and collect option values. Return true on success and
    /// false on failure.
    bool parseCmdLineArgs(std::span<char*> argv);

    /// Parse command line arguments and collect option vlaues. Return true on success and
    /// false on failure.
    bool parseCmdLineArgs(std::vector<std::string>& args)
    {
      auto data = [](std::string& arg) { return arg.data(); };
      auto transform = args | std::views::transform(data);
      std::vector<char*> argv(transform.begin(), transform.end());
      return parseCmdLineArgs(std::span(argv));
    }

    /// Helper to parseCmdLineArgs.
    bool collectCommandLineValues(const boost::program_options::variables_map& varMap);

    /// Override the given device parameters with the values given on the command
    /// line.
    void applyTo(VPlicParams& params) const;

    /// Convert the command line string numberStr to a number using strotull and a base of
    /// zero (prefixes 0 and 0x are honored). A k, m or g suffix scales the number by
    /// 1024, 1024*1024 or 1024*1024*1024. Return true on success and false on failure
    /// (string does not represent a number). TYPE is an unsigned integer type (e.g
    /// uint32_t). Option is the command line option associated with the string and is
    /// used for diagnostic messages.
    template <typename TYPE>
    static bool
    parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                       TYPE& number);

    /// Adapter for the parseCmdLineNumber for optionals.
    template <typename TYPE>
    static bool
    parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                       std::optional<TYPE>& number);

    std::string configFile;                 // Configuration (JSON) file.
    std::string commandsFile;               // Command script, standard input if empty.

    std::optional<uint64_t> base;           // Guest physical address of device.
    std::optional<uint64_t> size;           // Size of device region.
    std::optional<unsigned> contexts;       // Number of interrupt contexts.
    std::optional<uint64_t> hostBase;       // Host PLIC physical address.

    bool help = false;
    bool version = false;
    bool noFilter = false;                  // Claim lowest pending id regardless of host state.
    bool verbose = false;
  };

}
