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

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <type_traits>
#include "Args.hpp"
#include "vplic/VPlic.hpp"


using namespace TT_VPLIC;


static
void
printVersion()
{
  unsigned version = 1;
  unsigned subversion = 4;
  std::cout << "Version " << version << "." << subversion << " compiled on "
            << __DATE__ << " at " << __TIME__ << '\n';
#ifdef GIT_SHA
  #define xstr(x) str(x)
  #define str(x) #x
  std::cout << "Git SHA: " << xstr(GIT_SHA) << '\n';
  #undef str
  #undef xstr
#endif
}


bool
Args::collectCommandLineValues(const boost::program_options::variables_map& varMap)
{
  bool ok = true;

  if (varMap.count("base"))
    {
      auto numStr = varMap["base"].as<std::string>();
      if (not parseCmdLineNumber("base", numStr, this->base))
        ok = false;
    }

  if (varMap.count("size"))
    {
      auto numStr = varMap["size"].as<std::string>();
      if (not parseCmdLineNumber("size", numStr, this->size))
        ok = false;
    }

  if (varMap.count("contexts"))
    {
      auto numStr = varMap["contexts"].as<std::string>();
      if (not parseCmdLineNumber("contexts", numStr, this->contexts))
        ok = false;
    }

  if (varMap.count("hostbase"))
    {
      auto numStr = varMap["hostbase"].as<std::string>();
      if (not parseCmdLineNumber("hostbase", numStr, this->hostBase))
        ok = false;
    }

  return ok;
}


void
Args::applyTo(VPlicParams& params) const
{
  if (base)
    params.base = *base;
  if (size)
    params.size = *size;
  if (contexts)
    params.contexts = *contexts;
  if (hostBase)
    params.hostBase = *hostBase;
  if (noFilter)
    params.filterClaims = false;
}


bool
Args::parseCmdLineArgs(std::span<char*> argv)
{
  try
    {
      // Define command line options.
      namespace po = boost::program_options;
      po::options_description desc("options");
      desc.add_options()
        ("help,h", po::bool_switch(&this->help),
         "Produce this message.")
        ("version", po::bool_switch(&this->version),
         "Print version.")
        ("config,c", po::value(&this->configFile),
         "Configuration file (JSON file with a \"vplic\" section defining the device).")
        ("base", po::value<std::string>(),
         "Guest physical address of the virtual PLIC. Overrides vplic.base.")
        ("size", po::value<std::string>(),
         "Size in bytes of the virtual PLIC region. Overrides vplic.size.")
        ("contexts", po::value<std::string>(),
         "Number of interrupt contexts (1 to 15872). Overrides vplic.contexts.")
        ("hostbase", po::value<std::string>(),
         "Physical address of the host PLIC, defaults to the guest address. Overrides "
         "vplic.host_base.")
        ("nofilter", po::bool_switch(&this->noFilter),
         "Claim the lowest pending source regardless of the enable, threshold and priority "
         "registers of the claiming context.")
        ("commands", po::value(&this->commandsFile),
         "File of commands to execute. Commands are read from the standard input if this "
         "option is not used.")
        ("verbose,v", po::bool_switch(&this->verbose),
         "Be verbose: trace guest accesses and faults.");

      // Define positional options.
      po::positional_options_description pdesc;
      pdesc.add("commands", 1);

      // Parse command line options.
      po::variables_map varMap;
      po::command_line_parser parser(static_cast<int>(argv.size()), argv.data());
      auto parsed = parser.options(desc).positional(pdesc).run();
      po::store(parsed, varMap);
      po::notify(varMap);

      bool earlyExit = false;
      if (this->version)
        {
          printVersion();
          earlyExit = true;
        }

      if (this->help)
        {
          std::cout <<
            "Emulate a virtual PLIC for a guest and drive it with the commands read from\n"
            "the given file or from the standard input (one command per line, see the\n"
            "help command). All numeric arguments are interpreted as hexadecimal numbers\n"
            "when prefixed with 0x.\n"
            "Examples:\n"
            "  vplic --config sys.json script.txt\n"
            "  vplic --base 0xc000000 --size 0x4000000 --contexts 2 --verbose\n\n";
          std::cout << desc;
          earlyExit = true;
        }

      if (earlyExit)
        return true;

      if (not this->collectCommandLineValues(varMap))
        return false;
    }

  catch (std::exception& exp)
    {
      std::cerr << "Error: Failed to parse command line args: " << exp.what() << '\n';
      return false;
    }

  return true;
}


template <typename TYPE>
bool
Args::parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                         TYPE& number)
{
  static_assert(std::is_unsigned_v<TYPE>);

  std::string str = numberStr;
  bool good = not str.empty();
  uint64_t scale = 1;
  if (good)
    {
      char suffix = static_cast<char>(std::tolower(str.back()));
      if (suffix == 'k')
        scale = 1024;
      else if (suffix == 'm')
        scale = UINT64_C(1024)*1024;
      else if (suffix == 'g')
        scale = UINT64_C(1024)*1024*1024;
      if (scale != 1)
        {
          str = str.substr(0, str.length() - 1);
          if (str.empty())
            good = false;
        }
    }

  if (good and str.front() == '-')
    good = false;

  if (good)
    {
      char* end = nullptr;
      uint64_t val = strtoull(str.c_str(), &end, 0);
      uint64_t scaled = val * scale;
      number = static_cast<TYPE>(scaled);
      if ((scale != 1 and scaled / scale != val) or number != scaled)
        {
          std::cerr << "Error: parseCmdLineNumber: Number too large: " << numberStr
                    << '\n';
          return false;
        }
      if (end and *end)
        good = false;  // Part of the string are non parseable.
    }

  if (not good)
    std::cerr << "Error: Invalid command line " << option << " value: " << numberStr
              << '\n';
  return good;
}


template <typename TYPE>
bool
Args::parseCmdLineNumber(const std::string& option, const std::string& numberStr,
                         std::optional<TYPE>& number)
{
  TYPE n;
  if (not parseCmdLineNumber(option, numberStr, n))
    return false;
  number = n;
  return true;
}


template bool
Args::parseCmdLineNumber(const std::string&, const std::string&, uint64_t&);

template bool
Args::parseCmdLineNumber(const std::string&, const std::string&, unsigned&);
