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

#include <cstdlib>
#include <iostream>
#include <istream>
#include <boost/format.hpp>
#include <boost/algorithm/string.hpp>
#include "Interactive.hpp"
#include "vplic/VPlic.hpp"
#include "vplic/MmioBus.hpp"
#include "vplic/SimHostPlic.hpp"


using namespace TT_VPLIC;
using std::cerr;


/// Convert the string numberStr to a number using strotull and a base
/// of zero (prefixes 0 and 0x are honored). Return true on success and
/// false on failure (string does not represent a number). TYPE is an
/// integer type (e.g uint32_t). Option is the command item associated
/// with the string and is used for diagnostic messages.
template <typename TYPE>
static
bool
parseCmdLineNumber(const std::string& option,
                   const std::string& numberStr,
                   TYPE& number)
{
  bool good = not numberStr.empty() and numberStr.front() != '-';

  if (good)
    {
      char* end = nullptr;
      uint64_t value = strtoull(numberStr.c_str(), &end, 0);
      number = static_cast<TYPE>(value);
      if (number != value)
        {
          cerr << "Error: parseCmdLineNumber: Number too large: " << numberStr << '\n';
          return false;
        }
      if (end and *end)
        good = false;  // Part of the string are non parseable.
    }

  if (not good)
    cerr << "Error: Invalid " << option << " value: " << numberStr << '\n';
  return good;
}


/// Remove the keyword=value tokens from the given vector and put them in the
/// given map.
static
void
extractKeywords(Interactive::StringVec& tokens, Interactive::StringMap& strMap)
{
  Interactive::StringVec remaining;
  for (const auto& token : tokens)
    {
      auto eqIx = token.find('=');
      if (eqIx == std::string::npos or eqIx == 0)
        {
          remaining.push_back(token);
          continue;
        }
      strMap[token.substr(0, eqIx)] = token.substr(eqIx + 1);
    }
  tokens.swap(remaining);
}


/// Print the ids of the sources in the given set separated by spaces.
static
void
printSourceSet(std::ostream& out, const char* tag, const SourceSet& set)
{
  out << tag << ':';
  for (unsigned id = 0; id < set.size(); ++id)
    if (set.test(id))
      out << ' ' << id;
  out << '\n';
}


Interactive::Interactive(VPlic& plic, MmioBus& bus, SimHostPlic* host, std::ostream& out)
  : plic_(plic), bus_(bus), host_(host), out_(out)
{
}


bool
Interactive::accessSize(const StringMap& keywords, unsigned& size)
{
  size = 4;
  for (const auto& [key, value] : keywords)
    {
      if (key != "size")
        {
          cerr << "Error: Unknown keyword: " << key << '\n';
          return false;
        }
      if (not parseCmdLineNumber("size", value, size))
        return false;
    }
  return true;
}


void
Interactive::printFault(const char* tag, uint64_t addr, FaultCause cause)
{
  out_ << "fault " << tag << ' ' << (boost::format("0x%x") % addr) << ": "
       << faultName(cause) << '\n';
}


bool
Interactive::readCommand(const std::string& line, const StringVec& tokens,
                         const StringMap& keywords)
{
  if (tokens.size() != 2)
    {
      cerr << "Error: Invalid read command: " << line << '\n';
      cerr << "Error: Expecting: read <addr> [size=<n>]\n";
      return false;
    }

  uint64_t addr = 0;
  unsigned size = 4;
  if (not parseCmdLineNumber("address", tokens.at(1), addr) or
      not accessSize(keywords, size))
    return false;

  auto result = bus_.read(addr, size);
  if (result.ok)
    out_ << (boost::format("0x%08x") % result.value) << '\n';
  else
    printFault("load", addr, result.cause);
  return true;
}


bool
Interactive::writeCommand(const std::string& line, const StringVec& tokens,
                          const StringMap& keywords)
{
  if (tokens.size() != 3)
    {
      cerr << "Error: Invalid write command: " << line << '\n';
      cerr << "Error: Expecting: write <addr> <value> [size=<n>]\n";
      return false;
    }

  uint64_t addr = 0, value = 0;
  unsigned size = 4;
  if (not parseCmdLineNumber("address", tokens.at(1), addr) or
      not parseCmdLineNumber("value", tokens.at(2), value) or
      not accessSize(keywords, size))
    return false;

  auto result = bus_.write(addr, size, value);
  if (not result.ok)
    printFault("store", addr, result.cause);
  return true;
}


bool
Interactive::injectCommand(const std::string& line, const StringVec& tokens)
{
  if (tokens.size() < 2)
    {
      cerr << "Error: Invalid inject command: " << line << '\n';
      cerr << "Error: Expecting: inject <id> ...\n";
      return false;
    }

  unsigned errors = 0;
  for (size_t i = 1; i < tokens.size(); ++i)
    {
      unsigned id = 0;
      if (not parseCmdLineNumber("source id", tokens.at(i), id))
        errors++;
      else if (not plic_.inject(id))
        {
          cerr << "Error: Invalid source id: " << tokens.at(i) << '\n';
          errors++;
        }
    }
  return errors == 0;
}


bool
Interactive::claimCommand(const std::string& line, const StringVec& tokens)
{
  if (tokens.size() != 2)
    {
      cerr << "Error: Invalid claim command: " << line << '\n';
      cerr << "Error: Expecting: claim <context>\n";
      return false;
    }

  unsigned context = 0;
  if (not parseCmdLineNumber("context", tokens.at(1), context))
    return false;

  uint32_t id = 0;
  FaultCause cause = FaultCause::None;
  if (not plic_.claim(context, id, cause))
    {
      cerr << "Error: Claim failed for context " << context << ": " << faultName(cause) << '\n';
      return false;
    }

  out_ << id << '\n';
  return true;
}


bool
Interactive::completeCommand(const std::string& line, const StringVec& tokens)
{
  if (tokens.size() != 3)
    {
      cerr << "Error: Invalid complete command: " << line << '\n';
      cerr << "Error: Expecting: complete <context> <id>\n";
      return false;
    }

  unsigned context = 0;
  uint32_t id = 0;
  if (not parseCmdLineNumber("context", tokens.at(1), context) or
      not parseCmdLineNumber("source id", tokens.at(2), id))
    return false;

  FaultCause cause = FaultCause::None;
  if (not plic_.complete(context, id, cause))
    {
      cerr << "Error: Complete failed for context " << context << ": " << faultName(cause)
           << '\n';
      return false;
    }
  return true;
}


bool
Interactive::peekCommand(const std::string& line, const StringVec& tokens)
{
  if (tokens.size() < 2)
    {
      cerr << "Error: Invalid peek command: " << line << '\n';
      cerr << "Error: Expecting: peek <item> <id>  or  peek signal  or  peek host <addr>\n";
      cerr << "Error:   Item is one of pending, active, assigned or deferred\n";
      cerr << "Error:   example:  peek pending 5\n";
      cerr << "Error:   example:  peek host 0xc000004\n";
      return false;
    }

  const std::string& resource = tokens.at(1);
  const IrqState& state = plic_.state();

  if (resource == "signal")
    {
      out_ << (state.signalAsserted() ? 1 : 0) << '\n';
      return true;
    }

  if (tokens.size() != 3)
    {
      cerr << "Error: Invalid peek command: " << line << '\n';
      return false;
    }

  if (resource == "host")
    {
      if (not host_)
        {
          cerr << "Error: No host PLIC model\n";
          return false;
        }
      uint64_t addr = 0;
      if (not parseCmdLineNumber("address", tokens.at(2), addr))
        return false;
      out_ << (boost::format("0x%08x") % host_->peek(addr)) << '\n';
      return true;
    }

  unsigned id = 0;
  if (not parseCmdLineNumber("source id", tokens.at(2), id))
    return false;
  if (id >= PlicMap::NUM_SOURCES)
    {
      cerr << "Error: Source id out of bounds: " << id << '\n';
      return false;
    }

  bool flag = false;
  if (resource == "pending")
    flag = state.isPending(id);
  else if (resource == "active")
    flag = state.isActive(id);
  else if (resource == "assigned")
    flag = state.isAssigned(id);
  else if (resource == "deferred")
    flag = state.isDeferred(id);
  else
    {
      cerr << "Error: Invalid peek item: " << resource << '\n';
      return false;
    }

  out_ << (flag ? 1 : 0) << '\n';
  return true;
}


bool
Interactive::pokeCommand(const std::string& line, const StringVec& tokens)
{
  if (tokens.size() != 4 or tokens.at(1) != "host")
    {
      cerr << "Error: Invalid poke command: " << line << '\n';
      cerr << "Error: Expecting: poke host <addr> <value>\n";
      return false;
    }

  if (not host_)
    {
      cerr << "Error: No host PLIC model\n";
      return false;
    }

  uint64_t addr = 0;
  uint32_t value = 0;
  if (not parseCmdLineNumber("address", tokens.at(2), addr) or
      not parseCmdLineNumber("value", tokens.at(3), value))
    return false;

  if (not host_->poke(addr, value))
    {
      cerr << "Error: Address out of host PLIC bounds: " << tokens.at(2) << '\n';
      return false;
    }
  return true;
}


void
Interactive::stateCommand()
{
  const IrqState& state = plic_.state();
  printSourceSet(out_, "pending", state.pendingSet());
  printSourceSet(out_, "active", state.activeSet());
  printSourceSet(out_, "assigned", state.assignedSet());
  out_ << "signal: " << (state.signalAsserted() ? 1 : 0) << '\n';
}


void
Interactive::helpCommand()
{
  out_ << "The arguments in <> are mandatory and the ones in [] are optional.\n";
  out_ << "Numbers are decimal or hexadecimal if prefixed with 0x.\n\n";
  out_ << "help\n";
  out_ << "  Print help message.\n\n";
  out_ << "read <addr> [size=<n>]\n";
  out_ << "  Guest load of n bytes (default 4) at the given address.\n\n";
  out_ << "write <addr> <value> [size=<n>]\n";
  out_ << "  Guest store of n bytes (default 4) at the given address.\n\n";
  out_ << "inject <id> ...\n";
  out_ << "  Make the given sources pending and assert the guest interrupt line.\n\n";
  out_ << "claim <context>\n";
  out_ << "  Claim the next source for the given context and print its id (0 if none).\n\n";
  out_ << "complete <context> <id>\n";
  out_ << "  Complete the given source and forward the completion to the host.\n\n";
  out_ << "peek <item> <id>\n";
  out_ << "  Print 1 if the given source is in the pending, active or assigned set.\n";
  out_ << "  Item is one of pending, active or assigned.\n\n";
  out_ << "peek deferred <id>\n";
  out_ << "  Print 1 if a request for the given active source is waiting for its completion.\n\n";
  out_ << "peek signal\n";
  out_ << "  Print the level of the guest external interrupt line.\n\n";
  out_ << "peek host <addr>\n";
  out_ << "  Print the host PLIC register at the given address.\n\n";
  out_ << "poke host <addr> <value>\n";
  out_ << "  Set the host PLIC register at the given address.\n\n";
  out_ << "state\n";
  out_ << "  Print the pending, active and assigned sources.\n\n";
  out_ << "reset\n";
  out_ << "  Clear the pending, active and deferred sources.\n\n";
  out_ << "quit\n";
  out_ << "  Terminate.\n";
}


bool
Interactive::executeLine(const std::string& inLine, bool& done)
{
  // Remove comments (anything starting with #).
  std::string line = inLine;
  auto sharpIx = line.find_first_of('#');
  if (sharpIx != std::string::npos)
    line = line.substr(0, sharpIx);

  // Remove leading/trailing white space
  boost::algorithm::trim_if(line, boost::is_any_of(" \t\r"));

  if (line.empty())
    return true;

  // Break line into tokens.
  StringVec tokens;
  boost::split(tokens, line, boost::is_any_of(" \t"),
               boost::token_compress_on);
  if (tokens.empty())
    return true;

  StringMap strMap;
  extractKeywords(tokens, strMap);
  if (tokens.empty())
    {
      cerr << "Error: Missing command: " << line << '\n';
      return false;
    }

  const std::string& command = tokens.front();
  if (command == "q" or command == "quit")
    {
      done = true;
      return true;
    }

  if (command == "read")
    return readCommand(line, tokens, strMap);

  if (command == "write")
    return writeCommand(line, tokens, strMap);

  if (not strMap.empty())
    {
      cerr << "Error: Unexpected keyword in command: " << line << '\n';
      return false;
    }

  if (command == "inject")
    return injectCommand(line, tokens);

  if (command == "claim")
    return claimCommand(line, tokens);

  if (command == "complete")
    return completeCommand(line, tokens);

  if (command == "peek")
    return peekCommand(line, tokens);

  if (command == "poke")
    return pokeCommand(line, tokens);

  if (command == "state")
    {
      stateCommand();
      return true;
    }

  if (command == "reset")
    {
      plic_.reset();
      return true;
    }

  if (command == "h" or command == "help")
    {
      helpCommand();
      return true;
    }

  cerr << "Error: No such command: " << line << '\n';
  return false;
}


bool
Interactive::interact(std::istream& in)
{
  uint64_t errors = 0;
  std::string line;

  bool done = false;
  while (not done and std::getline(in, line))
    if (not executeLine(line, done))
      errors++;

  return errors == 0;
}
