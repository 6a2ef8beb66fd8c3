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

#include <fstream>
#include <iostream>
#include <stdexcept>
#include "Args.hpp"
#include "Interactive.hpp"
#include "PlicConfig.hpp"
#include "Session.hpp"
#include "vplic/SimHostPlic.hpp"
#include "vplic/VPlic.hpp"


using namespace TT_VPLIC;


Session::Session() = default;


Session::~Session() = default;


std::shared_ptr<VPlic>
Session::defineSystem(const Args& args, const PlicConfig& config)
{
  VPlicParams params;
  bool trace = false;

  if (not config.applyConfig(params, trace))
    return nullptr;
  args.applyTo(params);
  trace = trace or args.verbose;

  try
    {
      plic_ = std::make_shared<VPlic>(params);
    }
  catch (const std::invalid_argument& e)
    {
      std::cerr << "Error: Failed to define virtual PLIC: " << e.what() << '\n';
      return nullptr;
    }

  // Without hardware the host PLIC is a software model with the layout of
  // the guest device.
  host_ = std::make_unique<SimHostPlic>(plic_->hostBase(), plic_->size());
  host_->attach(plic_->host());

  plic_->setSignalCallback([this, trace](bool level) {
    if (level != signalLevel_)
      {
        signalEdges_++;
        if (trace)
          std::cerr << "Info: Guest external interrupt "
                    << (level ? "asserted" : "deasserted") << '\n';
      }
    signalLevel_ = level;
  });

  plic_->enableTrace(trace);
  bus_.enableTrace(trace);

  if (not bus_.registerDevice(plic_))
    return nullptr;

  if (args.verbose)
    std::cerr << "Info: Virtual PLIC at 0x" << std::hex << plic_->base() << " size 0x"
              << plic_->size() << " host 0x" << plic_->hostBase() << std::dec
              << " contexts " << plic_->contextCount()
              << (plic_->filtersClaims() ? "" : " unfiltered") << '\n';

  return plic_;
}


bool
Session::runCommands(std::istream& in, std::ostream& out)
{
  if (not plic_)
    {
      std::cerr << "Error: No virtual PLIC defined\n";
      return false;
    }

  Interactive interactive(*plic_, bus_, host_.get(), out);
  return interactive.interact(in);
}


bool
Session::run(const Args& args)
{
  bool ok = false;

  if (args.commandsFile.empty())
    ok = runCommands(std::cin, std::cout);
  else
    {
      std::ifstream ifs(args.commandsFile);
      if (not ifs)
        {
          std::cerr << "Error: Failed to open " << args.commandsFile << " for reading\n";
          return false;
        }
      ok = runCommands(ifs, std::cout);
    }

  if (args.verbose)
    reportSummary(std::cerr);

  return ok;
}


void
Session::reportSummary(std::ostream& out) const
{
  out << "Info: Guest external interrupt changed level " << signalEdges_ << " time"
      << (signalEdges_ == 1 ? "" : "s");
  if (host_)
    out << ", " << host_->completions().size() << " completion(s) forwarded to host";
  out << '\n';
}
