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
#include <span>
#include "Args.hpp"
#include "PlicConfig.hpp"
#include "Session.hpp"


using namespace TT_VPLIC;


static
bool
session(const Args& args, const PlicConfig& config)
{
  Session session;

  if (not session.defineSystem(args, config))
    return false;

  return session.run(args);
}


int
main(int argc, char* argv[])
{
  Args args;
  if (not args.parseCmdLineArgs(std::span(argv, argc)))
    return 1;

  if (args.help or args.version)
    return 0;

  PlicConfig config;
  if (not args.configFile.empty())
    if (not config.loadConfigFile(args.configFile))
      return 1;

  bool ok = session(args, config);
  return ok ? 0 : 1;
}
