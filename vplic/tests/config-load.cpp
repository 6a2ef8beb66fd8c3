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

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include "PlicConfig.hpp"
#include "Args.hpp"
#include "VPlic.hpp"

using namespace TT_VPLIC;

void testValidConfig()
{
    std::cout << "\n=== Valid configuration ===" << '\n';

    PlicConfig config;
    bool ok = config.loadConfigText(R"({
        // Comments are allowed.
        "vplic" : {
            "base" : "0xc000000",
            "size" : 67108864,
            "contexts" : 4,
            "host_base" : "0x40000000",
            "filter_claims" : "false",
            "assigned_irqs" : [ 1, "0x20", 7 ],
            "trace" : true
        }
    })");
    assert(ok);
    assert(config.hasDevice());

    VPlicParams params;
    bool trace = false;
    assert(config.applyConfig(params, trace));
    assert(params.base == 0xc000000);
    assert(params.size.has_value() and *params.size == 0x4000000);
    assert(params.contexts == 4);
    assert(params.hostBase.has_value() and *params.hostBase == 0x40000000);
    assert(not params.filterClaims);
    assert((params.assignedIrqs == std::vector<unsigned>{ 1, 32, 7 }));
    assert(trace);

    VPlic plic(params);
    assert(plic.contextCount() == 4);
    assert(plic.state().isAssigned(32));

    std::cout << "✓ All vplic entries applied" << '\n';
}

void testMissingSection()
{
    std::cout << "\n=== Missing section ===" << '\n';

    PlicConfig config;
    assert(config.loadConfigText("{ \"other\" : 1 }"));
    assert(not config.hasDevice());

    VPlicParams params;
    params.base = 0x1234;
    bool trace = false;
    assert(config.applyConfig(params, trace));
    assert(params.base == 0x1234);
    assert(not params.size.has_value());

    std::cout << "✓ Parameters left unmodified" << '\n';
}

void testInvalidValues()
{
    std::cout << "\n=== Invalid values ===" << '\n';

    const char* bad[] = {
        R"({ "vplic" : { "base" : "0xzz" } })",
        R"({ "vplic" : { "size" : -4 } })",
        R"({ "vplic" : { "contexts" : "many" } })",
        R"({ "vplic" : { "contexts" : 8589934592 } })",
        R"({ "vplic" : { "filter_claims" : "maybe" } })",
        R"({ "vplic" : { "assigned_irqs" : 5 } })",
        R"({ "vplic" : { "assigned_irqs" : [ 1, "x" ] } })",
        R"({ "vplic" : 7 })",
    };

    for (const char* text : bad)
    {
        PlicConfig config;
        assert(config.loadConfigText(text));
        VPlicParams params;
        bool trace = false;
        assert(not config.applyConfig(params, trace));
    }

    PlicConfig config;
    assert(not config.loadConfigText("{ \"vplic\" : "));
    assert(not config.loadConfigText("[ 1, 2 ]"));

    std::cout << "✓ Bad entries reported" << '\n';
}

void testConfigFile()
{
    std::cout << "\n=== Configuration file ===" << '\n';

    std::string path = "config-load-test.json";
    {
        std::ofstream ofs(path);
        ofs << "{ \"vplic\" : { \"base\" : 4096, \"size\" : \"0x400000\" } }\n";
    }

    PlicConfig config;
    assert(config.loadConfigFile(path));
    VPlicParams params;
    bool trace = false;
    assert(config.applyConfig(params, trace));
    assert(params.base == 4096 and *params.size == 0x400000);
    std::remove(path.c_str());

    assert(not config.loadConfigFile("no-such-dir/no-such-file.json"));

    std::cout << "✓ File loaded" << '\n';
}

void testCommandLineOverride()
{
    std::cout << "\n=== Command line overrides ===" << '\n';

    std::vector<std::string> argv = { "vplic", "--base", "0x80000000", "--size", "64m",
                                      "--contexts", "3", "--nofilter" };
    Args args;
    assert(args.parseCmdLineArgs(argv));
    assert(args.base.value() == 0x80000000);
    assert(args.size.value() == 0x4000000);
    assert(args.contexts.value() == 3);
    assert(args.noFilter);

    VPlicParams params;
    params.base = 0x1000;
    params.contexts = 1;
    args.applyTo(params);
    assert(params.base == 0x80000000);
    assert(*params.size == 0x4000000);
    assert(params.contexts == 3);
    assert(not params.filterClaims);
    assert(not params.hostBase.has_value());

    std::vector<std::string> badArgv = { "vplic", "--contexts", "3x" };
    Args bad;
    assert(not bad.parseCmdLineArgs(badArgv));

    std::vector<std::string> negArgv = { "vplic", "--size", "-5" };
    Args neg;
    assert(not neg.parseCmdLineArgs(negArgv));

    std::cout << "✓ Command line values override configuration" << '\n';
}

int main()
{
    std::cout << "Running configuration tests..." << '\n';

    testValidConfig();
    testMissingSection();
    testInvalidValues();
    testConfigFile();
    testCommandLineOverride();

    std::cout << "\nAll configuration tests passed!" << '\n';
    return 0;
}
