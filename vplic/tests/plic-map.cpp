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
#include <iostream>
#include "PlicMap.hpp"

using namespace TT_VPLIC;
using namespace TT_VPLIC::PlicMap;

void testRegionOffsets()
{
    std::cout << "\n=== Region offsets ===" << '\n';

    static_assert(priorityOffset(1) == 0x4);
    static_assert(pendingOffset(1) == 0x1004);
    static_assert(enableOffset(1) == 0x2080);
    static_assert(enableOffset(2, 3) == 0x210c);
    static_assert(thresholdOffset(3) == 0x203000);
    static_assert(claimCompleteOffset(3) == 0x203004);
    static_assert(controlEnd(1) == 0x201004);
    static_assert(controlEnd(MAX_CONTEXTS) == 0x4000004);

    RegLocation loc;
    assert(classify(0x0, 1, loc) == FaultCause::None);
    assert(loc.region == Region::Priority and loc.index == 0);

    assert(classify(0xffc, 1, loc) == FaultCause::None);
    assert(loc.region == Region::Priority and loc.index == 1023);

    assert(classify(0x1000, 1, loc) == FaultCause::None);
    assert(loc.region == Region::Pending and loc.index == 0);

    assert(classify(0x107c, 1, loc) == FaultCause::None);
    assert(loc.region == Region::Pending and loc.index == 31);

    assert(classify(0x2084, 2, loc) == FaultCause::None);
    assert(loc.region == Region::Enable and loc.index == 1 and loc.word == 1);

    assert(classify(0x201000, 2, loc) == FaultCause::None);
    assert(loc.region == Region::Threshold and loc.index == 1);

    assert(classify(0x201004, 2, loc) == FaultCause::None);
    assert(loc.region == Region::ClaimComplete and loc.index == 1);

    std::cout << "✓ Offsets of all five regions decoded" << '\n';
}

void testUnmappedOffsets()
{
    std::cout << "\n=== Unmapped offsets ===" << '\n';

    RegLocation loc;

    // Misaligned.
    assert(classify(0x2, 4, loc) == FaultCause::Unmapped);
    assert(classify(0x200006, 4, loc) == FaultCause::Unmapped);

    // Gap between pending and enable.
    assert(classify(0x1080, 4, loc) == FaultCause::Unmapped);
    assert(classify(0x1ffc, 4, loc) == FaultCause::Unmapped);

    // Gap between enable and context control.
    assert(classify(ENABLE_END, MAX_CONTEXTS, loc) == FaultCause::Unmapped);
    assert(classify(0x1ffffc, MAX_CONTEXTS, loc) == FaultCause::Unmapped);

    // Reserved words of a context block.
    assert(classify(0x200008, 4, loc) == FaultCause::Unmapped);
    assert(classify(0x200ffc, 4, loc) == FaultCause::Unmapped);

    // Beyond the last addressable context.
    assert(classify(CONTEXT_END, MAX_CONTEXTS, loc) == FaultCause::Unmapped);
    assert(loc.region == Region::Unmapped);

    std::cout << "✓ Gaps, reserved words and misaligned offsets are unmapped" << '\n';
}

void testInvalidContext()
{
    std::cout << "\n=== Context bounds ===" << '\n';

    RegLocation loc;
    const unsigned contexts = 2;

    assert(classify(claimCompleteOffset(contexts), contexts, loc) == FaultCause::InvalidContext);
    assert(loc.region == Region::ClaimComplete and loc.index == contexts);

    assert(classify(thresholdOffset(contexts), contexts, loc) == FaultCause::InvalidContext);
    assert(loc.region == Region::Threshold);

    assert(classify(enableOffset(contexts, 5), contexts, loc) == FaultCause::InvalidContext);
    assert(loc.region == Region::Enable and loc.word == 5);

    assert(classify(claimCompleteOffset(contexts - 1), contexts, loc) == FaultCause::None);

    // Priority and pending do not depend on the context count.
    assert(classify(priorityOffset(1000), 1, loc) == FaultCause::None);
    assert(classify(pendingOffset(30), 1, loc) == FaultCause::None);

    std::cout << "✓ Context ids at or above the context count are rejected" << '\n';
}

int main()
{
    std::cout << "Running PLIC map tests..." << '\n';

    testRegionOffsets();
    testUnmappedOffsets();
    testInvalidContext();

    std::cout << "\nAll PLIC map tests passed!" << '\n';
    return 0;
}
