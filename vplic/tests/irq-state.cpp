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
#include <vector>
#include "IrqState.hpp"

using namespace TT_VPLIC;

void testSourceZeroIgnored()
{
    std::cout << "\n=== Source 0 and out of range ids ===" << '\n';

    IrqState state;
    assert(not state.setPending(0, true));
    assert(not state.setActive(0, true));
    assert(not state.setAssigned(0, true));
    assert(not state.setPending(1024, true));
    assert(not state.inject(0));
    assert(not state.inject(5000));

    state.injectWord(0, 0x1);   // Bit of source 0 only.
    assert(state.pendingEmpty());
    assert(not state.isPending(0));
    assert(not state.signalAsserted());

    std::cout << "✓ Source 0 never enters any set" << '\n';
}

void testInjectWord()
{
    std::cout << "\n=== Pending word injection ===" << '\n';

    IrqState state;
    std::vector<bool> levels;
    state.setSignalCallback([&levels](bool level) { levels.push_back(level); });

    state.injectWord(1, 0x80000001);
    assert(state.isPending(32));
    assert(state.isPending(63));
    assert(state.pendingWord(1) == 0x80000001);
    assert(state.pendingWord(0) == 0);
    assert(state.signalAsserted());
    assert(levels.size() == 1 and levels.back());

    // Additive: a zero word clears nothing.
    state.injectWord(1, 0);
    assert(state.pendingWord(1) == 0x80000001);

    // Out of range word is ignored.
    state.injectWord(PlicMap::PENDING_WORDS, 0xffffffff);
    assert(state.pendingWord(PlicMap::PENDING_WORDS) == 0);

    auto lowest = state.lowestPending();
    assert(lowest.has_value() and *lowest == 32);

    std::cout << "✓ Pending words are merged into the pending set" << '\n';
}

void testTransitions()
{
    std::cout << "\n=== Claim and complete transitions ===" << '\n';

    IrqState state;
    assert(state.claimLowest() == 0);

    assert(state.inject(9));
    assert(state.inject(4));
    assert(state.signalAsserted());

    assert(state.claimLowest() == 4);
    assert(not state.isPending(4) and state.isActive(4));

    // Completing while 9 is pending keeps the signal.
    assert(state.complete(4));
    assert(not state.isActive(4));
    assert(state.signalAsserted());

    unsigned candidates[] = { 12, 9 };
    assert(state.claimFirstOf(candidates) == 9);
    assert(state.isActive(9));
    assert(state.claimFirstOf(candidates) == 0);

    // Pending is empty: completion deasserts.
    assert(state.complete(9));
    assert(not state.signalAsserted());

    // Completing an inactive source changes nothing but still evaluates the signal.
    assert(not state.complete(9));
    assert(not state.complete(0));

    std::cout << "✓ Pending -> active -> idle" << '\n';
}

void testAssignedAndReset()
{
    std::cout << "\n=== Assigned set and reset ===" << '\n';

    IrqState state;
    assert(state.setAssigned(7, true));
    assert(state.isAssigned(7));
    assert(state.assignedSet().count() == 1);

    assert(state.inject(7));
    assert(state.claimLowest() == 7);
    assert(state.inject(8));

    state.reset();
    assert(state.pendingSet().none());
    assert(state.activeSet().none());
    assert(not state.signalAsserted());
    assert(state.isAssigned(7));

    std::cout << "✓ Reset keeps assignments" << '\n';
}

void testRequestWhileActive()
{
    std::cout << "\n=== Request for an active source ===" << '\n';

    IrqState state;
    std::vector<bool> levels;
    state.setSignalCallback([&levels](bool level) { levels.push_back(level); });

    assert(state.inject(5));
    assert(state.claimLowest() == 5);

    // A new request is latched: 5 stays out of the pending set.
    assert(state.inject(5));
    assert(not state.isPending(5));
    assert(state.isActive(5));
    assert(state.isDeferred(5));
    assert(state.claimLowest() == 0);

    // Same through the pending word.
    state.injectWord(0, 1u << 5);
    assert(not state.isPending(5));
    assert((state.pendingSet() & state.activeSet()).none());

    // Completion turns the latched request into a pending one.
    size_t edges = levels.size();
    assert(state.complete(5));
    assert(state.isPending(5));
    assert(not state.isActive(5));
    assert(not state.isDeferred(5));
    assert(state.signalAsserted());
    assert(levels.size() > edges and levels.back());

    assert(state.claimLowest() == 5);
    assert(state.complete(5));
    assert(not state.signalAsserted());

    // Low level setters keep the sets disjoint too.
    assert(state.setActive(9, true));
    assert(state.setPending(9, true));
    assert(not state.isPending(9) and state.isDeferred(9));
    assert(state.setPending(10, true));
    assert(state.setActive(10, true));
    assert(not state.isPending(10));

    state.reset();
    assert(state.deferredSet().none());

    std::cout << "✓ Pending and active never overlap" << '\n';
}

int main()
{
    std::cout << "Running interrupt state tests..." << '\n';

    testSourceZeroIgnored();
    testInjectWord();
    testTransitions();
    testAssignedAndReset();
    testRequestWhileActive();

    std::cout << "\nAll interrupt state tests passed!" << '\n';
    return 0;
}
