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
#include "TestPlic.hpp"

using namespace TT_VPLIC;

// Guest read of the claim/complete register of a context.
static uint32_t guestClaim(TestPlic& t, unsigned context)
{
    uint64_t value = 0;
    FaultCause cause = FaultCause::None;
    bool ok = t.plic().read(t.addr(PlicMap::claimCompleteOffset(context)), 4, value, cause);
    assert(ok and cause == FaultCause::None);
    return static_cast<uint32_t>(value);
}

// Guest write of the claim/complete register of a context.
static void guestComplete(TestPlic& t, unsigned context, uint32_t id)
{
    FaultCause cause = FaultCause::None;
    bool ok = t.plic().write(t.addr(PlicMap::claimCompleteOffset(context)), 4, id, cause);
    assert(ok and cause == FaultCause::None);
}

void testInjectEverySource()
{
    std::cout << "\n=== Inject every source ===" << '\n';

    TestPlic t(1, false);
    for (unsigned id = 1; id < PlicMap::NUM_SOURCES; ++id)
    {
        assert(t.plic().inject(id));
        assert(t.plic().state().isPending(id));
        assert(not t.plic().state().isActive(id));
        assert(t.signal());

        assert(guestClaim(t, 0) == id);
        guestComplete(t, 0, id);
        assert(not t.signal());
    }

    std::cout << "✓ Inject, claim and complete of sources 1 to 1023" << '\n';
}

void testClaimLowest(bool filtered)
{
    std::cout << "\n=== Claim returns lowest pending ("
              << (filtered ? "filtered" : "unfiltered") << ") ===" << '\n';

    TestPlic t(1, filtered);
    if (filtered)
        t.enableAll(0);

    assert(guestClaim(t, 0) == 0);

    for (unsigned id : { 700u, 33u, 512u, 2u })
        t.plic().inject(id);

    unsigned expected[] = { 2, 33, 512, 700 };
    for (unsigned id : expected)
    {
        uint32_t claimed = guestClaim(t, 0);
        assert(claimed == id);
        assert(not t.plic().state().isPending(claimed));
        assert(t.plic().state().isActive(claimed));
    }

    // Pending is empty now.
    assert(guestClaim(t, 0) == 0);

    std::cout << "✓ Claims in ascending id order, 0 once pending is empty" << '\n';
}

void testSignalOnComplete()
{
    std::cout << "\n=== Signal on complete ===" << '\n';

    TestPlic t(1, false);
    t.plic().inject(3);
    t.plic().inject(4);
    assert(guestClaim(t, 0) == 3);

    // 4 is still pending: the line stays asserted.
    guestComplete(t, 0, 3);
    assert(not t.plic().state().isActive(3));
    assert(t.signal());

    assert(guestClaim(t, 0) == 4);
    guestComplete(t, 0, 4);
    assert(not t.signal());
    assert(t.plic().state().activeSet().none());

    // Completions are forwarded to the host.
    auto completions = t.host().completions();
    assert(completions.size() == 2);
    assert((completions.at(0) == SimHostPlic::Completion{0, 3}));
    assert((completions.at(1) == SimHostPlic::Completion{0, 4}));

    std::cout << "✓ Line deasserted only when nothing is pending" << '\n';
}

void testReuse()
{
    std::cout << "\n=== Source reuse ===" << '\n';

    TestPlic t(1, false);
    t.plic().inject(5);
    assert(guestClaim(t, 0) == 5);
    guestComplete(t, 0, 5);
    t.plic().inject(5);
    assert(guestClaim(t, 0) == 5);

    std::cout << "✓ A completed source can be injected and claimed again" << '\n';
}

void testPendingWordRead()
{
    std::cout << "\n=== Pending word reads ===" << '\n';

    TestPlic t(1, false);
    unsigned ids[] = { 1, 31, 32, 100, 1023 };
    for (unsigned id : ids)
        t.plic().inject(id);

    for (unsigned w = 0; w < PlicMap::PENDING_WORDS; ++w)
    {
        uint64_t value = 0;
        FaultCause cause = FaultCause::None;
        assert(t.plic().read(t.addr(PlicMap::pendingOffset(w)), 4, value, cause));
        for (unsigned i = 0; i < 32; ++i)
        {
            bool bit = (value >> i) & 1;
            assert(bit == t.plic().state().isPending(w*32 + i));
        }
    }

    std::cout << "✓ Bit i of word w reflects source w*32+i" << '\n';
}

void testPendingWordWrite()
{
    std::cout << "\n=== Pending word writes inject ===" << '\n';

    TestPlic t(1, false);
    FaultCause cause = FaultCause::None;

    // Bit 0 of word 0 is source 0 and is ignored.
    assert(t.plic().write(t.addr(PlicMap::pendingOffset(0)), 4, 0x1, cause));
    assert(t.plic().state().pendingEmpty());

    assert(t.plic().write(t.addr(PlicMap::pendingOffset(2)), 4, 0x5, cause));
    assert(t.plic().state().isPending(64));
    assert(t.plic().state().isPending(66));
    assert(t.signal());

    // Writing zeros does not clear pending sources.
    assert(t.plic().write(t.addr(PlicMap::pendingOffset(2)), 4, 0, cause));
    assert(t.plic().state().isPending(64));

    std::cout << "✓ Pending writes are additive and assert the line" << '\n';
}

void testReinjectActiveSource(bool filtered)
{
    std::cout << "\n=== Re-inject an active source ("
              << (filtered ? "filtered" : "unfiltered") << ") ===" << '\n';

    TestPlic t(2, filtered);
    if (filtered)
    {
        t.enableAll(0);
        t.enableAll(1);
    }

    t.plic().inject(5);
    assert(guestClaim(t, 0) == 5);

    t.plic().inject(5);
    assert(not t.plic().state().isPending(5));
    assert(t.plic().state().isActive(5));

    // The other context cannot take the source while it is in service.
    assert(guestClaim(t, 1) == 0);

    guestComplete(t, 0, 5);
    assert(t.plic().state().isPending(5));
    assert(not t.plic().state().isActive(5));
    assert(t.signal());

    assert(guestClaim(t, 1) == 5);
    guestComplete(t, 1, 5);
    assert(not t.signal());
    assert(t.plic().state().pendingEmpty());

    std::cout << "✓ Request latched until completion, claimed once" << '\n';
}

int main()
{
    std::cout << "Running claim/complete tests..." << '\n';

    testInjectEverySource();
    testClaimLowest(false);
    testClaimLowest(true);
    testSignalOnComplete();
    testReuse();
    testPendingWordRead();
    testPendingWordWrite();
    testReinjectActiveSource(false);
    testReinjectActiveSource(true);

    std::cout << "\nAll claim/complete tests passed!" << '\n';
    return 0;
}
