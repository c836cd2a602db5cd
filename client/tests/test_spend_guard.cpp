#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>
#include "tollgate/client/spend_guard.hpp"
#include "tollgate/client/errors.hpp"
#include "test_support.hpp"

using namespace tollgate::client;
using namespace tollgate::client::testing;

void test_limit_validation() {
    std::cout << "Testing limit validation..." << std::endl;

    auto valid = SpendGuard::make({{"USDC", "1.00"}});
    assert(valid && *valid && (*valid)->pending_holds() == 0);
    assert(valid->use_count() == 1);
    assert(SpendGuard::make({}));
    auto bad = SpendGuard::make({{"USDC", "one dollar"}});
    assert(!bad && is(bad.error(), payment_errc::invalid_request));

    auto guard = *SpendGuard::make({{"USDC", "1.2345678"}});
    // Digits beyond the asset scale are truncated
    assert(guard->limit("USDC", 6) == Amount(1234567, 6));
    assert(guard->limit("USDC", 2) == Amount(123, 2));
    assert(!guard->limit("EURC"));

    std::cout << "✓ Limit validation test passed" << std::endl;
}

void test_authorize_commit_release() {
    std::cout << "Testing authorize/commit/release..." << std::endl;

    ManualClock clock(noon_utc());
    auto guard = *SpendGuard::make({{"USDC", "1.00"}}, clock);

    auto first = guard->authorize(Amount(400000, 6), "USDC", "base");
    assert(first.allowed);
    assert(first.remaining == Amount(1000000, 6));
    assert(guard->pending_holds() == 1);
    // Held but not committed
    assert(guard->spent("USDC").is_zero());
    assert(guard->remaining("USDC") == Amount(600000, 6));

    assert(!guard->commit(first.hold_id));
    assert(guard->pending_holds() == 0);
    assert(guard->spent("USDC") == Amount(400000, 6));

    auto second = guard->authorize(Amount(500000, 6), "USDC", "polygon");
    assert(second.allowed);
    guard->release(second.hold_id);
    assert(guard->spent("USDC") == Amount(400000, 6));
    assert(guard->remaining("USDC") == Amount(600000, 6));

    auto too_much = guard->authorize(Amount(700000, 6), "USDC", "base");
    assert(!too_much.allowed);
    assert(too_much.remaining == Amount(600000, 6));
    assert(!too_much.reason.empty());
    assert(guard->pending_holds() == 0);

    // Exactly reaching the limit is allowed
    auto exact = guard->authorize(Amount(600000, 6), "USDC", "base");
    assert(exact.allowed);
    assert(!guard->commit(exact.hold_id));
    assert(guard->remaining("USDC") == Amount(0, 6));
    assert(!guard->authorize(Amount(1, 6), "USDC", "base").allowed);

    // Unknown hold ids are reported, not ignored
    auto err = guard->commit(9999);
    assert(err && is(err, payment_errc::invalid_request));

    std::cout << "✓ Authorize/commit/release test passed" << std::endl;
}

void test_unlimited_assets() {
    std::cout << "Testing assets without a limit..." << std::endl;

    auto guard = *SpendGuard::make({{"USDC", "1.00"}});
    auto decision = guard->authorize(Amount(999000000, 6), "EURC", "base");
    assert(decision.allowed);
    assert(!decision.remaining);
    assert(!guard->remaining("EURC"));
    assert(!guard->commit(decision.hold_id));
    assert(guard->spent("EURC") == Amount(999000000, 6));
    // Other assets do not count against USDC
    assert(guard->remaining("USDC") == Amount(1000000, 6));

    std::cout << "✓ Assets without a limit test passed" << std::endl;
}

void test_ledger_per_network() {
    std::cout << "Testing ledger keyed by asset and network..." << std::endl;

    SpendLedger ledger;
    ledger.reset(42);
    assert(!ledger.add("USDC", "base", Amount(100000, 6)));
    assert(!ledger.add("USDC", "base", Amount(50000, 6)));
    assert(!ledger.add("USDC", "solana", Amount(25000, 6)));
    assert(ledger.window() == 42);
    assert(ledger.committed("USDC", "base") == Amount(150000, 6));
    assert(ledger.committed("USDC", "solana") == Amount(25000, 6));
    assert(!ledger.committed("USDC", "polygon"));
    assert(ledger.committed_for_asset("USDC", 6) == Amount(175000, 6));
    assert(ledger.entries().size() == 2);

    ledger.reset(43);
    assert(ledger.entries().empty());
    assert(ledger.committed_for_asset("USDC", 6).is_zero());

    // The limit spans networks
    auto guard = *SpendGuard::make({{"USDC", "0.10"}});
    auto base = guard->authorize(Amount(60000, 6), "USDC", "base");
    assert(base.allowed && !guard->commit(base.hold_id));
    assert(!guard->authorize(Amount(60000, 6), "USDC", "solana").allowed);

    std::cout << "✓ Ledger keyed by asset and network test passed" << std::endl;
}

void test_window_rollover() {
    std::cout << "Testing UTC day rollover..." << std::endl;

    ManualClock clock(noon_utc());
    auto guard = *SpendGuard::make({{"USDC", "1.00"}}, clock);
    auto window = guard->current_window();
    assert(window == SpendGuard::window_of(noon_utc()));

    auto spend = guard->authorize(Amount(900000, 6), "USDC", "base");
    assert(spend.allowed && !guard->commit(spend.hold_id));
    assert(!guard->authorize(Amount(200000, 6), "USDC", "base").allowed);

    // 11:59:59 later is still the same day
    clock.advance(std::chrono::seconds(11 * 3600 + 59 * 60 + 59));
    assert(guard->current_window() == window);
    assert(!guard->authorize(Amount(200000, 6), "USDC", "base").allowed);

    // Midnight UTC
    clock.advance(std::chrono::seconds(1));
    assert(guard->current_window() == window + 1);
    assert(guard->spent("USDC").is_zero());
    auto fresh = guard->authorize(Amount(200000, 6), "USDC", "base");
    assert(fresh.allowed);

    // A hold placed before midnight commits into the window it settles in
    clock.advance(std::chrono::seconds(86400));
    assert(!guard->commit(fresh.hold_id));
    assert(guard->spent("USDC") == Amount(200000, 6));

    guard->reset();
    assert(guard->spent("USDC").is_zero());
    assert(guard->pending_holds() == 0);

    assert(SpendGuard::window_of(std::chrono::system_clock::time_point(std::chrono::seconds(0))) == 0);
    assert(SpendGuard::window_of(std::chrono::system_clock::time_point(std::chrono::seconds(-1))) == -1);

    std::cout << "✓ UTC day rollover test passed" << std::endl;
}

void test_mixed_scales() {
    std::cout << "Testing mixed decimal scales..." << std::endl;

    auto guard = *SpendGuard::make({{"TOKEN", "1"}});
    auto coarse = guard->authorize(Amount(5, 1), "TOKEN", "base");            // 0.5
    assert(coarse.allowed && !guard->commit(coarse.hold_id));
    auto fine = guard->authorize(Amount(500000000000000000ULL, 18), "TOKEN", "base");  // 0.5
    assert(fine.allowed);
    auto over = guard->authorize(Amount(1, 18), "TOKEN", "base");
    assert(!over.allowed);
    assert(!guard->commit(fine.hold_id));
    assert(guard->spent("TOKEN", 1) == Amount(10, 1));

    std::cout << "✓ Mixed decimal scales test passed" << std::endl;
}

void test_concurrent_pipelines_share_limit() {
    std::cout << "Testing concurrent authorize against one limit..." << std::endl;

    // Two sessions each try to spend 0.6 USDC under a 1.00 USDC limit
    for (int round = 0; round < 50; ++round) {
        auto guard = *SpendGuard::make({{"USDC", "1.00"}});
        std::atomic<int> allowed{0};
        std::atomic<int> denied{0};
        std::atomic<bool> go{false};

        auto session = [&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto decision = guard->authorize(Amount(600000, 6), "USDC", "base");
            if (decision.allowed) {
                ++allowed;
                assert(!guard->commit(decision.hold_id));
            } else {
                ++denied;
            }
        };

        std::thread a(session);
        std::thread b(session);
        go = true;
        a.join();
        b.join();

        assert(allowed == 1);
        assert(denied == 1);
        assert(guard->spent("USDC") == Amount(600000, 6));
    }

    // Many small payments never overshoot
    auto guard = *SpendGuard::make({{"USDC", "1.00"}});
    std::vector<std::thread> threads;
    std::atomic<int> allowed{0};
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 10; ++j) {
                auto decision = guard->authorize(Amount(10000, 6), "USDC", "base");
                if (decision.allowed) {
                    ++allowed;
                    assert(!guard->commit(decision.hold_id));
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    assert(allowed == 100);
    assert(guard->spent("USDC") == Amount(1000000, 6));

    std::cout << "✓ Concurrent authorize test passed" << std::endl;
}

int main() {
    std::cout << "=== Tollgate SpendGuard Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        init_global_meta_objects();

        test_limit_validation();
        test_authorize_commit_release();
        test_unlimited_assets();
        test_ledger_per_network();
        test_window_rollover();
        test_mixed_scales();
        test_concurrent_pipelines_share_limit();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
