#include <iostream>
#include <cassert>
#include <atomic>
#include <thread>
#include <vector>
#include "tollgate/client/account_gateway.hpp"
#include "tollgate/client/challenge_parser.hpp"
#include "tollgate/client/payment_resolver.hpp"
#include "tollgate/client/signer.hpp"
#include "test_support.hpp"

using namespace tollgate::client;
using namespace tollgate::client::testing;

namespace {

PaymentChallenge challenge_for(const std::string& network = "base",
                               const std::string& amount = "50000",
                               const std::string& resource = "https://api.example/data") {
    ChallengeParser parser;
    auto challenge = parser.parse(make_402_single(network, amount, resource), std::nullopt);
    assert(challenge);
    return *challenge;
}

} // namespace

void test_relay_resolution() {
    std::cout << "Testing relay resolution..." << std::endl;

    auto signer = std::make_shared<MockSigner>(ChainFamily::evm);
    PaymentResolver resolver(std::make_shared<MockTransport>());
    auto challenge = challenge_for();

    auto resolution = resolver.resolve(challenge, RelayMode{signer});
    assert(resolution);
    assert(resolution->fresh);
    const auto& proof = resolution->proof;
    assert(proof.mode == PaymentModeKind::relay);
    assert(proof.challenge_fingerprint == challenge.fingerprint);
    assert(proof.amount == Amount(50000, 6));
    assert(proof.asset == "USDC");
    assert(proof.network == "base");
    assert(proof.client_tx.value == "0xclient1");
    assert(proof.facilitator_tx.value == "0xfacilitator1");
    assert(proof.client_tx.value != proof.facilitator_tx.value);
    assert(proof.payment_header == "signed-payload-1");
    assert(!proof.accepted);

    auto instructions = signer->instructions();
    assert(instructions.size() == 1);
    assert(instructions[0].amount_atomic == "50000");
    assert(instructions[0].pay_to == kPayTo);
    assert(instructions[0].asset_address == kBaseUsdc);

    std::cout << "✓ Relay resolution test passed" << std::endl;
}

void test_relay_errors() {
    std::cout << "Testing relay error propagation..." << std::endl;

    auto transport = std::make_shared<MockTransport>();
    auto challenge = challenge_for();

    // Network mismatch never reaches the signer
    auto solana_signer = std::make_shared<MockSigner>(ChainFamily::solana);
    PaymentResolver resolver(transport);
    auto mismatch = resolver.resolve(challenge, RelayMode{solana_signer});
    assert(!mismatch && is(mismatch.error(), payment_errc::signer_error));
    assert(solana_signer->calls() == 0);

    auto missing = resolver.resolve(challenge, RelayMode{nullptr});
    assert(!missing && is(missing.error(), payment_errc::signer_error));

    for (auto code : {payment_errc::signer_error, payment_errc::payment_rejected, payment_errc::transport_error}) {
        auto signer = std::make_shared<MockSigner>();
        signer->fail_with(code);
        auto failed = resolver.resolve(challenge, RelayMode{signer});
        assert(!failed && is(failed.error(), code));
    }

    auto headless = std::make_shared<MockSigner>();
    headless->omit_header(true);
    auto no_header = resolver.resolve(challenge, RelayMode{headless});
    assert(!no_header && is(no_header.error(), payment_errc::signer_error));

    // Failures are not cached; a later attempt pays
    assert(resolver.cache_size() == 0);
    auto signer = std::make_shared<MockSigner>();
    assert(resolver.resolve(challenge, RelayMode{signer}));
    assert(signer->calls() == 1);

    std::cout << "✓ Relay error propagation test passed" << std::endl;
}

void test_dedup_by_fingerprint() {
    std::cout << "Testing at-most-once resolution..." << std::endl;

    auto signer = std::make_shared<MockSigner>();
    PaymentResolver resolver(std::make_shared<MockTransport>());
    auto challenge = challenge_for();

    auto first = resolver.resolve(challenge, RelayMode{signer});
    auto second = resolver.resolve(challenge, RelayMode{signer});
    assert(first && second);
    assert(first->fresh);
    assert(!second->fresh);
    assert(signer->calls() == 1);
    assert(first->proof.client_tx.value == second->proof.client_tx.value);
    assert(resolver.cached(challenge.fingerprint));

    // A different challenge is a different payment
    auto other = resolver.resolve(challenge_for("base", "60000"), RelayMode{signer});
    assert(other && other->fresh);
    assert(signer->calls() == 2);

    // Once upstream accepted the proof, an identical challenge is a new charge
    resolver.settle(challenge.fingerprint);
    assert(!resolver.cached(challenge.fingerprint));
    auto again = resolver.resolve(challenge, RelayMode{signer});
    assert(again && again->fresh);
    assert(signer->calls() == 3);

    std::cout << "✓ At-most-once resolution test passed" << std::endl;
}

void test_commit_once() {
    std::cout << "Testing single commit per cached proof..." << std::endl;

    auto signer = std::make_shared<MockSigner>();
    PaymentResolver resolver(std::make_shared<MockTransport>());
    auto challenge = challenge_for();

    assert(!resolver.lookup(challenge.fingerprint));
    assert(!resolver.mark_committed(challenge.fingerprint));

    assert(resolver.resolve(challenge, RelayMode{signer}));
    auto fresh = resolver.lookup(challenge.fingerprint);
    assert(fresh && !fresh->committed);
    assert(fresh->proof.client_tx.value == "0xclient1");

    assert(resolver.mark_committed(challenge.fingerprint));
    assert(!resolver.mark_committed(challenge.fingerprint));
    auto committed = resolver.lookup(challenge.fingerprint);
    assert(committed && committed->committed);

    resolver.settle(challenge.fingerprint);
    assert(!resolver.lookup(challenge.fingerprint));
    assert(!resolver.mark_committed(challenge.fingerprint));

    std::cout << "✓ Single commit per cached proof test passed" << std::endl;
}

void test_concurrent_resolve_same_challenge() {
    std::cout << "Testing concurrent resolve of one challenge..." << std::endl;

    auto signer = std::make_shared<MockSigner>();
    signer->set_delay(std::chrono::milliseconds(50));
    PaymentResolver resolver(std::make_shared<MockTransport>());
    auto challenge = challenge_for();

    std::atomic<int> fresh{0};
    std::atomic<int> shared{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto resolution = resolver.resolve(challenge, RelayMode{signer});
            assert(resolution);
            if (resolution->fresh) {
                ++fresh;
            } else {
                ++shared;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(signer->calls() == 1);
    assert(fresh == 1);
    assert(shared == 7);

    std::cout << "✓ Concurrent resolve of one challenge test passed" << std::endl;
}

void test_signer_serialization() {
    std::cout << "Testing per-signer serialization..." << std::endl;

    auto signer = std::make_shared<MockSigner>(ChainFamily::evm, "0xsame");
    signer->set_delay(std::chrono::milliseconds(20));
    PaymentResolver resolver(std::make_shared<MockTransport>());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() {
            auto challenge = challenge_for("base", std::to_string(10000 + i));
            assert(resolver.resolve(challenge, RelayMode{signer}));
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(signer->calls() == 4);
    assert(!signer->overlapped());

    std::cout << "✓ Per-signer serialization test passed" << std::endl;
}

void test_proxy_resolution() {
    std::cout << "Testing proxy resolution..." << std::endl;

    auto transport = std::make_shared<MockTransport>();
    transport->push(make_response(200, R"({"receiptId":"rcpt-1","paymentHeader":"proxy-payload"})"));
    TimeoutConfig timeouts{1500, 9000};
    PaymentResolver resolver(transport, timeouts);
    auto challenge = challenge_for("solana", "50000");

    auto resolution = resolver.resolve(challenge, ProxyMode{"sk-live-123", "https://facilitator.example/pay"});
    assert(resolution);
    const auto& proof = resolution->proof;
    assert(proof.mode == PaymentModeKind::proxy);
    assert(proof.debit_receipt == "rcpt-1");
    assert(proof.payment_header == "proxy-payload");
    assert(proof.client_tx.empty());
    assert(proof.facilitator_tx.empty());

    auto requests = transport->requests();
    assert(requests.size() == 1);
    assert(requests[0].method == "POST");
    assert(requests[0].url == "https://facilitator.example/pay");
    assert(requests[0].headers.at("authorization") == "Bearer sk-live-123");
    auto payload = nlohmann::json::parse(requests[0].body);
    assert(payload["resource"] == "https://api.example/data");
    assert(payload["challenge"]["payTo"] == kPayTo);
    assert(transport->last_timeouts().connect_timeout_ms == 1500);
    assert(transport->last_timeouts().request_timeout_ms == 9000);

    std::cout << "✓ Proxy resolution test passed" << std::endl;
}

void test_proxy_error_mapping() {
    std::cout << "Testing proxy error mapping..." << std::endl;

    struct Case {
        int status;
        std::string body;
        payment_errc expected;
    };
    std::vector<Case> cases = {
        {402, R"({"error":"balance too low"})", payment_errc::insufficient_balance},
        {401, R"({"error":"expired key"})", payment_errc::auth_error},
        {403, "", payment_errc::auth_error},
        {500, "oops", payment_errc::payment_rejected},
        {409, R"({"error":"duplicate"})", payment_errc::payment_rejected},
        {200, "not json", payment_errc::payment_rejected},
        {200, R"({"receiptId":"rcpt"})", payment_errc::payment_rejected},
    };

    auto challenge = challenge_for();
    for (const auto& c : cases) {
        auto transport = std::make_shared<MockTransport>();
        transport->push(make_response(c.status, c.body));
        PaymentResolver resolver(transport);
        auto resolution = resolver.resolve(challenge, ProxyMode{"sk", "https://facilitator.example/pay"});
        assert(!resolution);
        assert(is(resolution.error(), c.expected));
        assert(resolver.cache_size() == 0);
    }

    auto down = std::make_shared<MockTransport>();
    down->push_error("connection refused");
    PaymentResolver resolver(down);
    auto unreachable = resolver.resolve(challenge, ProxyMode{"sk", "https://facilitator.example/pay"});
    assert(!unreachable && is(unreachable.error(), payment_errc::transport_error));

    // Missing credential fails before any request
    auto untouched = std::make_shared<MockTransport>();
    PaymentResolver no_key(untouched);
    auto anonymous = no_key.resolve(challenge, ProxyMode{"", "https://facilitator.example/pay"});
    assert(!anonymous && is(anonymous.error(), payment_errc::auth_error));
    assert(untouched->request_count() == 0);

    std::cout << "✓ Proxy error mapping test passed" << std::endl;
}

void test_http_signer() {
    std::cout << "Testing HttpSigner..." << std::endl;

    auto transport = std::make_shared<MockTransport>();
    transport->push(make_response(200, R"({"clientTx":"0xaaa","facilitatorTx":"0xbbb","paymentHeader":"hdr"})"));
    transport->push(make_response(422, R"({"error":"insufficient relay liquidity"})"));
    transport->push(make_response(500, R"({"error":"key not loaded"})"));

    HttpSigner signer(transport, "http://127.0.0.1:8700/", ChainFamily::evm, "0xcaller");
    assert(signer.identity() == "0xcaller");
    assert(signer.family() == ChainFamily::evm);

    auto instruction = ChallengeParser::make_instruction(challenge_for());
    auto receipt = signer.sign_and_submit(instruction, TimeoutConfig{});
    assert(receipt);
    assert(receipt->client_tx.value == "0xaaa");
    assert(receipt->facilitator_tx.value == "0xbbb");
    assert(receipt->payment_header == "hdr");

    auto requests = transport->requests();
    assert(requests[0].url == "http://127.0.0.1:8700/sign");
    auto body = nlohmann::json::parse(requests[0].body);
    assert(body["amount"] == "50000");
    assert(body["payTo"] == kPayTo);
    assert(body["network"] == "base");

    auto declined = signer.sign_and_submit(instruction, TimeoutConfig{});
    assert(!declined && is(declined.error(), payment_errc::payment_rejected));
    assert(describe(declined.error()).find("insufficient relay liquidity") != std::string::npos);

    auto broken = signer.sign_and_submit(instruction, TimeoutConfig{});
    assert(!broken && is(broken.error(), payment_errc::signer_error));

    std::cout << "✓ HttpSigner test passed" << std::endl;
}

int main() {
    std::cout << "=== Tollgate PaymentResolver Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        init_global_meta_objects();

        test_relay_resolution();
        test_relay_errors();
        test_dedup_by_fingerprint();
        test_commit_once();
        test_concurrent_resolve_same_challenge();
        test_signer_serialization();
        test_proxy_resolution();
        test_proxy_error_mapping();
        test_http_signer();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
