#include <iostream>
#include <cassert>
#include <string>
#include "tollgate/client/challenge_parser.hpp"
#include "tollgate/client/encoding.hpp"
#include "test_support.hpp"

using namespace tollgate::client;
using namespace tollgate::client::testing;

void test_single_evm_offer() {
    std::cout << "Testing single EVM offer..." << std::endl;

    ManualClock clock(noon_utc());
    ChallengeParser parser({}, clock);
    auto challenge = parser.parse(make_402_single(), ChainFamily::evm);
    assert(challenge);

    assert(challenge->x402_version == 1);
    assert(challenge->scheme == "exact");
    assert(challenge->network == "base");
    assert(challenge->family == ChainFamily::evm);
    assert(challenge->amount == Amount(50000, 6));
    assert(challenge->amount.to_decimal_string() == "0.050000");
    assert(challenge->asset == "USDC");
    assert(challenge->asset_address == kBaseUsdc);
    assert(challenge->pay_to == kPayTo);
    assert(challenge->resource == "https://api.example/data");
    assert(challenge->expires_at == noon_utc() + std::chrono::seconds(60));
    assert(challenge->fingerprint.size() == 64);
    assert(challenge->raw["payTo"] == kPayTo);

    std::cout << "✓ Single EVM offer test passed" << std::endl;
}

void test_instruction_round_trip() {
    std::cout << "Testing challenge to instruction round-trip..." << std::endl;

    ChallengeParser parser;
    for (const char* atomic : {"1", "50000", "1000000", "123456789012"}) {
        auto response = make_402_single("base", atomic);
        auto challenge = parser.parse(response, ChainFamily::evm);
        assert(challenge);

        auto instruction = ChallengeParser::make_instruction(*challenge);
        auto original = nlohmann::json::parse(response.body)["accepts"][0];
        assert(instruction.amount_atomic == original["maxAmountRequired"].get<std::string>());
        assert(instruction.asset_address == original["asset"].get<std::string>());
        assert(instruction.pay_to == original["payTo"].get<std::string>());
        assert(instruction.network == original["network"].get<std::string>());
        assert(instruction.decimals == 6);
        assert(instruction.fingerprint == challenge->fingerprint);
    }

    std::cout << "✓ Challenge to instruction round-trip test passed" << std::endl;
}

void test_fingerprint_stability() {
    std::cout << "Testing challenge fingerprints..." << std::endl;

    ChallengeParser parser;
    auto first = parser.parse(make_402_single(), ChainFamily::evm);
    auto second = parser.parse(make_402_single(), ChainFamily::evm);
    auto other_amount = parser.parse(make_402_single("base", "60000"), ChainFamily::evm);
    auto other_resource = parser.parse(make_402_single("base", "50000", "https://api.example/other"),
                                       ChainFamily::evm);
    assert(first && second && other_amount && other_resource);
    assert(first->fingerprint == second->fingerprint);
    assert(first->fingerprint != other_amount->fingerprint);
    assert(first->fingerprint != other_resource->fingerprint);

    auto with_nonce = make_offer();
    with_nonce["extra"]["nonce"] = "n-1";
    auto nonce_challenge = parser.parse(make_402(nlohmann::json::array({with_nonce})), ChainFamily::evm);
    assert(nonce_challenge);
    assert(nonce_challenge->nonce == std::optional<std::string>("n-1"));
    assert(nonce_challenge->fingerprint != first->fingerprint);

    std::cout << "✓ Challenge fingerprints test passed" << std::endl;
}

void test_preference_order() {
    std::cout << "Testing preferred network ranking..." << std::endl;

    auto accepts = nlohmann::json::array({
        make_offer("base-sepolia", "10000", "0x036CbD53842c5426634e7929541eC2318f3dCF7e"),
        make_offer("polygon", "20000", "0x3c499c542cEF5E3811e1192ce70d8cC03d5c3359"),
        make_offer("base", "30000")
    });
    auto response = make_402(accepts);

    // No preference: server order
    ChallengeParser unordered;
    auto first = unordered.parse(response, ChainFamily::evm);
    assert(first && first->network == "base-sepolia");

    ChallengeParser prefers_base({"base", "polygon"});
    auto preferred = prefers_base.parse(response, ChainFamily::evm);
    assert(preferred && preferred->network == "base");

    auto offers = prefers_base.parse_offers(response, ChainFamily::evm);
    assert(offers && offers->size() == 3);
    assert((*offers)[0].network == "base");
    assert((*offers)[1].network == "polygon");
    assert((*offers)[2].network == "base-sepolia");

    // Unlisted networks keep the server order behind listed ones
    ChallengeParser prefers_polygon({"POLYGON"});
    offers = prefers_polygon.parse_offers(response, ChainFamily::evm);
    assert(offers);
    assert((*offers)[0].network == "polygon");
    assert((*offers)[1].network == "base-sepolia");
    assert((*offers)[2].network == "base");

    std::cout << "✓ Preferred network ranking test passed" << std::endl;
}

void test_family_filter() {
    std::cout << "Testing payable family filter..." << std::endl;

    auto accepts = nlohmann::json::array({
        make_offer("solana", "10000", "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"),
        make_offer("base", "10000")
    });
    auto response = make_402(accepts);

    ChallengeParser parser({"solana"});
    auto evm = parser.parse(response, ChainFamily::evm);
    assert(evm && evm->network == "base");

    auto solana = parser.parse(response, ChainFamily::solana);
    assert(solana && solana->network == "solana" && solana->family == ChainFamily::solana);

    // Proxy mode pays any family
    auto any = parser.parse(response, std::nullopt);
    assert(any && any->network == "solana");

    auto only_solana = make_402(nlohmann::json::array({accepts[0]}));
    auto refused = parser.parse(only_solana, ChainFamily::evm);
    assert(!refused);
    assert(is(refused.error(), payment_errc::challenge_unrecognized));

    std::cout << "✓ Payable family filter test passed" << std::endl;
}

void test_header_encoded_challenge() {
    std::cout << "Testing payment-required header..." << std::endl;

    nlohmann::json requirements = {
        {"x402Version", 2},
        {"accepts", nlohmann::json::array({make_offer("base", "2500")})}
    };
    HttpResponse response;
    response.status_code = 402;
    response.headers["payment-required"] = base64_encode(requirements.dump());
    response.body = "Payment Required";

    ChallengeParser parser;
    auto challenge = parser.parse(response, ChainFamily::evm);
    assert(challenge);
    assert(challenge->x402_version == 2);
    assert(challenge->amount == Amount(2500, 6));

    response.headers["payment-required"] = "%%%";
    auto broken = parser.parse(response, ChainFamily::evm);
    assert(!broken && is(broken.error(), payment_errc::challenge_unrecognized));

    std::cout << "✓ payment-required header test passed" << std::endl;
}

void test_asset_metadata() {
    std::cout << "Testing asset symbol and decimals..." << std::endl;

    ChallengeParser parser;

    // Known address without extra
    auto plain = make_offer();
    plain.erase("extra");
    auto known = parser.parse(make_402(nlohmann::json::array({plain})), ChainFamily::evm);
    assert(known && known->asset == "USDC" && known->amount.decimals() == 6);

    // Known address: the table wins over the EIP-712 domain name
    auto domain_named = make_offer();
    domain_named["extra"]["name"] = "USD Coin";
    auto ticker = parser.parse(make_402(nlohmann::json::array({domain_named})), ChainFamily::evm);
    assert(ticker && ticker->asset == "USDC");

    // Unknown address: extra.name is used when present
    auto named = make_offer("base", "1000", "0x2222222222222222222222222222222222222222");
    named["extra"]["name"] = "DEMO";
    auto demo = parser.parse(make_402(nlohmann::json::array({named})), ChainFamily::evm);
    assert(demo && demo->asset == "DEMO");

    // Unknown address: the address stands in for the symbol
    auto custom = make_offer("base", "1000000000000000000", "0x1111111111111111111111111111111111111111");
    custom["extra"] = {{"decimals", 18}};
    auto unknown = parser.parse(make_402(nlohmann::json::array({custom})), ChainFamily::evm);
    assert(unknown);
    assert(unknown->asset == "0x1111111111111111111111111111111111111111");
    assert(unknown->amount.decimals() == 18);
    assert(unknown->amount.to_decimal_string() == "1.000000000000000000");

    // Integer amount and solana fee payer
    auto numeric = make_offer("solana-devnet", "0", "4zMMC9srt5Ri5X14GAgXhaHii3GnPAEERYPJgZJDncDU");
    numeric["maxAmountRequired"] = 7500;
    numeric["extra"]["feePayer"] = "FeePayer1111111111111111111111111111111111";
    auto sol = parser.parse(make_402(nlohmann::json::array({numeric})), std::nullopt);
    assert(sol);
    assert(sol->amount == Amount(7500, 6));
    assert(sol->fee_payer == "FeePayer1111111111111111111111111111111111");
    assert(ChallengeParser::make_instruction(*sol).fee_payer == sol->fee_payer);

    std::cout << "✓ Asset symbol and decimals test passed" << std::endl;
}

void test_unrecognized_challenges() {
    std::cout << "Testing unrecognized challenges..." << std::endl;

    ChallengeParser parser;

    auto not_402 = parser.parse(make_response(200, "{}"), ChainFamily::evm);
    assert(!not_402 && is(not_402.error(), payment_errc::challenge_unrecognized));

    auto no_terms = parser.parse(make_response(402, "payment required"), ChainFamily::evm);
    assert(!no_terms && is(no_terms.error(), payment_errc::challenge_unrecognized));

    auto empty = parser.parse(make_402(nlohmann::json::array()), ChainFamily::evm);
    assert(!empty && is(empty.error(), payment_errc::challenge_unrecognized));

    auto upto = make_offer();
    upto["scheme"] = "upto";
    auto bad_network = make_offer("dogecoin");
    auto bad_amount = make_offer("base", "0.05");
    auto no_pay_to = make_offer();
    no_pay_to.erase("payTo");
    auto skipped = parser.parse(make_402(nlohmann::json::array({upto, bad_network, bad_amount, no_pay_to})),
                                ChainFamily::evm);
    assert(!skipped);
    assert(is(skipped.error(), payment_errc::challenge_unrecognized));
    auto message = describe(skipped.error());
    assert(message.find("upto") != std::string::npos);
    assert(message.find("dogecoin") != std::string::npos);
    assert(message.find("[3]") != std::string::npos);

    // One good offer among bad ones is enough
    auto mixed = parser.parse(make_402(nlohmann::json::array({upto, make_offer()})), ChainFamily::evm);
    assert(mixed && mixed->scheme == "exact");

    std::cout << "✓ Unrecognized challenges test passed" << std::endl;
}

int main() {
    std::cout << "=== Tollgate ChallengeParser Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        init_global_meta_objects();

        test_single_evm_offer();
        test_instruction_round_trip();
        test_fingerprint_stability();
        test_preference_order();
        test_family_filter();
        test_header_encoded_challenge();
        test_asset_metadata();
        test_unrecognized_challenges();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
