#include <libstealthpool/crypto/Secp256k1.h>
#include <libstealthpool/pool/InMemoryTokenLedger.h>
#include <libstealthpool/pool/StealthPool.h>
#include <libstealthpool/zkp/Field.h>
#include <libstealthpool/zkp/MerklePath.h>
#include <libstealthpool/zkp/MiMC.h>
#include <libstealthpool/zkp/Note.h>

#include <test/support/FakeVerifier.h>
#include <test/support/MockBridgeDispatcher.h>

#include <boost/test/unit_test.hpp>

#include <memory>
#include <stdexcept>
#include <variant>

using namespace stealthpool;

namespace {

AccountID
account(std::uint8_t tag)
{
    AccountID a;
    a.data()[AccountID::size() - 1] = tag;
    return a;
}

struct PoolFixture
{
    AccountID const poolAccount = account(0xa0);
    AccountID const bridgeAccount = account(0xb0);
    AccountID const alice = account(0x01);
    AccountID const relayer = account(0x02);
    AccountID const bob = account(0x03);

    InMemoryTokenLedger ledger;
    test::MockBridgeDispatcher bridge{ledger, poolAccount, bridgeAccount};
    test::FakeVerifier verifier;
    std::unique_ptr<StealthPool> pool;

    zkp::Note const note = zkp::Note::fromSecrets(uint256(11), uint256(22));
    zkp::Groth16Proof const proof{};
    uint256 const gas{3};
    Blob const ephemeral = SecretKey::random().publicKey().toBlob();

    PoolFixture()
    {
        ledger.mint(alice, uint256(1000));
        ledger.approve(alice, poolAccount, uint256(1000));
        pool = makePool(4, GmpToken{"USDC"});
    }

    std::unique_ptr<StealthPool>
    makePool(std::size_t levels, TokenIdentifier const& token)
    {
        PoolParams params;
        params.poolAddress = poolAccount;
        params.denomination = uint256(10);
        params.levels = levels;
        params.token = token;
        return std::make_unique<StealthPool>(
            params, ledger, bridge, verifier, Journal("StealthPool_test"));
    }

    uint256
    commitment(std::uint64_t i) const
    {
        return zkp::MiMCSponge::hash2(uint256(i), uint256(1000 + i));
    }

    WithdrawRequest
    requestFor(zkp::Note const& n, std::uint64_t fee) const
    {
        WithdrawRequest r;
        r.root = pool->getLastRoot();
        r.nullifierHash = n.nullifierHash;
        r.relayerFee = uint256(fee);
        r.destinationChain = "arbitrum";
        r.stealthAddress = account(0x5e);
        r.ephemeralPublicKey = ephemeral;
        r.viewHint = 0x42;
        r.k = 1;
        return r;
    }

    void
    checkNothingMoved()
    {
        BOOST_CHECK(ledger.balanceOf(poolAccount) == uint256(10));
        BOOST_CHECK(ledger.balanceOf(relayer).isZero());
        BOOST_CHECK(ledger.balanceOf(bridgeAccount).isZero());
        BOOST_CHECK(ledger.allowance(poolAccount, bridgeAccount).isZero());
        BOOST_CHECK(!pool->isSpent(note.nullifierHash));
        BOOST_CHECK(pool->withdrawals().empty());
    }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(StealthPool_test, PoolFixture)

BOOST_AUTO_TEST_CASE(deposit_appends_leaf)
{
    auto const emptyRoot = pool->getLastRoot();
    BOOST_CHECK_EQUAL(pool->deposit(alice, note.commitment, 1000), tesSUCCESS);

    BOOST_REQUIRE_EQUAL(pool->deposits().size(), 1u);
    auto const& event = pool->deposits()[0];
    BOOST_CHECK(event.commitment == note.commitment);
    BOOST_CHECK_EQUAL(event.leafIndex, 0u);
    BOOST_CHECK_EQUAL(event.timestamp, 1000u);

    BOOST_CHECK(pool->getLastRoot() != emptyRoot);
    BOOST_CHECK(pool->isKnownRoot(emptyRoot));
    BOOST_CHECK_EQUAL(pool->nextIndex(), 1u);
    BOOST_CHECK(ledger.balanceOf(alice) == uint256(990));
    BOOST_CHECK(ledger.balanceOf(poolAccount) == uint256(10));

    BOOST_CHECK_EQUAL(pool->deposit(alice, commitment(1), 1001), tesSUCCESS);
    BOOST_CHECK_EQUAL(pool->deposits()[1].leafIndex, 1u);

    auto const path = zkp::buildMerklePath(pool->depositLeaves(), 0, pool->levels());
    BOOST_CHECK(path.root == pool->getLastRoot());
}

BOOST_AUTO_TEST_CASE(deposit_rejections_leave_no_trace)
{
    auto const root = pool->getLastRoot();

    BOOST_CHECK_EQUAL(
        pool->deposit(alice, zkp::fieldModulus(), 0), tecINVALID_FIELD_ELEMENT);

    // No balance.
    BOOST_CHECK_EQUAL(pool->deposit(bob, commitment(1), 0), tecINSUFFICIENT_FUNDS);

    // Balance but no approval.
    ledger.mint(bob, uint256(50));
    BOOST_CHECK_EQUAL(pool->deposit(bob, commitment(1), 0), tecINSUFFICIENT_FUNDS);

    BOOST_CHECK(ledger.balanceOf(bob) == uint256(50));
    BOOST_CHECK(ledger.balanceOf(poolAccount).isZero());
    BOOST_CHECK_EQUAL(pool->nextIndex(), 0u);
    BOOST_CHECK(pool->getLastRoot() == root);
    BOOST_CHECK(pool->deposits().empty());
}

BOOST_AUTO_TEST_CASE(deposit_into_full_tree)
{
    pool = makePool(1, GmpToken{"USDC"});
    BOOST_CHECK_EQUAL(pool->deposit(alice, commitment(0), 0), tesSUCCESS);
    BOOST_CHECK_EQUAL(pool->deposit(alice, commitment(1), 0), tesSUCCESS);
    BOOST_CHECK_EQUAL(pool->deposit(alice, commitment(2), 0), tecTREE_FULL);
    BOOST_CHECK(ledger.balanceOf(alice) == uint256(980));
    BOOST_CHECK_EQUAL(pool->deposits().size(), 2u);
}

BOOST_AUTO_TEST_CASE(withdraw_pays_relayer_and_bridges_rest)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    auto const request = requestFor(note, 1);

    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas), tesSUCCESS);

    BOOST_REQUIRE_EQUAL(pool->withdrawals().size(), 1u);
    auto const& event = pool->withdrawals()[0];
    BOOST_CHECK(event.nullifierHash == note.nullifierHash);
    BOOST_CHECK(event.relayer == relayer);
    BOOST_CHECK_EQUAL(event.destinationChain, "arbitrum");
    BOOST_CHECK(event.stealthAddress == request.stealthAddress);
    BOOST_CHECK(event.amountToBridge == uint256(9));
    BOOST_CHECK(event.relayerFee == uint256(1));

    BOOST_CHECK(ledger.balanceOf(relayer) == uint256(1));
    BOOST_CHECK(ledger.balanceOf(bridgeAccount) == uint256(9));
    BOOST_CHECK(ledger.balanceOf(poolAccount).isZero());
    BOOST_CHECK(ledger.allowance(poolAccount, bridgeAccount).isZero());
    BOOST_CHECK(pool->isSpent(note.nullifierHash));

    BOOST_REQUIRE_EQUAL(bridge.requests.size(), 1u);
    auto const& sent = bridge.requests[0];
    BOOST_CHECK(sent.amount == uint256(9));
    BOOST_CHECK(sent.gasValue == gas);
    BOOST_CHECK(sent.stealthAddress == request.stealthAddress);
    BOOST_CHECK(sent.ephemeralPublicKey == request.ephemeralPublicKey);
    BOOST_CHECK(sent.viewHint == request.viewHint);
    BOOST_CHECK_EQUAL(sent.k, 1u);
    BOOST_REQUIRE(std::holds_alternative<GmpToken>(sent.token));
    BOOST_CHECK_EQUAL(std::get<GmpToken>(sent.token).symbol, "USDC");

    BOOST_REQUIRE_EQUAL(verifier.seen.size(), 1u);
    BOOST_CHECK(verifier.seen[0].root == request.root);
    BOOST_CHECK(verifier.seen[0].nullifierHash == request.nullifierHash);
    BOOST_CHECK(
        verifier.seen[0].extDataHash ==
        computeExtDataHash(request, uint256(9), bridgeAccount, GmpToken{"USDC"}));
    BOOST_CHECK(verifier.seen[0].extDataHash == pool->extDataHashFor(request));

    // Resubmitting the same nullifier fails before the proof is looked at.
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas),
        tecNULLIFIER_ALREADY_USED);
    BOOST_CHECK_EQUAL(verifier.seen.size(), 1u);
    BOOST_CHECK(ledger.balanceOf(relayer) == uint256(1));
}

BOOST_AUTO_TEST_CASE(fee_boundaries)
{
    auto const other = zkp::Note::fromSecrets(uint256(33), uint256(44));
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, other.commitment, 0), tesSUCCESS);

    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 0), proof, gas),
        tesSUCCESS);
    BOOST_CHECK(ledger.balanceOf(relayer).isZero());
    BOOST_CHECK(pool->withdrawals().back().amountToBridge == uint256(10));

    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(other, 10), proof, gas),
        tesSUCCESS);
    BOOST_CHECK(ledger.balanceOf(relayer) == uint256(10));
    BOOST_CHECK(pool->withdrawals().back().amountToBridge.isZero());
}

BOOST_AUTO_TEST_CASE(fee_above_denomination_is_rejected_before_proof)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 11), proof, gas),
        tecINVALID_RELAYER_FEE);
    BOOST_CHECK(verifier.seen.empty());
    checkNothingMoved();
}

BOOST_AUTO_TEST_CASE(unknown_and_stale_roots)
{
    pool = makePool(6, GmpToken{"USDC"});
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);

    auto request = requestFor(note, 1);
    auto const staleRoot = request.root;

    request.root = zkp::MiMCSponge::hash2(uint256(1), uint256(1));
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas), tecUNKNOWN_ROOT);

    for (std::uint64_t i = 0; i < zkp::MerkleTreeWithHistory::ROOT_HISTORY_SIZE; ++i)
        BOOST_REQUIRE_EQUAL(pool->deposit(alice, commitment(i), 0), tesSUCCESS);

    request.root = staleRoot;
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas), tecUNKNOWN_ROOT);
    BOOST_CHECK(verifier.seen.empty());

    request.root = pool->getLastRoot();
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas), tesSUCCESS);
}

BOOST_AUTO_TEST_CASE(public_inputs_must_be_field_elements)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);

    auto request = requestFor(note, 1);
    request.root = zkp::fieldModulus();
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas),
        tecINVALID_FIELD_ELEMENT);

    request = requestFor(note, 1);
    request.nullifierHash = zkp::fieldModulus() + uint256(1);
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas),
        tecINVALID_FIELD_ELEMENT);
    checkNothingMoved();
}

BOOST_AUTO_TEST_CASE(rejected_proof)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    verifier.accept = false;
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        tecINVALID_PROOF);
    BOOST_CHECK(bridge.requests.empty());
    checkNothingMoved();
}

BOOST_AUTO_TEST_CASE(route_must_match_pool_mode)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeITS(relayer, requestFor(note, 1), proof, gas),
        tecPOOL_MODE_DISABLED);
    BOOST_CHECK(verifier.seen.empty());
    checkNothingMoved();

    uint256 tokenId;
    tokenId.data()[0] = 0x77;
    pool = makePool(4, ItsToken{tokenId});
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);

    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        tecPOOL_MODE_DISABLED);
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeITS(relayer, requestFor(note, 1), proof, gas),
        tesSUCCESS);
    BOOST_REQUIRE_EQUAL(bridge.requests.size(), 1u);
    BOOST_REQUIRE(std::holds_alternative<ItsToken>(bridge.requests[0].token));
    BOOST_CHECK(std::get<ItsToken>(bridge.requests[0].token).tokenId == tokenId);
}

BOOST_AUTO_TEST_CASE(dispatch_failure_rolls_back_everything)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    auto const request = requestFor(note, 1);

    for (auto behavior :
         {test::MockBridgeDispatcher::Behavior::reject,
          test::MockBridgeDispatcher::Behavior::throwError,
          test::MockBridgeDispatcher::Behavior::throwRuntimeError,
          test::MockBridgeDispatcher::Behavior::deliverThenThrow,
          test::MockBridgeDispatcher::Behavior::deliverThenReject})
    {
        bridge.behavior = behavior;
        BOOST_CHECK_EQUAL(
            pool->withdrawAndBridgeGMP(relayer, request, proof, gas),
            tecDISPATCH_FAILED);
        checkNothingMoved();
    }

    // The nullifier was never burned, so the withdrawal can be retried.
    bridge.behavior = test::MockBridgeDispatcher::Behavior::deliver;
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, request, proof, gas), tesSUCCESS);
    BOOST_CHECK(ledger.balanceOf(bridgeAccount) == uint256(9));
}

BOOST_AUTO_TEST_CASE(foreign_exception_propagates_after_rollback)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    bridge.behavior = test::MockBridgeDispatcher::Behavior::throwForeign;

    BOOST_CHECK_THROW(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        test::MockBridgeDispatcher::ForeignFailure);
    checkNothingMoved();

    // The guard was released too.
    bridge.behavior = test::MockBridgeDispatcher::Behavior::deliver;
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        tesSUCCESS);
}

BOOST_AUTO_TEST_CASE(ephemeral_key_must_be_a_curve_point)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);

    Blob offCurve(33, 0xff);
    offCurve[0] = 0x03;
    Blob uncompressedPrefix = ephemeral;
    uncompressedPrefix[0] = 0x04;

    for (auto const& key : {Blob(5, 0xff), Blob{}, offCurve, uncompressedPrefix})
    {
        auto request = requestFor(note, 1);
        request.ephemeralPublicKey = key;
        BOOST_CHECK_EQUAL(
            pool->withdrawAndBridgeGMP(relayer, request, proof, gas),
            tecINVALID_EPHEMERAL_KEY);
    }
    BOOST_CHECK(verifier.seen.empty());
    BOOST_CHECK(bridge.requests.empty());
    checkNothingMoved();
}

BOOST_AUTO_TEST_CASE(ledger_overflow_during_fee_rolls_back)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);
    ledger.mint(relayer, uint256::fromHex(std::string(64, 'f')));

    BOOST_CHECK_THROW(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        std::overflow_error);
    BOOST_CHECK(!pool->isSpent(note.nullifierHash));
    BOOST_CHECK(ledger.balanceOf(poolAccount) == uint256(10));
    BOOST_CHECK(ledger.allowance(poolAccount, bridgeAccount).isZero());
    BOOST_CHECK(pool->withdrawals().empty());
}

BOOST_AUTO_TEST_CASE(reentrant_calls_are_refused)
{
    BOOST_REQUIRE_EQUAL(pool->deposit(alice, note.commitment, 0), tesSUCCESS);

    TER nested = tesSUCCESS;
    bridge.onSend = [&] { nested = pool->deposit(alice, commitment(9), 0); };
    BOOST_CHECK_EQUAL(
        pool->withdrawAndBridgeGMP(relayer, requestFor(note, 1), proof, gas),
        tesSUCCESS);
    BOOST_CHECK_EQUAL(nested, tecREENTRANT_CALL);
    BOOST_CHECK_EQUAL(pool->nextIndex(), 1u);
    bridge.onSend = nullptr;

    auto const other = zkp::Note::fromSecrets(uint256(55), uint256(66));
    auto const request = requestFor(other, 1);
    nested = tesSUCCESS;
    ledger.setTransferHook([&](AccountID const&, AccountID const&, uint256 const&) {
        nested = pool->withdrawAndBridgeGMP(relayer, request, proof, gas);
    });
    BOOST_CHECK_EQUAL(pool->deposit(alice, other.commitment, 0), tesSUCCESS);
    BOOST_CHECK_EQUAL(nested, tecREENTRANT_CALL);
    BOOST_CHECK(!pool->isSpent(other.nullifierHash));
}

BOOST_AUTO_TEST_SUITE_END()
