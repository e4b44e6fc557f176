#include <gtest/gtest.h>
#include <bastion/crypto/secp256k1.hpp>
#include <bastion/dispatcher/dispatcher.hpp>
#include <bastion/testing/runtime_fixture.hpp>

#include <limits>
#include <memory>
#include <vector>

namespace {

using bastion::schema::error_code;
using bastion::testing::make_identity;
using bastion::testing::runtime_fixture;

const auto kDefaultKey = bastion::testing::make_routing_key(0);
const auto kApprovalKey = bastion::testing::make_routing_key(1);
const auto kOwnerA = make_identity(0x0a);
const auto kOwnerB = make_identity(0x0b);

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

bastion::crypto::private_key_t signing_key() {
  auto key = bastion::crypto::private_key_t{};
  key[31] = 0x11;
  return key;
}

/// Attach a default-route signature over the request as `fixture`'s
/// dispatcher will hash it.
void sign(runtime_fixture& fixture,
          bastion::schema::authorization_request_t& request) {
  auto hash = fixture.dispatcher().request_hash(fixture.runtime(), request);
  auto digest = bastion::account::make_default_route_digest(
      fixture.encoder(), hash, request.sender, fixture.runtime().chain_id());
  auto signature = bastion::crypto::sign_recoverable(digest, signing_key());
  ASSERT_TRUE(signature.has_value());
  request.approval.assign(signature->begin(), signature->end());
}

bastion::schema::authorization_request_t signed_forward(
    runtime_fixture& fixture,
    const bastion::schema::identity_t& target,
    bastion::schema::bytes_t payload) {
  auto request = bastion::testing::make_request(
      fixture.encoder(), fixture.account_id(), kDefaultKey,
      bastion::schema::forward_t{
          .target = target, .value = 0, .payload = std::move(payload)});
  sign(fixture, request);
  return request;
}

std::vector<bastion::schema::event_t> events_of_type(
    const std::vector<bastion::schema::event_t>& events,
    const std::string_view type) {
  auto out = std::vector<bastion::schema::event_t>{};
  for (const auto& event : events) {
    if (event.type == type) {
      out.push_back(event);
    }
  }
  return out;
}

}  // namespace

TEST(dispatcher, plain_transfer_tops_up_sender_deposit) {
  auto fixture = runtime_fixture{"bastion_dispatcher_plain_deposit"};
  auto sender = make_identity(0x31);
  fixture.runtime().fund(sender, 30);
  auto result =
      fixture.runtime().submit(sender, fixture.dispatcher_id(), 30, {});
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(), sender), 30);
  EXPECT_EQ(fixture.runtime().balance_of(fixture.dispatcher_id()), 30);
  EXPECT_TRUE(bastion::testing::has_event(result.events, "deposited"));
}

TEST(dispatcher, deposit_to_credits_named_account) {
  auto fixture = runtime_fixture{"bastion_dispatcher_deposit_to"};
  auto sender = make_identity(0x31);
  fixture.runtime().fund(sender, 30);
  auto result = fixture.runtime().submit(
      sender, fixture.dispatcher_id(), 12,
      bastion::testing::make_dispatcher_call(
          fixture.encoder(),
          bastion::schema::deposit_to_t{.account = fixture.account_id()}));
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(),
                                            fixture.account_id()),
            12);
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(), sender), 0);

  auto null_account = fixture.runtime().submit(
      sender, fixture.dispatcher_id(), 1,
      bastion::testing::make_dispatcher_call(
          fixture.encoder(),
          bastion::schema::deposit_to_t{
              .account = bastion::schema::make_null_identity()}));
  EXPECT_EQ(null_account.code, code_of(error_code::null_identity));
  EXPECT_EQ(fixture.runtime().balance_of(sender), 18);
}

TEST(dispatcher, withdraw_to_moves_deposit_out) {
  auto fixture = runtime_fixture{"bastion_dispatcher_withdraw"};
  auto holder = make_identity(0x31);
  auto destination = make_identity(0x32);
  fixture.runtime().fund(holder, 50);
  ASSERT_TRUE(
      fixture.runtime().submit(holder, fixture.dispatcher_id(), 50, {}).ok());

  auto withdraw = [&](const bastion::schema::amount_t& amount) {
    return fixture.runtime().submit(
        holder, fixture.dispatcher_id(), 0,
        bastion::testing::make_dispatcher_call(
            fixture.encoder(),
            bastion::schema::withdraw_to_t{.destination = destination,
                                           .amount = amount}));
  };
  auto too_much = withdraw(51);
  EXPECT_EQ(too_much.code, code_of(error_code::insufficient_balance));

  auto result = withdraw(20);
  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(bastion::testing::has_event(result.events, "withdrawn"));
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(), holder), 30);
  EXPECT_EQ(fixture.runtime().balance_of(destination), 20);
  EXPECT_EQ(fixture.runtime().balance_of(fixture.dispatcher_id()), 30);
}

TEST(dispatcher, request_hash_binds_dispatcher_and_chain) {
  auto fixture = runtime_fixture{"bastion_dispatcher_request_hash"};
  auto& encoder = fixture.encoder();
  auto request = bastion::testing::make_request(
      encoder, fixture.account_id(), kDefaultKey,
      bastion::schema::forward_t{.target = fixture.target_id()});

  auto hash = fixture.dispatcher().request_hash(fixture.runtime(), request);
  EXPECT_EQ(hash, bastion::dispatcher::make_request_hash(
                      encoder, request, fixture.dispatcher_id(), 31337));
  EXPECT_NE(hash, bastion::dispatcher::make_request_hash(
                      encoder, request, make_identity(0xd2), 31337));
  EXPECT_NE(hash, bastion::dispatcher::make_request_hash(
                      encoder, request, fixture.dispatcher_id(), 1));

  // The approval blob is not part of what gets signed.
  auto with_approval = request;
  with_approval.approval = {0x01};
  EXPECT_EQ(bastion::dispatcher::make_request_digest(encoder, with_approval),
            bastion::dispatcher::make_request_digest(encoder, request));
  with_approval.sequence = 1;
  EXPECT_NE(bastion::dispatcher::make_request_digest(encoder, with_approval),
            bastion::dispatcher::make_request_digest(encoder, request));
}

TEST(dispatcher, required_prefund_is_budget_times_max_fee) {
  auto request = bastion::schema::authorization_request_t{};
  request.call_budget = 10;
  request.verification_budget = 5;
  request.pre_verification_budget = 1;
  request.max_fee = 3;
  auto prefund = bastion::dispatcher::required_prefund(request);
  ASSERT_TRUE(prefund.has_value());
  EXPECT_EQ(*prefund, 48);
}

TEST(dispatcher, required_prefund_rejects_overflowing_product) {
  auto request = bastion::schema::authorization_request_t{};
  request.call_budget = 2;
  request.max_fee = bastion::schema::amount_t{1} << 255;
  EXPECT_FALSE(bastion::dispatcher::required_prefund(request).has_value());

  request.max_fee = bastion::schema::amount_t{1} << 254;
  auto prefund = bastion::dispatcher::required_prefund(request);
  ASSERT_TRUE(prefund.has_value());
  EXPECT_EQ(*prefund, bastion::schema::amount_t{1} << 255);

  request.call_budget = 0;
  request.max_fee = std::numeric_limits<bastion::schema::amount_t>::max();
  prefund = bastion::dispatcher::required_prefund(request);
  ASSERT_TRUE(prefund.has_value());
  EXPECT_EQ(*prefund, 0);
}

TEST(dispatcher, overflowing_prefund_fails_the_batch) {
  auto fixture = runtime_fixture{"bastion_dispatcher_prefund_overflow"};
  auto request = signed_forward(fixture, fixture.target_id(), {0x01});
  request.call_budget = 2;
  request.verification_budget = 0;
  request.pre_verification_budget = 0;
  request.max_fee = bastion::schema::amount_t{1} << 255;

  auto result = fixture.handle_requests({request});
  EXPECT_EQ(result.code, code_of(error_code::invalid_payload));
  EXPECT_EQ(result.codespace, bastion::dispatcher::kCodespace);
  EXPECT_TRUE(fixture.target().calls().empty());
  EXPECT_EQ(bastion::account::sequence_of(fixture.journal(),
                                          fixture.account_id()),
            0u);
  EXPECT_EQ(fixture.runtime().balance_of(fixture.account_id()), 0);
}

TEST(dispatcher, handle_requests_forwards_authorized_call) {
  auto fixture = runtime_fixture{"bastion_dispatcher_forward"};
  auto request = signed_forward(fixture, fixture.target_id(), {0x01, 0x02});
  auto expected_hash =
      fixture.dispatcher().request_hash(fixture.runtime(), request);

  auto result = fixture.handle_requests({request});
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_EQ(fixture.target().calls().size(), 1u);
  EXPECT_EQ(fixture.target().calls()[0].caller, fixture.account_id());
  EXPECT_EQ(fixture.target().calls()[0].payload,
            (bastion::schema::bytes_t{0x01, 0x02}));
  EXPECT_EQ(bastion::account::sequence_of(fixture.journal(),
                                          fixture.account_id()),
            1u);

  auto processed = events_of_type(result.events, "request_processed");
  ASSERT_EQ(processed.size(), 1u);
  EXPECT_EQ(bastion::testing::attribute_of(processed[0], "success"), "true");
  EXPECT_EQ(bastion::testing::attribute_of(processed[0], "request_hash"),
            bastion::schema::to_hex(expected_hash));
}

TEST(dispatcher, unknown_sender_fails_the_batch) {
  auto fixture = runtime_fixture{"bastion_dispatcher_unknown_sender"};
  auto request = signed_forward(fixture, fixture.target_id(), {0x01});
  request.sender = make_identity(0x99);
  auto result = fixture.handle_requests({request});
  EXPECT_EQ(result.code, code_of(error_code::endpoint_missing));
  EXPECT_TRUE(fixture.target().calls().empty());
}

TEST(dispatcher, rejected_request_aborts_the_batch) {
  auto fixture = runtime_fixture{"bastion_dispatcher_rejected"};
  auto accepted = signed_forward(fixture, fixture.target_id(), {0x01});
  auto rejected = signed_forward(fixture, fixture.target_id(), {0x02});
  rejected.approval = bastion::schema::bytes_t(65, 0x00);

  auto result = fixture.handle_requests({accepted, rejected});
  EXPECT_EQ(result.code, code_of(error_code::request_rejected));
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(bastion::testing::recording_target::hits(fixture.runtime()), 0u);
  EXPECT_EQ(bastion::account::sequence_of(fixture.journal(),
                                          fixture.account_id()),
            0u);
}

TEST(dispatcher, failing_body_does_not_abort_the_batch) {
  auto fixture = runtime_fixture{"bastion_dispatcher_failing_body"};
  auto failing_id = make_identity(0x72);
  auto failing = std::make_shared<bastion::testing::recording_target>();
  failing->fail_with({0x07});
  fixture.runtime().attach(failing_id, failing);

  auto first = signed_forward(fixture, failing_id, {0x01});
  auto second = signed_forward(fixture, fixture.target_id(), {0x02});
  auto result = fixture.handle_requests({first, second});
  ASSERT_TRUE(result.ok()) << result.log;

  auto processed = events_of_type(result.events, "request_processed");
  ASSERT_EQ(processed.size(), 2u);
  EXPECT_EQ(bastion::testing::attribute_of(processed[0], "success"), "false");
  EXPECT_EQ(bastion::testing::attribute_of(processed[0], "code"),
            std::to_string(code_of(error_code::call_reverted)));
  EXPECT_EQ(bastion::testing::attribute_of(processed[1], "success"), "true");
  EXPECT_EQ(bastion::testing::recording_target::hits(fixture.runtime()), 1u);
  // Both requests were authorized.
  EXPECT_EQ(bastion::account::sequence_of(fixture.journal(),
                                          fixture.account_id()),
            2u);
}

TEST(dispatcher, shortfall_is_drawn_from_account_into_deposit) {
  auto fixture = runtime_fixture{"bastion_dispatcher_prefund"};
  fixture.runtime().fund(fixture.account_id(), 50);

  auto request = bastion::testing::make_request(
      fixture.encoder(), fixture.account_id(), kDefaultKey,
      bastion::schema::forward_t{
          .target = fixture.target_id(), .value = 0, .payload = {0x01}});
  request.call_budget = 10;
  request.max_fee = 2;
  sign(fixture, request);

  ASSERT_TRUE(fixture.handle_requests({request}).ok());
  EXPECT_EQ(fixture.runtime().balance_of(fixture.account_id()), 30);
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(),
                                            fixture.account_id()),
            20);

  // The deposit now covers the prefund; nothing more is drawn.
  request.sequence = 1;
  sign(fixture, request);
  ASSERT_TRUE(fixture.handle_requests({request}).ok());
  EXPECT_EQ(fixture.runtime().balance_of(fixture.account_id()), 30);
  EXPECT_EQ(fixture.dispatcher().deposit_of(fixture.journal(),
                                            fixture.account_id()),
            20);
}

TEST(dispatcher, unaffordable_shortfall_fails_the_batch) {
  auto fixture = runtime_fixture{"bastion_dispatcher_prefund_fails"};
  auto request = bastion::testing::make_request(
      fixture.encoder(), fixture.account_id(), kDefaultKey,
      bastion::schema::forward_t{
          .target = fixture.target_id(), .value = 0, .payload = {0x01}});
  request.call_budget = 10;
  request.max_fee = 2;
  sign(fixture, request);

  auto result = fixture.handle_requests({request});
  EXPECT_EQ(result.code, code_of(error_code::prefund_failed));
  EXPECT_TRUE(fixture.target().calls().empty());
}

TEST(dispatcher, multisig_request_runs_end_to_end) {
  auto fixture = runtime_fixture{"bastion_dispatcher_multisig"};
  auto& encoder = fixture.encoder();

  // Install the approval module through a signed self call.
  auto install = bastion::testing::make_request(
      encoder, fixture.account_id(), kDefaultKey,
      bastion::testing::make_self_forward(
          encoder, fixture.account_id(),
          bastion::schema::install_module_t{
              .key = kApprovalKey,
              .module = fixture.approval_id(),
              .init_data = bastion::testing::make_install_data(
                  encoder, {kOwnerA, kOwnerB}, 2)}));
  sign(fixture, install);
  auto installed = fixture.handle_requests({install});
  ASSERT_TRUE(installed.ok()) << installed.log;
  ASSERT_TRUE(bastion::testing::has_event(installed.events, "module_installed"));
  ASSERT_TRUE(bastion::account::installed_module(
                  fixture.journal(), fixture.account_id(), kApprovalKey)
                  .has_value());

  auto id = fixture.submit(kOwnerA, fixture.target_id(), 0, {0x0c});
  ASSERT_TRUE(fixture
                  .approval_call(kOwnerB,
                                 bastion::schema::confirm_transaction_t{
                                     .account = fixture.account_id(),
                                     .id = id})
                  .ok());

  auto request = bastion::testing::make_request(
      encoder, fixture.account_id(), kApprovalKey,
      bastion::schema::forward_t{
          .target = fixture.target_id(), .value = 0, .payload = {0x0c}},
      bastion::testing::make_approval_proof(encoder, id, {kOwnerA, kOwnerB}));
  auto result = fixture.handle_requests({request});
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_EQ(fixture.target().calls().size(), 1u);
  EXPECT_EQ(fixture.target().calls()[0].caller, fixture.account_id());
  EXPECT_EQ(fixture.target().calls()[0].payload,
            (bastion::schema::bytes_t{0x0c}));

  // A proof for a different payload is refused by the module.
  auto tampered = bastion::testing::make_request(
      encoder, fixture.account_id(), kApprovalKey,
      bastion::schema::forward_t{
          .target = fixture.target_id(), .value = 0, .payload = {0x0d}},
      bastion::testing::make_approval_proof(encoder, id, {kOwnerA, kOwnerB}));
  EXPECT_EQ(fixture.handle_requests({tampered}).code,
            code_of(error_code::request_rejected));
  EXPECT_EQ(fixture.target().calls().size(), 1u);
}
