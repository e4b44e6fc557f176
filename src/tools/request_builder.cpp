#include <boost/program_options.hpp>
#include <bastion/account/account.hpp>
#include <bastion/common/critical.hpp>
#include <bastion/crypto/secp256k1.hpp>
#include <bastion/dispatcher/dispatcher.hpp>
#include <bastion/host/runtime.hpp>
#include <bastion/schema/approval_call.hpp>
#include <bastion/schema/encoding/scale/encoder.hpp>
#include <bastion/schema/module_call.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = bastion::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

std::string encode_base64(const bastion::schema::bytes_t& input) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((input.size() + 2) / 3) * 4);

  auto i = size_t{0};
  for (; i + 3 <= input.size(); i += 3) {
    auto value = (static_cast<uint32_t>(input[i]) << 16u) |
                 (static_cast<uint32_t>(input[i + 1]) << 8u) |
                 static_cast<uint32_t>(input[i + 2]);
    for (auto shift : {18u, 12u, 6u, 0u}) {
      out.push_back(kTable[(value >> shift) & 0x3Fu]);
    }
  }
  auto remaining = input.size() - i;
  if (remaining > 0) {
    auto value = static_cast<uint32_t>(input[i]) << 16u;
    if (remaining == 2) {
      value |= static_cast<uint32_t>(input[i + 1]) << 8u;
    }
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(remaining == 2 ? kTable[(value >> 6u) & 0x3Fu] : '=');
    out.push_back('=');
  }
  return out;
}

bastion::schema::bytes_t get_bytes(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  auto bytes = bastion::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    bastion::common::critical("--{} must be hex", name);
  }
  return *bytes;
}

bastion::schema::hash32_t get_hash32(const po::variables_map& vm,
                                         const std::string& name) {
  if (!vm.contains(name)) {
    bastion::common::critical("missing required --{}", name);
  }
  auto identity = bastion::schema::try_make_hash32(vm[name].as<std::string>());
  if (!identity) {
    bastion::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *identity;
}

std::vector<bastion::schema::identity_t> get_identities(
    const po::variables_map& vm,
    const std::string& name) {
  auto out = std::vector<bastion::schema::identity_t>{};
  if (!vm.contains(name)) {
    return out;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto identity = bastion::schema::try_make_hash32(value);
    if (!identity) {
      bastion::common::critical("--{} values must be 32-byte hex identities",
                                name);
    }
    out.push_back(*identity);
  }
  return out;
}

bastion::schema::identity_t get_first_owner(const po::variables_map& vm) {
  auto owners = get_identities(vm, "owner");
  if (owners.empty()) {
    bastion::common::critical("missing required --owner");
  }
  return owners.front();
}

bastion::schema::amount_t get_amount(const po::variables_map& vm,
                                     const std::string& name) {
  const auto& text = vm[name].as<std::string>();
  try {
    return bastion::schema::amount_t{text.c_str()};
  } catch (const std::runtime_error& error) {
    bastion::common::critical("--{} must be a decimal amount: {}", name,
                              error.what());
  }
}

bastion::schema::routing_key_t get_routing_key(const po::variables_map& vm) {
  auto key =
      bastion::schema::try_make_routing_key(vm["routing-key"].as<std::string>());
  if (!key) {
    bastion::common::critical("--routing-key must be 4 bytes of hex");
  }
  return *key;
}

bastion::schema::account_call_t build_account_call(const po::variables_map& vm) {
  auto call = vm["call"].as<std::string>();
  if (call == "forward") {
    return bastion::schema::forward_t{.target = get_hash32(vm, "target"),
                                      .value = get_amount(vm, "value"),
                                      .payload = get_bytes(vm, "payload-hex")};
  }
  if (call == "install") {
    return bastion::schema::install_module_t{
        .key = get_routing_key(vm),
        .module = get_hash32(vm, "module"),
        .init_data = get_bytes(vm, "init-hex")};
  }
  if (call == "uninstall") {
    return bastion::schema::uninstall_module_t{
        .key = get_routing_key(vm), .data = get_bytes(vm, "init-hex")};
  }
  bastion::common::critical("--call must be forward|install|uninstall");
}

bastion::schema::approval_call_t build_approval_call(
    const po::variables_map& vm) {
  auto op = vm["op"].as<std::string>();
  auto account = get_hash32(vm, "account");
  auto id = vm["id"].as<uint64_t>();
  if (op == "submit") {
    return bastion::schema::submit_transaction_t{
        .account = account,
        .target = get_hash32(vm, "target"),
        .value = get_amount(vm, "value"),
        .payload = get_bytes(vm, "payload-hex")};
  }
  if (op == "confirm") {
    return bastion::schema::confirm_transaction_t{.account = account, .id = id};
  }
  if (op == "revoke") {
    return bastion::schema::revoke_confirmation_t{.account = account, .id = id};
  }
  if (op == "execute") {
    return bastion::schema::execute_transaction_t{.account = account, .id = id};
  }
  if (op == "add-owner") {
    return bastion::schema::add_owner_t{.account = account,
                                        .owner = get_first_owner(vm)};
  }
  if (op == "remove-owner") {
    return bastion::schema::remove_owner_t{.account = account,
                                           .owner = get_first_owner(vm)};
  }
  if (op == "change-threshold") {
    return bastion::schema::change_threshold_t{
        .account = account, .threshold = vm["threshold"].as<uint32_t>()};
  }
  bastion::common::critical(
      "--op must be submit|confirm|revoke|execute|add-owner|remove-owner|"
      "change-threshold");
}

bastion::schema::authorization_request_t build_request(
    const po::variables_map& vm) {
  return bastion::schema::authorization_request_t{
      .sender = get_hash32(vm, "sender"),
      .sequence = vm["sequence"].as<uint64_t>(),
      .init_payload = {},
      .call_payload = get_bytes(vm, "call-payload-hex"),
      .call_budget = vm["call-budget"].as<uint64_t>(),
      .verification_budget = vm["verification-budget"].as<uint64_t>(),
      .pre_verification_budget = vm["pre-verification-budget"].as<uint64_t>(),
      .max_fee = get_amount(vm, "max-fee"),
      .max_priority_fee = get_amount(vm, "max-priority-fee"),
      .auxiliary_payload = {},
      .approval = get_bytes(vm, "approval-hex")};
}

void print_bytes(const po::variables_map& vm,
                 const bastion::schema::bytes_t& bytes) {
  if (vm["format"].as<std::string>() == "base64") {
    std::cout << encode_base64(bytes) << '\n';
    return;
  }
  std::cout << bastion::schema::to_hex(bastion::schema::make_bytes_view(bytes))
            << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  request_builder call-payload [options]\n"
            << "  request_builder account-call [options]\n"
            << "  request_builder install-data [options]\n"
            << "  request_builder approval-proof [options]\n"
            << "  request_builder approval-call [options]\n"
            << "  request_builder request-hash [options]\n"
            << "  request_builder sign [options]\n"
            << "  request_builder keygen\n"
            << "  request_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"request_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "call-payload|account-call|install-data|approval-proof|approval-call|"
      "request-hash|sign|keygen|chain-id")(
      "format", po::value<std::string>()->default_value("hex"), "hex|base64")(
      "routing-key", po::value<std::string>()->default_value("00000000"),
      "4-byte routing key hex")(
      "call", po::value<std::string>()->default_value("forward"),
      "forward|install|uninstall")(
      "target", po::value<std::string>(), "target identity hex")(
      "value", po::value<std::string>()->default_value("0"), "decimal amount")(
      "payload-hex", po::value<std::string>(), "forwarded payload hex")(
      "module", po::value<std::string>(), "module identity hex")(
      "init-hex", po::value<std::string>(), "module hook data hex")(
      "owner", po::value<std::vector<std::string>>()->multitoken(),
      "owner identity hex values")(
      "threshold", po::value<uint32_t>()->default_value(1),
      "approval threshold")("id", po::value<uint64_t>()->default_value(0),
                            "transaction id")(
      "signer", po::value<std::vector<std::string>>()->multitoken(),
      "signer identity hex values")(
      "op", po::value<std::string>()->default_value("submit"),
      "approval operation")("account", po::value<std::string>(),
                            "account identity hex")(
      "sender", po::value<std::string>(), "request sender identity hex")(
      "sequence", po::value<uint64_t>()->default_value(0), "request sequence")(
      "call-payload-hex", po::value<std::string>(), "request call payload hex")(
      "approval-hex", po::value<std::string>(), "request approval blob hex")(
      "call-budget", po::value<uint64_t>()->default_value(0), "call budget")(
      "verification-budget", po::value<uint64_t>()->default_value(0),
      "verification budget")("pre-verification-budget",
                             po::value<uint64_t>()->default_value(0),
                             "pre-verification budget")(
      "max-fee", po::value<std::string>()->default_value("0"),
      "decimal max fee")("max-priority-fee",
                         po::value<std::string>()->default_value("0"),
                         "decimal max priority fee")(
      "dispatcher", po::value<std::string>(), "dispatcher identity hex")(
      "chain-id",
      po::value<uint64_t>()->default_value(bastion::host::kDefaultChainId),
      "chain id")("request-hash", po::value<std::string>(),
                  "request hash hex")(
      "private-key", po::value<std::string>(), "secp256k1 private key hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};

  if (command == "call-payload") {
    print_bytes(vm, bastion::account::make_call_payload(
                        encoder, get_routing_key(vm), build_account_call(vm)));
    return 0;
  }

  if (command == "account-call") {
    print_bytes(vm, encoder.encode(build_account_call(vm)));
    return 0;
  }

  if (command == "install-data") {
    auto setup = bastion::schema::approval_setup_t{
        .owners = get_identities(vm, "owner"),
        .threshold = vm["threshold"].as<uint32_t>()};
    print_bytes(vm, encoder.encode(setup));
    return 0;
  }

  if (command == "approval-proof") {
    auto proof = bastion::schema::approval_proof_t{
        .id = vm["id"].as<uint64_t>(), .signers = get_identities(vm, "signer")};
    print_bytes(vm, encoder.encode(proof));
    return 0;
  }

  if (command == "approval-call") {
    auto envelope = bastion::schema::module_call_t{
        bastion::schema::extension_call_t{
            .body = encoder.encode(build_approval_call(vm))}};
    print_bytes(vm, encoder.encode(envelope));
    return 0;
  }

  if (command == "request-hash") {
    auto hash = bastion::dispatcher::make_request_hash(
        encoder, build_request(vm), get_hash32(vm, "dispatcher"),
        vm["chain-id"].as<uint64_t>());
    print_bytes(vm, bastion::schema::bytes_t{hash.begin(), hash.end()});
    return 0;
  }

  if (command == "sign") {
    auto key = bastion::schema::try_make_hash32(
        vm.contains("private-key") ? vm["private-key"].as<std::string>() : "");
    if (!key) {
      bastion::common::critical("--private-key must be 32 bytes of hex");
    }
    auto digest = bastion::account::make_default_route_digest(
        encoder, get_hash32(vm, "request-hash"), get_hash32(vm, "account"),
        vm["chain-id"].as<uint64_t>());
    auto signature = bastion::crypto::sign_recoverable(digest, *key);
    if (!signature) {
      bastion::common::critical("failed to sign request hash");
    }
    print_bytes(vm, bastion::schema::bytes_t{signature->begin(),
                                             signature->end()});
    return 0;
  }

  if (command == "keygen") {
    auto key = bastion::crypto::generate_private_key();
    if (!key) {
      bastion::common::critical("failed to generate private key");
    }
    auto public_key = bastion::crypto::derive_public_key(*key);
    if (!public_key) {
      bastion::common::critical("failed to derive public key");
    }
    auto identity = bastion::crypto::identity_of(*public_key);
    std::cout << "private_key=" << bastion::schema::to_hex(*key) << '\n'
              << "public_key="
              << bastion::schema::to_hex(bastion::schema::bytes_view_t{
                     public_key->data(), public_key->size()})
              << '\n'
              << "identity=" << bastion::schema::to_hex(identity) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << bastion::host::kDefaultChainId << '\n';
    return 0;
  }

  bastion::common::critical(
      "command must be call-payload|account-call|install-data|approval-proof|"
      "approval-call|request-hash|sign|keygen|chain-id");
}
