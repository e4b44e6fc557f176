#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bastion/account/account.hpp>
#include <bastion/common/critical.hpp>
#include <bastion/modules/approval_ledger.hpp>
#include <bastion/schema/key/state_keys.hpp>
#include <bastion/state/journal.hpp>
#include <bastion/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>

namespace {

namespace po = boost::program_options;

bastion::schema::identity_t require_identity(const po::variables_map& vm,
                                             const std::string& name) {
  if (!vm.contains(name)) {
    bastion::common::critical("command requires --{}", name);
  }
  auto identity = bastion::schema::try_make_hash32(vm[name].as<std::string>());
  if (!identity) {
    bastion::common::critical("--{} must be a 32-byte hex identity", name);
  }
  return *identity;
}

std::string join_hex(const std::vector<bastion::schema::identity_t>& values) {
  auto out = std::string{};
  for (const auto& value : values) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += bastion::schema::to_hex(value);
  }
  return out;
}

void print_record(const bastion::schema::transaction_record_t& record,
                  const bastion::schema::transaction_status_t status) {
  std::cout << "id=" << record.id << '\n'
            << "target=" << bastion::schema::to_hex(record.target) << '\n'
            << "value=" << record.value.str() << '\n'
            << "payload="
            << bastion::schema::to_hex(
                   bastion::schema::make_bytes_view(record.payload))
            << '\n'
            << "content_hash=" << bastion::schema::to_hex(record.content_hash)
            << '\n'
            << "executed=" << (record.executed ? "true" : "false") << '\n'
            << "confirmations=" << record.confirmations << '\n'
            << "status=" << bastion::schema::to_string(status) << '\n'
            << "submitted_by=" << bastion::schema::to_hex(record.submitted_by)
            << '\n'
            << "created_at=" << record.created_at << '\n';
}

int print_events(bastion::state::journal& journal, const size_t limit) {
  auto& encoder = journal.encoder();
  auto records = std::vector<bastion::schema::event_record_t>{};
  for (const auto& [key, value] :
       journal.list_by_prefix(bastion::schema::key::make_prefix_key(
           encoder, bastion::schema::key::kEventPrefix))) {
    auto record = encoder.try_decode<bastion::schema::event_record_t>(
        bastion::schema::make_bytes_view(value));
    if (!record) {
      spdlog::warn("skipping undecodable event entry");
      continue;
    }
    records.push_back(std::move(*record));
  }
  std::ranges::sort(records, {}, &bastion::schema::event_record_t::sequence);
  auto first = records.size() > limit ? records.size() - limit : 0;
  for (auto i = first; i < records.size(); ++i) {
    const auto& record = records[i];
    std::cout << record.sequence << " height=" << record.height
              << " emitter=" << bastion::schema::to_hex(record.emitter) << ' '
              << record.event.type;
    for (const auto& attribute : record.event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto config_path = std::string{};
  auto log_path = std::string{};

  auto description = po::options_description{"bastion"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "info|config|transaction|pending|confirmations|registry|events")(
      "db,d", po::value<std::string>(&db_path)->default_value("bastion.db"),
      "RocksDB directory")("config,c", po::value<std::string>(&config_path),
                           "Options file")(
      "log-file", po::value<std::string>(&log_path)->default_value("bastion.log"),
      "Log file")("account,a", po::value<std::string>(),
                  "Account identity hex")(
      "module,m", po::value<std::string>(), "Approval module identity hex")(
      "owner,o", po::value<std::string>(), "Owner identity hex")(
      "id,i", po::value<uint64_t>(), "Transaction id")(
      "limit,l", po::value<size_t>()->default_value(50),
      "Number of most recent events")("verbose,v", "Enable verbose output");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto file = std::ifstream{vm["config"].as<std::string>()};
    if (!file) {
      std::cerr << "cannot open options file " << vm["config"].as<std::string>()
                << '\n';
      return 1;
    }
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "bastion", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto store = bastion::storage::make_read_only_storage<
      bastion::storage::rocksdb_storage_tag>(db_path);
  auto journal = bastion::state::journal{store};

  auto status = 0;
  if (command == "info") {
    auto committed = journal.committed();
    std::cout << "height=" << committed.height << '\n'
              << "state_root=" << bastion::schema::to_hex(committed.state_root)
              << '\n';
  } else if (command == "registry") {
    auto account = require_identity(vm, "account");
    for (const auto& entry : bastion::account::list_registry(journal, account)) {
      std::cout << bastion::schema::to_hex(bastion::schema::bytes_view_t{
                       entry.key.data(), entry.key.size()})
                << ' ' << bastion::schema::to_hex(entry.module)
                << " installed_at=" << entry.installed_at << '\n';
    }
    std::cout << "sequence=" << bastion::account::sequence_of(journal, account)
              << '\n';
  } else if (command == "events") {
    status = print_events(journal, vm["limit"].as<size_t>());
  } else {
    auto ledger = bastion::modules::approval_ledger{
        journal, require_identity(vm, "module"),
        require_identity(vm, "account")};
    auto config = ledger.config();
    if (command == "config") {
      if (!config) {
        std::cout << "lifecycle=uninitialized\n";
      } else {
        std::cout << "lifecycle=" << bastion::schema::to_string(config->lifecycle)
                  << '\n'
                  << "threshold=" << config->threshold << '\n'
                  << "owners=" << join_hex(config->owners) << '\n'
                  << "transactions=" << ledger.next_id() << '\n'
                  << "escrow=" << ledger.escrow().str() << '\n';
      }
    } else if (command == "transaction") {
      if (!vm.contains("id")) {
        bastion::common::critical("transaction requires --id");
      }
      auto id = vm["id"].as<uint64_t>();
      auto record = ledger.transaction(id);
      if (!record) {
        std::cerr << "transaction " << id << " not found\n";
        status = 1;
      } else {
        print_record(*record, *ledger.status(id));
        std::cout << "confirmed_by=" << join_hex(ledger.confirming_owners(id))
                  << '\n';
      }
    } else if (command == "pending") {
      for (const auto id : ledger.pending()) {
        std::cout << id << '\n';
      }
    } else if (command == "confirmations") {
      if (vm.contains("owner")) {
        for (const auto id :
             ledger.confirmed_by(require_identity(vm, "owner"))) {
          std::cout << id << '\n';
        }
      } else if (vm.contains("id")) {
        for (const auto& owner :
             ledger.confirming_owners(vm["id"].as<uint64_t>())) {
          std::cout << bastion::schema::to_hex(owner) << '\n';
        }
      } else {
        bastion::common::critical("confirmations requires --owner or --id");
      }
    } else {
      std::cerr << "unknown command '" << command << "'\n"
                << description << '\n';
      status = 1;
    }
  }

  spdlog::shutdown();
  return status;
}
