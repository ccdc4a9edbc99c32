#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tandem/common/cli.hpp>
#include <tandem/execution/engine.hpp>
#include <tandem/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;
using tandem::schema::account_id_t;

struct command_context final {
  tandem::execution::engine& engine;
  const std::vector<std::string>& args;
};

using command_handler_t = std::function<int(command_context&)>;

struct command_entry final {
  std::size_t arity{};
  std::string_view usage;
  command_handler_t handler;
};

std::optional<account_id_t> parse_account(const std::string& value) {
  auto parsed = tandem::schema::try_make_hash32(value);
  if (!parsed) {
    spdlog::error("'{}' is not a 32-byte hex identity", value);
  }
  return parsed;
}

// Seeds prefixed with 0x are hex, anything else is taken as raw text.
std::optional<tandem::schema::bytes_t> parse_seed(const std::string& value) {
  if (value.starts_with("0x") || value.starts_with("0X")) {
    auto decoded = tandem::schema::try_from_hex(value);
    if (!decoded) {
      spdlog::error("'{}' is not valid hex", value);
    }
    return decoded;
  }
  return tandem::schema::make_bytes(value);
}

int report(const tandem::schema::operation_result_t& result) {
  if (!result.ok()) {
    std::cerr << result.codespace << ": " << result.info << " (" << result.log
              << ")" << std::endl;
    return static_cast<int>(result.code);
  }
  std::cout << result.info << std::endl;
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type << std::endl;
    for (const auto& attribute : event.attributes) {
      std::cout << "    " << attribute.key << " = " << attribute.value
                << std::endl;
    }
  }
  return 0;
}

void print_management(const tandem::schema::management_state_t& management) {
  std::cout << "admin " << tandem::schema::to_hex(management.admin)
            << std::endl;
  std::cout << "unclaimed (" << management.unclaimed.size() << ")"
            << std::endl;
  for (const auto& claimer : management.unclaimed) {
    std::cout << "  " << tandem::schema::to_hex(claimer) << std::endl;
  }
}

const std::map<std::string, command_entry, std::less<>>& commands() {
  static const auto table = std::map<std::string, command_entry, std::less<>>{
      {"initialize",
       {1, "initialize <installer>",
        [](command_context& ctx) {
          auto installer = parse_account(ctx.args[0]);
          if (!installer) {
            return tandem::common::kUsageExitCode;
          }
          auto result = ctx.engine.initialize(*installer);
          if (result.ok()) {
            std::cout << "module "
                      << tandem::schema::to_hex(*ctx.engine.module_account())
                      << std::endl;
          }
          return report(result);
        }}},
      {"create",
       {2, "create <creator> <seed>",
        [](command_context& ctx) {
          auto creator = parse_account(ctx.args[0]);
          auto seed = parse_seed(ctx.args[1]);
          if (!creator || !seed) {
            return tandem::common::kUsageExitCode;
          }
          auto outcome = ctx.engine.create_shared_account(
              *creator, tandem::schema::make_bytes_view(*seed));
          if (outcome.ok()) {
            std::cout << "shared account "
                      << tandem::schema::to_hex(*outcome.value) << std::endl;
          }
          return report(outcome.result);
        }}},
      {"add-claimer",
       {3, "add-claimer <admin> <target> <claimer>",
        [](command_context& ctx) {
          auto admin = parse_account(ctx.args[0]);
          auto target = parse_account(ctx.args[1]);
          auto claimer = parse_account(ctx.args[2]);
          if (!admin || !target || !claimer) {
            return tandem::common::kUsageExitCode;
          }
          return report(ctx.engine.add_claimer(*admin, *target, *claimer));
        }}},
      {"remove-claimer",
       {3, "remove-claimer <admin> <target> <claimer>",
        [](command_context& ctx) {
          auto admin = parse_account(ctx.args[0]);
          auto target = parse_account(ctx.args[1]);
          auto claimer = parse_account(ctx.args[2]);
          if (!admin || !target || !claimer) {
            return tandem::common::kUsageExitCode;
          }
          return report(ctx.engine.remove_claimer(*admin, *target, *claimer));
        }}},
      {"claim",
       {2, "claim <claimer> <target>",
        [](command_context& ctx) {
          auto claimer = parse_account(ctx.args[0]);
          auto target = parse_account(ctx.args[1]);
          if (!claimer || !target) {
            return tandem::common::kUsageExitCode;
          }
          return report(ctx.engine.claim_capability(*claimer, *target));
        }}},
      {"acquire",
       {2, "acquire <acquirer> <target>",
        [](command_context& ctx) {
          auto acquirer = parse_account(ctx.args[0]);
          auto target = parse_account(ctx.args[1]);
          if (!acquirer || !target) {
            return tandem::common::kUsageExitCode;
          }
          auto outcome = ctx.engine.acquire_authority(*acquirer, *target);
          if (outcome.ok()) {
            std::cout << "authority over "
                      << tandem::schema::to_hex(outcome.value->account())
                      << " proof "
                      << tandem::schema::to_hex(outcome.value->proof())
                      << std::endl;
          }
          return report(outcome.result);
        }}},
      {"show-account",
       {1, "show-account <target>",
        [](command_context& ctx) {
          auto target = parse_account(ctx.args[0]);
          if (!target) {
            return tandem::common::kUsageExitCode;
          }
          auto management = ctx.engine.management(*target);
          if (!management) {
            std::cerr << "no shared account at " << ctx.args[0] << std::endl;
            return static_cast<int>(tandem::schema::error_code::not_found);
          }
          print_management(*management);
          return 0;
        }}},
      {"show-capability",
       {1, "show-capability <holder>",
        [](command_context& ctx) {
          auto holder = parse_account(ctx.args[0]);
          if (!holder) {
            return tandem::common::kUsageExitCode;
          }
          auto target = ctx.engine.capability_target(*holder);
          if (!target) {
            std::cout << "no capability" << std::endl;
            return static_cast<int>(tandem::schema::error_code::no_capability);
          }
          std::cout << "capability for " << tandem::schema::to_hex(*target)
                    << std::endl;
          return 0;
        }}},
      {"counters",
       {0, "counters",
        [](command_context& ctx) {
          auto counters = ctx.engine.audit_counters();
          for (const auto& [name, type] :
               tandem::schema::kAuditEventTypeMappings) {
            std::cout << name << " "
                      << counters[static_cast<std::size_t>(type)] << std::endl;
          }
          return 0;
        }}},
      {"events",
       {1, "events <kind>",
        [](command_context& ctx) {
          auto type = tandem::schema::try_from_string<
              tandem::schema::audit_event_type_t>(ctx.args[0]);
          if (!type) {
            spdlog::error("unknown audit event kind '{}'", ctx.args[0]);
            return tandem::common::kUsageExitCode;
          }
          for (const auto& event : ctx.engine.audit_events(*type)) {
            std::cout << event.sequence << " actor "
                      << tandem::schema::to_hex(event.actor) << " target "
                      << tandem::schema::to_hex(event.target);
            if (event.subject) {
              std::cout << " subject "
                        << tandem::schema::to_hex(*event.subject);
            }
            std::cout << std::endl;
          }
          return 0;
        }}},
  };
  return table;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto command = std::string{};
  auto args = std::vector<std::string>{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Tandem"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("tandem.db"),
      "RocksDB directory holding shared-account state")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      tandem::common::kLogLevelNames.data())(
      "log-file", po::value<std::string>(&log_file)->default_value("tandem.log"),
      "File receiving a copy of the log");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&command))(
      "args", po::value<std::vector<std::string>>(&args));
  auto all = po::options_description{};
  all.add(description).add(hidden);
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return tandem::common::kUsageExitCode;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: tandem [options] <command> [args...]" << std::endl;
    for (const auto& [name, entry] : commands()) {
      std::cout << "  " << entry.usage << std::endl;
    }
    std::cout << description << std::endl;
    return command.empty() && !vm.contains("help")
               ? tandem::common::kUsageExitCode
               : 0;
  }

  auto level = tandem::common::try_parse_log_level(log_level);
  if (!level) {
    std::cerr << "unknown --log-level '" << log_level << "'; expected "
              << tandem::common::kLogLevelNames << std::endl;
    return tandem::common::kUsageExitCode;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tandem", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(*level);

  auto found = commands().find(command);
  if (found == std::end(commands())) {
    spdlog::error("unknown command '{}'", command);
    spdlog::shutdown();
    return tandem::common::kUsageExitCode;
  }
  if (args.size() != found->second.arity) {
    std::cerr << "usage: tandem " << found->second.usage << std::endl;
    spdlog::shutdown();
    return tandem::common::kUsageExitCode;
  }

  auto encoder = tandem::execution::engine::encoder_t{};
  auto storage =
      tandem::storage::make_storage<tandem::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = tandem::execution::engine{encoder, storage};

  auto context = command_context{.engine = engine, .args = args};
  auto status = found->second.handler(context);

  spdlog::shutdown();
  return status;
}
