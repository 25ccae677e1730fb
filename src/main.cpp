#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <waybill/execution/engine.hpp>

#include <array>
#include <filesystem>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace po = boost::program_options;

using namespace waybill::schema;

namespace {

inline constexpr auto kCommands = std::array<std::string_view, 7>{
    "create", "transition", "show", "list", "history", "verify", "audit"};

/// Bad command line; reported with a usage hint and exit status 1.
class usage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

payload_t parse_payload(const std::vector<std::string>& entries) {
  auto payload = payload_t{};
  for (const auto& entry : entries) {
    auto split = entry.find('=');
    if (split == std::string::npos || split == 0) {
      throw usage_error{
          fmt::format("payload entry '{}' is not key=value", entry)};
    }
    payload.insert_or_assign(entry.substr(0, split), entry.substr(split + 1));
  }
  return payload;
}

template <typename Enum, std::size_t N>
Enum require_enum(const po::variables_map& vm,
                  const std::string& name,
                  const std::array<std::pair<std::string_view, Enum>, N>& names) {
  if (!vm.contains(name)) {
    throw usage_error{fmt::format("this command requires --{}", name)};
  }
  auto value = vm[name].as<std::string>();
  auto parsed = try_from_string<Enum>(value);
  if (!parsed) {
    throw usage_error{fmt::format("unknown --{} '{}', expected one of {}",
                                  name, value, join_names(names, "|"))};
  }
  return *parsed;
}

std::string require_shipment(const po::variables_map& vm) {
  if (!vm.contains("shipment")) {
    throw usage_error{"this command requires --shipment"};
  }
  return vm["shipment"].as<std::string>();
}

void print_result(const transition_result_t& result) {
  std::cout << result.shipment_id << ' ' << to_string(result.code);
  if (result.accepted()) {
    std::cout << " seq=" << result.event_seq << " event=" << result.event_id
              << ' ' << to_string(result.previous_state) << " -> "
              << to_string(result.new_state);
  }
  if (!result.log.empty()) {
    std::cout << " (" << result.log << ')';
  }
  std::cout << '\n';
}

void print_projection(const shipment_projection_t& projection) {
  std::cout << projection.shipment_id << ' '
            << to_string(projection.current_state)
            << " events=" << projection.event_count
            << " created=" << to_iso8601(projection.created_at)
            << " updated=" << to_iso8601(projection.last_updated) << '\n';
  for (const auto& [key, value] : projection.current_payload) {
    std::cout << "  " << key << '=' << value << '\n';
  }
}

void print_event(const shipment_event_t& event) {
  std::cout << event.event_seq << ' ' << to_iso8601(event.timestamp) << ' '
            << to_string(event.event_type) << ' '
            << to_string(event.previous_state) << " -> "
            << to_string(event.new_state) << " by "
            << to_string(event.emitting_role) << " [" << event.event_id
            << "]\n";
}

void print_integrity(const integrity_report_t& report) {
  std::cout << (report.valid ? "VALID" : "INVALID")
            << " records=" << report.records_scanned
            << " events=" << report.events_replayed
            << " shipments=" << report.shipments_checked << '\n';
  for (const auto& [kind, count] : report.violation_counts) {
    std::cout << "  " << to_string(kind) << ": " << count << '\n';
  }
  for (const auto& violation : report.violations) {
    std::cout << "  @" << violation.position << ' ' << to_string(violation.kind)
              << ' ' << violation.message << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  waybill create [--set key=value ...]\n"
            << "  waybill transition --shipment ID --event TYPE --role ROLE\n"
            << "  waybill show --shipment ID\n"
            << "  waybill list [--state STATE]\n"
            << "  waybill history --shipment ID\n"
            << "  waybill verify\n"
            << "  waybill audit\n\n";
  std::cout << options << '\n';
}

void print_usage_error(const std::string_view message) {
  std::cerr << "waybill: " << message << '\n'
            << "Try 'waybill --help' for usage.\n";
}

int run(int argc, const char** argv) {
  auto command = std::string{};
  auto options = waybill::execution::engine_options{};
  auto backend = std::string{};

  auto description = po::options_description{"waybill options"};
  description.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "create|transition|show|list|history|verify|audit")(
      "data-dir,d",
      po::value<std::string>(&options.data_dir)->default_value("waybill-data"),
      "directory holding the durable logs")(
      "backend,b", po::value<std::string>(&backend)->default_value("file"),
      "file|rocksdb")("strict", "stop integrity checks at the first corrupt "
                                "record")("verbose,v", "enable debug logging")(
      "shipment,s", po::value<std::string>(), "shipment id (SHP-##########)")(
      "event,e", po::value<std::string>(),
      join_names(kEventTypeMappings, "|").c_str())(
      "role,r", po::value<std::string>(),
      join_names(kRoleIdMappings, "|").c_str())(
      "state", po::value<std::string>(), "lifecycle state filter for list")(
      "set", po::value<std::vector<std::string>>()->composing(),
      "payload entry key=value (repeatable)")(
      "event-id", po::value<std::string>(), "idempotency key for the event")(
      "expected-seq", po::value<uint64_t>(),
      "fail unless the shipment is at this sequence");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(description);
    return 0;
  }
  if (std::find(std::begin(kCommands), std::end(kCommands), command) ==
      std::end(kCommands)) {
    throw usage_error{fmt::format(
        "unknown command '{}', expected create|transition|show|list|history|"
        "verify|audit",
        command)};
  }
  auto kind = waybill::storage::try_backend_from_string(backend);
  if (!kind) {
    throw usage_error{
        fmt::format("--backend must be one of {}",
                    join_names(waybill::storage::kBackendKindMappings, "|"))};
  }

  std::filesystem::create_directories(options.data_dir);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      (std::filesystem::path{options.data_dir} / "waybill.log").string(),
      false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "waybill", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);

  options.backend = *kind;
  options.strict_reads = vm.contains("strict");

  auto payload = payload_t{};
  if (vm.contains("set")) {
    payload = parse_payload(vm["set"].as<std::vector<std::string>>());
  }
  auto event_id = std::optional<event_id_t>{};
  if (vm.contains("event-id")) {
    event_id = vm["event-id"].as<std::string>();
  }

  auto engine = waybill::execution::engine{options};
  auto status = 0;

  if (command == "create") {
    auto result = engine.create_shipment(std::move(payload), event_id);
    print_result(result);
    status = result.accepted() ? 0 : 1;
  } else if (command == "transition") {
    auto shipment_id = require_shipment(vm);
    auto event_type = require_enum(vm, "event", kEventTypeMappings);
    auto role = require_enum(vm, "role", kRoleIdMappings);
    auto expected_seq = std::optional<event_seq_t>{};
    if (vm.contains("expected-seq")) {
      expected_seq = vm["expected-seq"].as<uint64_t>();
    }
    auto result = engine.transition_shipment(shipment_id, event_type, role,
                                             std::move(payload), event_id,
                                             expected_seq);
    print_result(result);
    status = result.accepted() ? 0 : 1;
  } else if (command == "show") {
    auto shipment_id = require_shipment(vm);
    if (auto projection = engine.get_shipment(shipment_id)) {
      print_projection(*projection);
    } else {
      std::cout << shipment_id << " not found\n";
      status = 1;
    }
  } else if (command == "list") {
    auto projections =
        vm.contains("state")
            ? engine.get_shipments_by_state(
                  require_enum(vm, "state", kLifecycleStateMappings))
            : engine.list_shipments();
    for (const auto& projection : projections) {
      print_projection(projection);
    }
  } else if (command == "history") {
    auto shipment_id = require_shipment(vm);
    auto history = engine.shipment_history(shipment_id);
    if (history.empty()) {
      std::cout << shipment_id << " not found\n";
      status = 1;
    }
    for (const auto& event : history) {
      print_event(event);
    }
  } else if (command == "verify") {
    auto report = engine.verify_integrity();
    print_integrity(report);
    status = report.valid ? 0 : 1;
  } else if (command == "audit") {
    auto report = engine.audit_report();
    std::cout << "status=" << to_string(report.integrity_status)
              << " events=" << report.total_events
              << " shipments=" << report.total_shipments << '\n';
    if (report.first_event_time && report.last_event_time) {
      std::cout << "span " << to_iso8601(*report.first_event_time) << " .. "
                << to_iso8601(*report.last_event_time) << '\n';
    }
    for (const auto& [state, count] : report.current_state_distribution) {
      std::cout << "  state " << to_string(state) << ": " << count << '\n';
    }
    for (const auto& [event_type, count] : report.event_type_distribution) {
      std::cout << "  event " << to_string(event_type) << ": " << count << '\n';
    }
    for (const auto& [role, count] : report.role_distribution) {
      std::cout << "  role " << to_string(role) << ": " << count << '\n';
    }
    print_integrity(report.integrity);
    status = report.integrity_status == integrity_status_t::corrupted ? 1 : 0;
  }

  spdlog::shutdown();
  return status;
}

}  // namespace

int main(int argc, const char** argv) {
  try {
    return run(argc, argv);
  } catch (const po::error& e) {
    print_usage_error(e.what());
  } catch (const usage_error& e) {
    print_usage_error(e.what());
  }
  spdlog::shutdown();
  return 1;
}
