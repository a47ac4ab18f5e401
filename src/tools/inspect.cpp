#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <chronicle/blake3/hash.hpp>
#include <chronicle/errors/errors.hpp>
#include <chronicle/query/reader.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <stdexcept>
#include <string_view>

namespace {

namespace po = boost::program_options;

std::string describe_tick(
    const std::optional<chronicle::schema::timestamp_milliseconds_t>& tick) {
  return tick ? std::to_string(*tick) : std::string{"open"};
}

/// 64 hex digits are taken as the id itself; anything else is hashed.
chronicle::schema::entity_id_t parse_entity(std::string_view entity) {
  if (auto id = chronicle::schema::try_make_hash32(entity)) {
    return *id;
  }
  return chronicle::blake3::hash(entity);
}

void print_clock(const chronicle::query::reader& reader,
                 std::string_view type,
                 const chronicle::schema::entity_id_t& entity_id) {
  auto records = reader.clock_records(type, entity_id);
  if (records.empty()) {
    std::cout << "no clock records\n";
    return;
  }
  for (const auto& record : records) {
    std::cout << "vclock " << record.vclock << " ["
              << record.tick_start << ", " << describe_tick(record.tick_end)
              << ")";
    if (record.activity_id) {
      std::cout << " activity "
                << chronicle::schema::to_hex(*record.activity_id);
    }
    std::cout << '\n';
  }
  std::cout << "created " << describe_tick(reader.date_created(type, entity_id))
            << ", modified "
            << describe_tick(reader.date_modified(type, entity_id)) << '\n';
}

void print_history(const chronicle::query::reader& reader,
                   std::string_view type,
                   std::string_view unit,
                   const chronicle::schema::entity_id_t& entity_id) {
  auto rows = reader.history_rows(type, unit, entity_id);
  if (rows.empty()) {
    std::cout << "no history for " << unit << '\n';
    return;
  }
  for (const auto& row : rows) {
    std::cout << "vclock " << row.vclock << " [" << row.tick_start << ", "
              << describe_tick(row.tick_end)
              << ") = " << chronicle::schema::describe(row.values) << '\n';
  }
}

void print_as_of(const chronicle::query::reader& reader,
                 std::string_view type,
                 std::string_view unit,
                 const chronicle::schema::entity_id_t& entity_id,
                 chronicle::schema::timestamp_milliseconds_t as_of) {
  auto row = reader.value_as_of(type, unit, entity_id, as_of);
  if (!row) {
    std::cout << unit << " had no value at " << as_of << '\n';
    return;
  }
  std::cout << unit << " at " << as_of << " = "
            << chronicle::schema::describe(row->values) << " (vclock "
            << row->vclock << ")\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "chronicle-inspect.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "inspect", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto type = std::string{};
  auto entity = std::string{};
  auto unit = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"chronicle-inspect"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path), "RocksDB database directory")(
      "type,t", po::value<std::string>(&type), "Entity type")(
      "entity,e", po::value<std::string>(&entity),
      "Entity id: 64 hex digits, or text hashed with BLAKE3")(
      "unit,u", po::value<std::string>(&unit),
      "Tracked attribute or composite group; omit for the clock ledger")(
      "as-of,a", po::value<uint64_t>(),
      "Print the unit's value effective at this millisecond timestamp")(
      "verbose,v", "Enable verbose output");
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (db_path.empty() || type.empty() || entity.empty()) {
    spdlog::error("--db, --type and --entity are required");
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 1;
  }
  if (!std::filesystem::is_directory(db_path)) {
    spdlog::error("No database at '{}'", db_path);
    spdlog::shutdown();
    return 1;
  }
  if (vm.contains("as-of") && unit.empty()) {
    spdlog::error("--as-of needs --unit");
    spdlog::shutdown();
    return 1;
  }

  auto status = 0;
  try {
    // Table prefixes derive from names alone, so a policy tracking just the
    // requested unit addresses the same rows the writer produced.
    auto policy = chronicle::schema::temporal_policy{};
    policy.entity_type = type;
    policy.attributes.push_back(chronicle::schema::attribute_descriptor{
        .name = unit.empty() ? std::string{"value"} : unit});
    auto registry = chronicle::schema::registry{};
    registry.add(std::move(policy));

    auto encoder = chronicle::schema::encoding::scale_encoder_t{};
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(
        db_path, chronicle::storage::open_mode::existing_only);
    auto reader = chronicle::query::reader{encoder, storage, registry};
    auto entity_id = parse_entity(entity);
    spdlog::debug("Inspecting {} entity {}", type,
                  chronicle::schema::to_hex(entity_id));

    if (unit.empty()) {
      print_clock(reader, type, entity_id);
    } else if (vm.contains("as-of")) {
      print_as_of(reader, type, unit, entity_id, vm["as-of"].as<uint64_t>());
    } else {
      print_history(reader, type, unit, entity_id);
    }
  } catch (const chronicle::errors::temporal_error& e) {
    spdlog::error("{} ({})", e.what(),
                  chronicle::schema::to_string(e.code()));
    status = 1;
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid argument: {}", e.what());
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
