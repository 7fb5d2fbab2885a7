#include <boost/program_options.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <ledgersync/common/critical.hpp>
#include <ledgersync/schema/primitives.hpp>
#include <ledgersync/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

using storage_t =
    ledgersync::storage::storage<ledgersync::storage::rocksdb_storage_tag>;

void configure_logging(const bool verbose, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries the command output; logs go to stderr and the optional file.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "inspect", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

void print_help(const po::options_description& options) {
  std::cout << "usage: ledgersync_inspect <snapshot|chunks|wallet> [options]\n"
            << options << '\n';
}

int inspect_snapshot(const storage_t& storage, const po::variables_map& vm) {
  if (!vm.contains("snapshot-id")) {
    ledgersync::common::critical("snapshot mode requires --snapshot-id");
  }
  auto snapshot_id = vm["snapshot-id"].as<uint64_t>();
  auto snapshot = storage.load_snapshot(snapshot_id);
  if (!snapshot) {
    spdlog::error("Snapshot {} not found", snapshot_id);
    return 1;
  }

  auto hash = snapshot->hash();
  std::cout << "snapshot " << snapshot->id() << " height "
            << snapshot->height() << " chunks " << snapshot->chunk_ids().size()
            << " blocks " << snapshot->block_ids().size() << " hash "
            << ledgersync::schema::to_hex(ledgersync::schema::bytes_view_t{hash})
            << '\n';

  if (vm.contains("sync-id")) {
    auto sync_id = vm["sync-id"].as<uint64_t>();
    auto progress = storage.load_snapshot_sync(sync_id);
    if (!progress) {
      spdlog::error("Snapshot sync {} not found", sync_id);
      return 1;
    }
    std::cout << "progress " << progress->last_applied_chunk_index() << "/"
              << progress->total_chunks() << " format " << progress->format()
              << " verified "
              << (progress->is_complete() &&
                          progress->snapshot_hash() == hash
                      ? "yes"
                      : "no")
              << '\n';
  }
  return 0;
}

int inspect_chunks(const storage_t& storage, const po::variables_map& vm) {
  if (!vm.contains("snapshot-id")) {
    ledgersync::common::critical("chunks mode requires --snapshot-id");
  }
  auto snapshot_id = vm["snapshot-id"].as<uint64_t>();
  for (const auto& [chunk_id, chunk] : storage.list_snapshot_chunks(snapshot_id)) {
    std::cout << "chunk " << chunk_id << " blocks "
              << chunk.starting_block_number() << "-"
              << chunk.ending_block_number() << " payloads "
              << chunk.data().size() << " size " << chunk.size() << '\n';
  }
  return 0;
}

int inspect_wallet(const storage_t& storage, const po::variables_map& vm) {
  if (!vm.contains("session")) {
    ledgersync::common::critical("wallet mode requires --session");
  }
  auto session = ledgersync::schema::try_make_hash32(
      vm["session"].as<std::string>());
  if (!session) {
    ledgersync::common::critical("--session must be 32 bytes of hex");
  }
  for (const auto& record : storage.list_wallet_sync_records(*session)) {
    auto hash = record.hash();
    std::cout << "peer "
              << ledgersync::schema::to_hex(
                     ledgersync::schema::bytes_view_t{record.peer_id()})
              << " entries " << record.entries().size() << "/"
              << record.chunks_count() << " hash "
              << ledgersync::schema::to_hex(
                     ledgersync::schema::bytes_view_t{hash})
              << '\n';
  }
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"ledgersync_inspect options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "snapshot|chunks|wallet")(
      "db", po::value<std::string>(&db_path), "RocksDB directory")(
      "snapshot-id", po::value<uint64_t>(), "snapshot id")(
      "sync-id", po::value<uint64_t>(), "snapshot sync progress id")(
      "session", po::value<std::string>(), "wallet sync session hash32 hex")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also write logs to this file")("verbose,v", "enable debug logging");

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

  configure_logging(vm.contains("verbose"), log_file);
  if (db_path.empty()) {
    ledgersync::common::critical("--db is required");
  }

  auto storage =
      ledgersync::storage::make_storage<ledgersync::storage::rocksdb_storage_tag>(
          db_path);

  auto exit_code = 0;
  if (command == "snapshot") {
    exit_code = inspect_snapshot(storage, vm);
  } else if (command == "chunks") {
    exit_code = inspect_chunks(storage, vm);
  } else if (command == "wallet") {
    exit_code = inspect_wallet(storage, vm);
  } else {
    ledgersync::common::critical(
        "unknown command '{}': must be snapshot|chunks|wallet", command);
  }

  spdlog::shutdown();
  return exit_code;
}
