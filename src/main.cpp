#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <timeshare/execution/engine.hpp>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>
#include <timeshare/storage/rocksdb/storage.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

namespace po = boost::program_options;

using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;

void install_logger(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "timeshare.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "timeshare", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<timeshare::schema::bytes_t> read_base64_input(
    const po::variables_map& vm) {
  if (!vm.contains("input")) {
    spdlog::error("missing base64 input");
    return std::nullopt;
  }
  auto decoded =
      timeshare::schema::try_from_base64(vm["input"].as<std::string>());
  if (!decoded) {
    spdlog::error("input is not valid base64");
  }
  return decoded;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  timeshare execute <base64-call> [options]\n"
            << "  timeshare check <base64-call> [options]\n"
            << "  timeshare query <base64-data> --path <route> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto registry_id_hex = std::string{};
  auto path = std::string{};
  auto strict_crypto = true;

  auto options = po::options_description{"Timeshare registry"};
  options.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command), "execute|check|query")(
      "input", po::value<std::string>(), "base64 call or query data")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("./timeshare-db"),
      "RocksDB directory")("registry-id", po::value<std::string>(&registry_id_hex),
                           "32-byte registry id hex")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "verify call signatures")("path,p",
                                po::value<std::string>(&path)->default_value(
                                    "/registry/info"),
                                "query route")("verbose,v",
                                               "Enable verbose output");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("input", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  install_logger(vm.contains("verbose"));

  auto registry_id = timeshare::execution::default_registry_id();
  if (!registry_id_hex.empty()) {
    auto parsed = timeshare::schema::try_make_hash32(registry_id_hex);
    if (!parsed) {
      spdlog::error("--registry-id must be 32 bytes of hex");
      spdlog::shutdown();
      return 2;
    }
    registry_id = *parsed;
  }

  auto encoder = encoder_t{};
  auto storage = timeshare::storage::make_storage<
      timeshare::storage::rocksdb_storage_tag>(db_path);
  auto engine = timeshare::execution::engine{encoder, storage, registry_id,
                                             strict_crypto};

  auto exit_code = 0;
  if (command == "execute" || command == "check") {
    auto raw_call = read_base64_input(vm);
    if (!raw_call) {
      spdlog::shutdown();
      return 2;
    }
    auto view = timeshare::schema::bytes_view_t{raw_call->data(),
                                                raw_call->size()};
    auto result =
        command == "execute" ? engine.execute(view) : engine.check_call(view);
    std::cout << "code: " << result.code << '\n'
              << "codespace: " << result.codespace << '\n'
              << "log: " << result.log << '\n'
              << "info: " << result.info << '\n'
              << "data: " << timeshare::schema::to_base64(result.data) << '\n';
    exit_code = result.code == 0 ? 0 : 1;
  } else if (command == "query") {
    auto data = timeshare::schema::bytes_t{};
    if (vm.contains("input")) {
      auto decoded = read_base64_input(vm);
      if (!decoded) {
        spdlog::shutdown();
        return 2;
      }
      data = std::move(*decoded);
    }
    auto result = engine.query(
        path, timeshare::schema::bytes_view_t{data.data(), data.size()});
    std::cout << "code: " << result.code << '\n'
              << "codespace: " << result.codespace << '\n'
              << "log: " << result.log << '\n'
              << "value: " << timeshare::schema::to_base64(result.value)
              << '\n';
    exit_code = result.code == 0 ? 0 : 1;
  } else {
    spdlog::error("command must be execute|check|query");
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
