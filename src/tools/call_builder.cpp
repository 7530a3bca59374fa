#include <boost/program_options.hpp>
#include <timeshare/common/critical.hpp>
#include <timeshare/execution/signing.hpp>
#include <timeshare/schema/call.hpp>
#include <timeshare/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace {

using encoder_t = timeshare::schema::encoding::encoder<
    timeshare::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

timeshare::schema::signer_id_t get_signer(const po::variables_map& vm,
                                          const std::string& name) {
  if (!vm.contains(name)) {
    timeshare::common::critical("missing required identity argument");
  }
  auto signer =
      timeshare::schema::try_make_signer_id(vm[name].as<std::string>());
  if (!signer) {
    timeshare::common::critical(
        "identity must be ed25519:<hex>, secp256k1:<hex> or named:<hex>");
  }
  return *signer;
}

timeshare::schema::hash32_t get_registry_id(const po::variables_map& vm) {
  if (!vm.contains("registry-id")) {
    return timeshare::execution::default_registry_id();
  }
  auto registry_id =
      timeshare::schema::try_make_hash32(vm["registry-id"].as<std::string>());
  if (!registry_id) {
    timeshare::common::critical("--registry-id must be 32 bytes of hex");
  }
  return *registry_id;
}

template <typename Signature>
Signature copy_signature(const timeshare::schema::bytes_t& bytes,
                         const std::string_view error) {
  auto signature = Signature{};
  if (!bytes.empty()) {
    if (bytes.size() != signature.size()) {
      timeshare::common::critical(error);
    }
    std::ranges::copy(bytes, std::begin(signature));
  }
  return signature;
}

timeshare::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = timeshare::schema::bytes_t{};
  if (!hex.empty()) {
    auto decoded = timeshare::schema::try_from_hex(hex);
    if (!decoded) {
      timeshare::common::critical("--signature-hex is not valid hex");
    }
    bytes = std::move(*decoded);
  }
  if (kind == "ed25519") {
    return copy_signature<timeshare::schema::ed25519_signature_t>(
        bytes, "ed25519 signature must be 64 bytes");
  }
  if (kind == "secp256k1") {
    return copy_signature<timeshare::schema::secp256k1_signature_t>(
        bytes, "secp256k1 signature must be 65 bytes");
  }
  timeshare::common::critical("unsupported signature-kind");
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    timeshare::common::critical("missing required text argument");
  }
  return vm[name].as<std::string>();
}

timeshare::schema::call_payload_t build_payload(const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "initialize") {
    return timeshare::schema::initialize_registry_t{
        .admin = get_signer(vm, "admin")};
  }
  if (payload == "mint") {
    return timeshare::schema::mint_timeshare_t{
        .recipient = get_signer(vm, "recipient"),
        .hotel = get_string(vm, "hotel"),
        .room = get_string(vm, "room"),
        .week = vm["week"].as<uint32_t>()};
  }
  if (payload == "transfer") {
    if (!vm.contains("token-id")) {
      timeshare::common::critical("transfer payload requires --token-id");
    }
    return timeshare::schema::transfer_timeshare_t{
        .from = get_signer(vm, "from"),
        .to = get_signer(vm, "to"),
        .token_id = vm["token-id"].as<uint64_t>()};
  }
  timeshare::common::critical("payload must be initialize|mint|transfer");
}

timeshare::schema::call_t build_call(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    timeshare::common::critical("call mode requires --payload");
  }
  return timeshare::schema::call_t{.version = 1,
                                   .registry_id = get_registry_id(vm),
                                   .nonce = vm["nonce"].as<uint64_t>(),
                                   .signer = get_signer(vm, "signer"),
                                   .payload = build_payload(vm),
                                   .signature = make_signature(vm)};
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  call_builder call --payload <kind> [options]\n"
            << "  call_builder signing-payload --payload <kind> [options]\n"
            << "  call_builder query-key --token-id <id> | --signer <id>\n"
            << "  call_builder registry-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"call_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "call|signing-payload|query-key|registry-id")(
      "payload", po::value<std::string>(), "initialize|mint|transfer")(
      "registry-id", po::value<std::string>(), "32-byte registry id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "call nonce")(
      "signer", po::value<std::string>(), "calling identity")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "admin", po::value<std::string>(), "registry admin identity")(
      "recipient", po::value<std::string>(), "mint recipient identity")(
      "hotel", po::value<std::string>(), "hotel name")(
      "room", po::value<std::string>(), "room designation")(
      "week", po::value<uint32_t>()->default_value(1), "week of the year")(
      "from", po::value<std::string>(), "transfer source identity")(
      "to", po::value<std::string>(), "transfer destination identity")(
      "token-id", po::value<uint64_t>(), "timeshare token id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
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

  if (command == "call") {
    auto encoded = encoder_t{}.encode(build_call(vm));
    std::cout << timeshare::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "signing-payload") {
    auto digest = timeshare::execution::signing_payload(build_call(vm));
    std::cout << timeshare::schema::to_hex(digest) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = timeshare::schema::bytes_t{};
    if (vm.contains("token-id")) {
      key = encoder_t{}.encode(vm["token-id"].as<uint64_t>());
    } else if (vm.contains("signer")) {
      key = encoder_t{}.encode(get_signer(vm, "signer"));
    } else {
      timeshare::common::critical(
          "query-key mode requires --token-id or --signer");
    }
    std::cout << timeshare::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "registry-id") {
    std::cout << timeshare::schema::to_hex(
                     timeshare::execution::default_registry_id())
              << '\n';
    return 0;
  }

  timeshare::common::critical(
      "command must be call|signing-payload|query-key|registry-id");
}
