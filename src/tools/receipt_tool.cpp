#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <zkreceipt/common/error.hpp>
#include <zkreceipt/convert/convert.hpp>
#include <zkreceipt/encoding/bincode/encoder.hpp>
#include <zkreceipt/hash/hash_suite.hpp>
#include <zkreceipt/receipt/receipt.hpp>
#include <zkreceipt/schema/primitives.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <variant>

namespace {

using encoder_t =
    zkreceipt::encoding::encoder<zkreceipt::encoding::bincode_encoder_tag>;
namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  zkreceipt_tool convert (--input FILE | --receipt-hex HEX)\n"
            << "  zkreceipt_tool claim-digest (--input FILE | --receipt-hex "
               "HEX) [--hashfn NAME]\n"
            << "  zkreceipt_tool control-root (--input FILE | --receipt-hex "
               "HEX)\n\n";
  std::cout << options << '\n';
}

std::optional<zkreceipt::schema::bytes_t> read_file(const std::string& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    return std::nullopt;
  }
  return zkreceipt::schema::bytes_t{std::istreambuf_iterator<char>{file},
                                    std::istreambuf_iterator<char>{}};
}

std::optional<zkreceipt::schema::bytes_t> load_receipt(
    const po::variables_map& vm) {
  if (vm.contains("input")) {
    auto path = vm["input"].as<std::string>();
    auto bytes = read_file(path);
    if (!bytes) {
      spdlog::error("cannot read {}", path);
    }
    return bytes;
  }
  if (vm.contains("receipt-hex")) {
    auto bytes =
        zkreceipt::schema::try_from_hex(vm["receipt-hex"].as<std::string>());
    if (!bytes) {
      spdlog::error("--receipt-hex is not valid hex");
    }
    return bytes;
  }
  spdlog::error("one of --input or --receipt-hex is required");
  return std::nullopt;
}

int run_convert(const zkreceipt::schema::bytes_t& bytes) {
  auto error = std::string{};
  auto proof = zkreceipt::convert::try_convert(bytes, error);
  if (!proof) {
    std::cerr << error << '\n';
    return 1;
  }
  std::cout << "seal=" << zkreceipt::schema::to_hex(proof->seal) << '\n';
  std::cout << "journal=" << zkreceipt::schema::to_hex(proof->journal) << '\n';
  return 0;
}

int run_claim_digest(const zkreceipt::schema::bytes_t& bytes,
                     const std::string& hashfn) {
  const auto& engine = zkreceipt::hash::hash_engine_from_name(hashfn);
  auto receipt = encoder_t{}.decode<zkreceipt::receipt::receipt_t>(bytes);
  std::cout << receipt.inner.claim_digest(engine).to_hex() << '\n';
  return 0;
}

int run_control_root(const zkreceipt::schema::bytes_t& bytes) {
  using succinct_t = zkreceipt::receipt::succinct_receipt_t<
      zkreceipt::schema::receipt_claim_t>;
  auto receipt = encoder_t{}.decode<zkreceipt::receipt::receipt_t>(bytes);
  const auto* succinct = std::get_if<succinct_t>(&receipt.inner.value);
  if (succinct == nullptr) {
    throw zkreceipt::common::unsupported_receipt_error{receipt.inner.name()};
  }
  std::cout << succinct->control_root().to_hex() << '\n';
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto logger = spdlog::stderr_color_mt("zkreceipt");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto hashfn = std::string{};
  auto options = po::options_description{"zkreceipt_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "convert|claim-digest|control-root")(
      "input,i", po::value<std::string>(), "bincode receipt file")(
      "receipt-hex", po::value<std::string>(), "bincode receipt bytes hex")(
      "hashfn", po::value<std::string>(&hashfn)->default_value("sha-256"),
      "hash suite for claim-digest")("verbose,v", "enable debug logging");

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
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (command != "convert" && command != "claim-digest" &&
      command != "control-root") {
    std::cerr << "command must be convert|claim-digest|control-root\n";
    return 1;
  }

  auto bytes = load_receipt(vm);
  if (!bytes) {
    return 1;
  }

  if (command == "convert") {
    return run_convert(*bytes);
  }

  try {
    if (command == "claim-digest") {
      return run_claim_digest(*bytes, hashfn);
    }
    return run_control_root(*bytes);
  } catch (const zkreceipt::common::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }
}
