#include <boost/program_options.hpp>
#include <pledge/common/critical.hpp>
#include <pledge/crypto/ed25519.hpp>
#include <pledge/issuer/scoped_key_issuer.hpp>
#include <pledge/ledger/signing.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/transaction.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;
using encoder_t = pledge::schema::encoding::scale_encoder_t;

std::string encode_base64(const pledge::schema::bytes_t& input) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((input.size() + 2) / 3) * 4);

  auto i = size_t{0};
  while (i + 3 <= input.size()) {
    auto value = (static_cast<uint32_t>(input[i]) << 16u) |
                 (static_cast<uint32_t>(input[i + 1]) << 8u) |
                 static_cast<uint32_t>(input[i + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    i += 3;
  }
  if (i < input.size()) {
    auto value = static_cast<uint32_t>(input[i]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((i + 1) < input.size()) {
      value |= static_cast<uint32_t>(input[i + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }
  return out;
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name) || vm[name].as<std::string>().empty()) {
    std::cerr << "missing --" << name << std::endl;
    std::exit(2);
  }
  return vm[name].as<std::string>();
}

void print_transaction(encoder_t& encoder,
                       const pledge::schema::transaction_t& transaction) {
  auto encoded = encoder.encode(transaction);
  std::cout << "transaction_hex=" << pledge::schema::to_hex(encoded) << '\n';
  std::cout << "transaction_base64=" << encode_base64(encoded) << '\n';
  std::cout << "signing_payload="
            << pledge::schema::to_hex(
                   pledge::ledger::make_signing_payload(encoder, transaction))
            << '\n';
}

int issue(const po::variables_map& vm) {
  auto allowance = std::optional<pledge::schema::amount_t>{};
  if (vm.contains("allowance")) {
    allowance =
        pledge::schema::try_make_amount(vm["allowance"].as<std::string>());
    if (!allowance) {
      std::cerr << "allowance must be a decimal integer" << std::endl;
      return 2;
    }
  }

  auto issuer = pledge::issuer::scoped_key_issuer{
      *pledge::schema::try_make_amount(pledge::issuer::kDefaultAllowance)};
  auto issued = issuer.issue(require(vm, "account-id"),
                             require(vm, "subscription-id"),
                             require(vm, "contract-id"), allowance);
  if (!issued.ok()) {
    std::cerr << issued.result.log << std::endl;
    return 1;
  }

  auto encoder = encoder_t{};
  std::cout << "public_key="
            << pledge::crypto::to_string(issued.value->key.public_key())
            << '\n';
  std::cout << "private_key=" << issued.value->key.to_string() << '\n';
  print_transaction(encoder, issued.value->transaction);
  return 0;
}

// Stand-in for the payer's wallet: fill in the full-access key and nonce and
// sign the authorization transaction.
int sign(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto bytes = pledge::schema::try_from_hex(require(vm, "transaction-hex"));
  if (!bytes) {
    std::cerr << "transaction-hex is not hex" << std::endl;
    return 2;
  }
  auto transaction =
      encoder.try_decode<pledge::schema::transaction_t>(*bytes);
  if (!transaction) {
    std::cerr << "transaction-hex is not a SCALE transaction" << std::endl;
    return 2;
  }
  auto key = pledge::crypto::secret_key::try_parse(require(vm, "private-key"));
  if (!key) {
    std::cerr << "private-key is not ed25519:<base58>" << std::endl;
    return 2;
  }

  transaction->public_key = key->public_key();
  transaction->nonce = vm["nonce"].as<uint64_t>();
  auto signature = key->sign(
      pledge::ledger::make_signing_payload(encoder, *transaction));
  if (!signature) {
    pledge::common::critical("ed25519 signing failed");
  }
  auto signed_transaction = pledge::schema::signed_transaction_t{
      .transaction = *transaction, .signature = *signature};
  auto encoded = encoder.encode(signed_transaction);
  std::cout << "signed_transaction_hex=" << pledge::schema::to_hex(encoded)
            << '\n';
  std::cout << "signed_transaction_base64=" << encode_base64(encoded) << '\n';
  return 0;
}

int public_key(const po::variables_map& vm) {
  auto key = pledge::crypto::secret_key::try_parse(require(vm, "private-key"));
  if (!key) {
    std::cerr << "private-key is not ed25519:<base58>" << std::endl;
    return 2;
  }
  std::cout << "public_key=" << pledge::crypto::to_string(key->public_key())
            << '\n';
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"pledge_keytool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "issue|sign|public-key")("account-id", po::value<std::string>(),
                               "payer account")(
      "subscription-id", po::value<std::string>(), "subscription id")(
      "contract-id", po::value<std::string>(), "subscription contract account")(
      "allowance", po::value<std::string>(),
      "allowance in the smallest token unit")(
      "transaction-hex", po::value<std::string>(),
      "unsigned SCALE transaction hex")(
      "private-key", po::value<std::string>(), "ed25519:<base58> key")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce");

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
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << options << std::endl;
    return 0;
  }
  if (command == "issue") {
    return issue(vm);
  }
  if (command == "sign") {
    return sign(vm);
  }
  if (command == "public-key") {
    return public_key(vm);
  }
  std::cerr << "unknown command " << command << std::endl;
  return 2;
}
