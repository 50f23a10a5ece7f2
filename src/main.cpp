#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>

struct ProgramOptions {
  std::string host;
  uint16_t port{0};
  std::string data_dir{"pous-data"};
  std::string log_level{"info"};
  bool regtest{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> [-d <dir>] [--log-level <level>] [--regtest]\n"
        << "Required arguments:\n"
        << "  -h, --host       IP address the node serves from\n"
        << "  -p, --port       Port number\n"
        << "Optional arguments:\n"
        << "  -d, --data-dir   Directory for keys, chunks and logs (default: pous-data)\n"
        << "  --log-level      trace, debug, info, warning or error (default: info)\n"
        << "  --regtest        Short transforms for local testing\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 3001 --regtest\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-h", "--host", "-p", "--port", "-d", "--data-dir", "--log-level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--regtest") {
      options.regtest = true;
      continue;
    }
    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-h" || flag == "--host") {
      options.host = value;
    } else if (flag == "-p" || flag == "--port") {
      try {
        unsigned long port = std::stoul(value);
        if (port > 65535) {
          throw std::out_of_range("port");
        }
        options.port = static_cast<uint16_t>(port);
      } catch (const std::logic_error&) {
        std::cerr << "Error: Invalid port number\n";
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-d" || flag == "--data-dir") {
      options.data_dir = value;
    } else {
      options.log_level = value;
    }
  }

  if (options.host.empty() || options.port == 0) {
    std::cerr << "Error: Both host and port are required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

pous::crypto::KeyPair load_or_create_key(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    return pous::crypto::KeyPair::load(path);
  }
  pous::crypto::KeyPair key_pair = pous::crypto::KeyPair::generate();
  key_pair.save(path);
  return key_pair;
}

bool run_node(const ProgramOptions& options) {
  try {
    const std::filesystem::path data_dir(options.data_dir);
    std::filesystem::create_directories(data_dir);
    pous::logger::init_logging((data_dir / "pous.log").string(), pous::logger::parse_severity(options.log_level));

    const pous::config::ProofConfig config = options.regtest
      ? pous::config::ProofConfig::regtest()
      : pous::config::ProofConfig::production();
    config.validate();

    pous::proof::NodeIdentity identity{load_or_create_key(data_dir / "node.key"), {}};
    identity.location.ip = options.host;
    identity.location.port = options.port;

    pous::validator::SystemClock clock;
    pous::store::ChunkStore store((data_dir / "chunks").string());
    pous::proof::CopyBuilder builder(config, store);
    // Declared before the validator, which may still be running a late answer at exit
    pous::crypto::KeyPair validator_key = load_or_create_key(data_dir / "validator.key");
    pous::node::RetrievalService retrieval(identity, store, clock, validator_key.public_key());
    pous::validator::ChallengeValidator validator(config, std::move(validator_key), clock);
    pous::validator::KeyLocationRegistry registry(config.protocol_prefix);

    validator.register_node(identity.public_key(), identity.location);

    std::cout << "Node " << identity.node_id().substr(0, 16) << " at " << identity.location.to_string()
              << (options.regtest ? " (regtest)" : "") << '\n'
              << "Type 'help' for commands.\n";

    pous::cli::CLI cli(pous::cli::Session{config, identity, store, builder, retrieval, validator, registry, clock});
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
