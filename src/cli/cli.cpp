#include "cli/cli.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace pous {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(Session session)
  : running_(false)
  , session_(session) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================
void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  std::cout << "POUS_Shell> " << std::flush;

  while (running_ && std::getline(std::cin, line)) {
    if (line == "quit") {
      running_ = false;
      continue;
    }

    std::istringstream iss(line);
    std::string command;
    iss >> command;
    std::string args;
    std::getline(iss >> std::ws, args);

    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      std::cout << "POUS_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with arguments: " << args;

  if (command == "build") {
    handle_build_command(args);
  }
  else if (command == "serve") {
    handle_serve_command(args);
  }
  else if (command == "challenge" && args.empty()) {
    handle_challenge_command();
  }
  else if (command == "register" && args.empty()) {
    handle_register_command();
  }
  else if (command == "calibrate" && args.empty()) {
    handle_calibrate_command();
  }
  else if (command == "invalidate" && args.empty()) {
    handle_invalidate_command();
  }
  else if (command == "status" && args.empty()) {
    handle_status_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    std::cout << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_build_command(const std::string& args) {
  std::istringstream iss(args);
  std::string filename;
  uint32_t copy_index = 0;
  if (!(iss >> filename)) {
    std::cout << "Usage: build <file> [copy]" << std::endl;
    return;
  }
  if (!iss.eof() && !(iss >> copy_index)) {
    std::cout << "Invalid copy index" << std::endl;
    return;
  }

  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    std::cout << "Error opening file: " << filename << std::endl;
    return;
  }
  proof::Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  try {
    std::cout << "Transforming " << data.size() << " bytes, this takes about "
              << session_.config.target_total_time.count() << " ms..." << std::endl;
    proof::TransformJob job = session_.builder.start(std::move(data), session_.identity, copy_index);
    proof::CopyManifest manifest = job.get();
    session_.validator.register_copy(manifest);
    copies_[manifest.copy_index] = manifest.chunk_count;
    std::cout << "Built copy " << manifest.copy_index << ": " << manifest.chunk_count << " chunks" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error building copy", e.what());
  }
}

void CLI::handle_serve_command(const std::string& args) {
  std::istringstream iss(args);
  uint32_t copy_index = 0;
  uint32_t chunk_index = 0;
  if (!(iss >> copy_index >> chunk_index)) {
    std::cout << "Usage: serve <copy> <chunk>" << std::endl;
    return;
  }

  try {
    proof::Bytes chunk = session_.retrieval.serve_chunk(copy_index, chunk_index);
    std::cout << "Chunk " << chunk_index << " (" << chunk.size() << " bytes): ";
    for (uint8_t byte : chunk) {
      std::cout << (std::isprint(byte) ? static_cast<char>(byte) : '.');
    }
    std::cout << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error serving chunk", e.what());
  }
}

void CLI::handle_challenge_command() {
  if (copies_.empty()) {
    std::cout << "No copies built yet, use: build <file>" << std::endl;
    return;
  }

  try {
    // Copies are built with the same chunk count; challenge among them
    const uint32_t total_copies = copies_.rbegin()->first + 1;
    const uint32_t chunks = copies_.begin()->second;
    const std::string node_id = session_.identity.node_id();

    proof::StorageChallenge challenge = session_.validator.issue_challenge(node_id, total_copies, chunks);
    std::cout << "Challenge: copy " << challenge.copy_index << ", chunk " << challenge.chunk_index
              << ", timeout " << challenge.timeout_ms << " ms" << std::endl;

    node::RetrievalService& retrieval = session_.retrieval;
    validator::ChallengeOutcome outcome = session_.validator.run_challenge(node_id, challenge,
      [&retrieval](const proof::StorageChallenge& issued) { return retrieval.respond_to_challenge(issued); });

    std::cout << validator::to_string(outcome.status) << " in " << outcome.elapsed_ms << " ms";
    if (!outcome.reason.empty()) {
      std::cout << ": " << outcome.reason;
    }
    std::cout << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error running challenge", e.what());
  }
}

void CLI::handle_register_command() {
  try {
    const uint64_t epoch = validator::current_epoch(session_.clock, session_.config.epoch_length);
    proof::ServerCoinMemo memo = validator::make_server_coin_memo(
      session_.identity.key_pair, validator::registered_host(session_.identity.location), epoch, session_.config.protocol_prefix);
    session_.registry.register_memo(memo, epoch);
    std::cout << "Registered " << memo.host << " for epoch " << epoch << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error registering key location", e.what());
  }
}

void CLI::handle_calibrate_command() {
  try {
    uint64_t iterations = session_.builder.engine().calibrate_iterations();
    session_.builder.engine().set_iterations(iterations);
    std::cout << "Using " << iterations << " iterations per chunk" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error calibrating", e.what());
  }
}

void CLI::handle_invalidate_command() {
  try {
    session_.store.invalidate_node(session_.identity.node_id());
    copies_.clear();
    std::cout << "Stored copies removed" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error invalidating copies", e.what());
  }
}

void CLI::handle_status_command() {
  const std::string node_id = session_.identity.node_id();
  std::cout << "Node:      " << node_id.substr(0, 16) << " at " << session_.identity.location.to_string() << std::endl;
  std::cout << "Chunks:    " << session_.store.count(node_id) << " stored, "
            << session_.builder.engine().iterations() << " iterations each" << std::endl;

  auto rate = session_.validator.ledger().success_rate(node_id);
  std::cout << "Challenges: " << session_.validator.ledger().history(node_id).size() << " recorded";
  if (rate) {
    std::cout << ", success rate " << std::fixed << std::setprecision(1) << (*rate * 100.0) << "%";
  }
  std::cout << std::endl;
}

void CLI::handle_help_command() {
  std::cout << "Available commands:" << std::endl;
  std::cout << "  help                  Display this help message" << std::endl;
  std::cout << "  build <file> [copy]   Transform <file> into a bound copy (default copy 0)" << std::endl;
  std::cout << "  serve <copy> <chunk>  Restore and print a stored chunk" << std::endl;
  std::cout << "  challenge             Issue a storage challenge and answer it" << std::endl;
  std::cout << "  register              Register this key and host for the current epoch" << std::endl;
  std::cout << "  calibrate             Tune iterations to the target transform time" << std::endl;
  std::cout << "  invalidate            Remove every stored copy of this node" << std::endl;
  std::cout << "  status                Show stored chunks and challenge history" << std::endl;
  std::cout << "  quit                  Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cout << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pous
