#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "config/proof_config.hpp"
#include "node/retrieval_service.hpp"
#include "proof/copy_builder.hpp"
#include "store/chunk_store.hpp"
#include "validator/challenge_validator.hpp"
#include "validator/key_location.hpp"
#include "validator/proof_verifier.hpp"

namespace pous {
namespace cli {

// Components of a local node paired with a local validator
struct Session {
  const config::ProofConfig& config;
  proof::NodeIdentity& identity;
  store::ChunkStore& store;
  proof::CopyBuilder& builder;
  node::RetrievalService& retrieval;
  validator::ChallengeValidator& validator;
  validator::KeyLocationRegistry& registry;
  const validator::Clock& clock;
};

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(Session session);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    Session session_;
    // Chunk count of each copy built in this session, by copy index
    std::map<uint32_t, uint32_t> copies_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& args);
    void handle_build_command(const std::string& args);
    void handle_serve_command(const std::string& args);
    void handle_challenge_command();
    void handle_register_command();
    void handle_calibrate_command();
    void handle_invalidate_command();
    void handle_status_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pous
