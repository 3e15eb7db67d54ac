#pragma once
#include "audit.hpp"
#include <string>

struct Args {
  std::string mode;          // "run" or "audit"
  std::string root_path;
  std::string brief;
  std::string store_path;    // empty: ephemeral
  bool persist = false;
  bool allow_existing = false;
  std::string config_path;
  std::string instruct_model = "./models/instruct.gguf";
  std::string embed_model;   // empty: no vector retrieval
  int max_iters = 0;         // 0: keep config value
  int limit = 0;
  int workers = 0;
  bool quiet = false;
  AuditRequest audit;
};

Args parse_cli(int argc, char** argv);
