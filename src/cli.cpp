#include "cli.hpp"
#include <iostream>
#include <cstdlib>

static const char* USAGE =
"docgate run <root> \"brief\" [--store path] [--persist] [--allow-existing] [--config file.json]\n"
"            [--max-iters N] [--limit N] [--workers N] [--instruct-model path] [--embed-model path] [--quiet]\n"
"docgate audit <store> <command> [--id N] [--report-id N] [--file-id N] [--symbol-id N]\n"
"            [--level L] [--query Q] [--edge-type T] [--out path] [--limit N]\n"
"audit commands: list-files list-reports show-report export-report list-claims list-symbols\n"
"                list-summaries search-chunks symbol-neighbors list-retrieval-events\n"
"                list-iterations list-issues\n";

[[noreturn]] static void usage() {
  std::cerr << USAGE;
  std::exit(1);
}

static int to_int(const std::string& flag, const std::string& v) {
  try {
    size_t used = 0;
    int n = std::stoi(v, &used);
    if (used == v.size()) return n;
  } catch (const std::exception&) {
  }
  std::cerr << "Bad number for " << flag << ": " << v << "\n";
  std::exit(1);
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage();
  a.mode = argv[1];
  int i = 2;
  if (a.mode == "run") {
    if (i + 1 >= argc) usage();
    a.root_path = argv[i++];
    a.brief = argv[i++];
  } else if (a.mode == "audit") {
    if (i + 1 >= argc) usage();
    a.store_path = argv[i++];
    a.audit.command = argv[i++];
  } else {
    usage();
  }

  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    auto next_int = [&]() { std::string v; next(v); return to_int(f, v); };
    if (a.mode == "run") {
      if (f == "--store") next(a.store_path);
      else if (f == "--persist") a.persist = true;
      else if (f == "--allow-existing") a.allow_existing = true;
      else if (f == "--config") next(a.config_path);
      else if (f == "--instruct-model") next(a.instruct_model);
      else if (f == "--embed-model") next(a.embed_model);
      else if (f == "--max-iters") a.max_iters = next_int();
      else if (f == "--limit") a.limit = next_int();
      else if (f == "--workers") a.workers = next_int();
      else if (f == "--quiet") a.quiet = true;
      else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    } else {
      if (f == "--id") a.audit.id = next_int();
      else if (f == "--report-id") a.audit.report_id = next_int();
      else if (f == "--file-id") a.audit.file_id = next_int();
      else if (f == "--symbol-id") a.audit.symbol_id = next_int();
      else if (f == "--level") next(a.audit.level);
      else if (f == "--query") next(a.audit.query);
      else if (f == "--edge-type") next(a.audit.edge_type);
      else if (f == "--out") next(a.audit.out);
      else if (f == "--limit") a.audit.limit = next_int();
      else { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    }
  }
  return a;
}
