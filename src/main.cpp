#include "cli.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "llama_assistant.hpp"
#include "orchestrator.hpp"
#include "store.hpp"

#include <iostream>
#include <memory>

static int run_pipeline(const Args& args) {
  AppConfig cfg;
  if (!args.config_path.empty()) cfg = load_config(args.config_path);
  PipelineConfig& p = cfg.pipeline;
  p.root = args.root_path;
  p.brief = args.brief;
  p.quiet = args.quiet;
  if (args.max_iters > 0) p.max_iters = args.max_iters;
  if (args.limit > 0) p.evidence_limit = args.limit;
  if (args.workers > 0) p.ingest.workers = args.workers;

  Store::Options so;
  so.path = args.store_path;
  so.persist = args.persist;
  so.allow_existing = args.allow_existing;

  LlamaAssistant assistant(args.instruct_model, cfg.llm);
  std::unique_ptr<Embedder> embedder;
  if (!args.embed_model.empty()) embedder.reset(new Embedder(args.embed_model));

  Orchestrator orch(so, assistant, assistant, &assistant, embedder.get());
  try {
    PipelineResult r = orch.run(p);
    std::cout << r.report << "\n";
    std::cerr << "report version " << r.version << " accepted after " << r.iterations
              << " iteration(s): " << r.metrics.describe() << "\n";
    return 0;
  } catch (const GateExhaustedError& e) {
    std::cerr << "error: " << e.what() << "\n";
    if (so.persist) std::cerr << "the drafts are kept in " << orch.store().path() << "\n";
    return 2;
  }
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);

  try {
    if (args.mode == "run") return run_pipeline(args);

    Store::Options so;
    so.path = args.store_path;
    so.persist = true;
    so.read_only = true;
    Store store(so);
    return run_audit(store, args.audit, std::cout);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
