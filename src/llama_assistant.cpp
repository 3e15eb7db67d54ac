#include "llama_assistant.hpp"
#include "errors.hpp"
#include "replies.hpp"
#include "text_util.hpp"
#include <llama.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace {

const char* SUMMARIZE_INSTRUCTIONS =
"You summarize source code for technical documentation.\n"
"Return ONLY a single JSON object:\n"
"{\"summary\": \"...\", \"confidence\": 0.0}\n"
"- confidence is between 0 and 1.\n"
"- Describe only what the text shows.\n";

const char* DRAFT_INSTRUCTIONS =
"You write a markdown report answering the brief, using only the evidence below.\n"
"- Every sentence or bullet ends with a citation in brackets, e.g. [src/a.py:3-10].\n"
"- Cite only the bracketed headers of the evidence blocks, copied exactly.\n"
"- Use '#' headers for sections. Do not invent files or line numbers.\n";

const char* GRADE_INSTRUCTIONS =
"Decide whether the evidence supports the claim.\n"
"Return ONLY a single JSON object:\n"
"{\"status\": \"supported|contradicted|uncertain\", \"rationale\": \"...\"}\n";

void batch_add(llama_batch& b, llama_token tok, llama_pos pos, bool logits) {
  b.token[b.n_tokens] = tok;
  b.pos[b.n_tokens] = pos;
  b.n_seq_id[b.n_tokens] = 1;
  b.seq_id[b.n_tokens][0] = 0;
  b.logits[b.n_tokens] = logits;
  b.n_tokens++;
}

struct BatchGuard {
  llama_batch batch;
  explicit BatchGuard(int n) : batch(llama_batch_init(n, 0, 1)) {}
  ~BatchGuard() { llama_batch_free(batch); }
};

} // namespace

struct LlamaAssistant::Impl {
  llama_model* model = nullptr;
  const llama_vocab* vocab = nullptr;
  LlamaOptions opts;

  Impl(const std::string& model_path, const LlamaOptions& o) : opts(o) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    model = llama_load_model_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw CollaboratorError("assistant: failed to load model " + model_path);
    }
    vocab = llama_model_get_vocab(model);
  }

  ~Impl() {
    if (model) llama_free_model(model);
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& s) {
    int32_t need = -llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), nullptr, 0, /*add_bos*/ true, /*special*/ false);
    if (need <= 0) throw CollaboratorError("assistant: tokenize failed (len)");
    std::vector<llama_token> t(need);
    int32_t n = llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), t.data(), (int32_t)t.size(), true, false);
    if (n != need) throw CollaboratorError("assistant: tokenize failed");
    return t;
  }

  llama_token argmax_token(llama_context* ctx) {
    const float* logits = llama_get_logits_ith(ctx, -1);
    const int n_vocab = llama_n_vocab(vocab);
    int best = 0;
    float bestLogit = logits[0];
    for (int i = 1; i < n_vocab; ++i) {
      if (logits[i] > bestLogit) { bestLogit = logits[i]; best = i; }
    }
    return (llama_token)best;
  }

  std::string token_to_string(llama_token tok) {
    char buf[256];
    int n = llama_token_to_piece(vocab, tok, buf, sizeof(buf), 0, /*special*/ false);
    if (n < 0) return "";
    return std::string(buf, (size_t)n);
  }

  // Greedy completion. A fresh context per request keeps requests independent.
  // Stops at EOS, at max_new_tokens, or when `done` says the output is complete.
  template <typename Done>
  std::string generate(const std::string& prompt, Done done) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts.timeout_seconds);
    auto toks = tokenize(prompt);
    if ((int)toks.size() + opts.max_new_tokens > opts.n_ctx) {
      throw CollaboratorError("assistant: prompt of " + std::to_string(toks.size()) +
                              " tokens does not fit the context window");
    }

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = opts.n_ctx;
    cp.n_batch = opts.n_ctx;
    cp.embeddings = false;
    llama_context* ctx = llama_new_context_with_model(model, cp);
    if (!ctx) throw CollaboratorError("assistant: failed to create context");
    std::unique_ptr<llama_context, void (*)(llama_context*)> owner(ctx, llama_free);

    {
      BatchGuard g((int)toks.size());
      for (int i = 0; i < (int)toks.size(); ++i) batch_add(g.batch, toks[i], i, i + 1 == (int)toks.size());
      if (llama_decode(ctx, g.batch) != 0) throw CollaboratorError("assistant: decode(prompt) failed");
    }

    std::string out;
    int pos = (int)toks.size();
    for (int t = 0; t < opts.max_new_tokens; ++t) {
      if (std::chrono::steady_clock::now() > deadline) {
        throw CollaboratorError("assistant: timed out after " + std::to_string(opts.timeout_seconds) + "s");
      }
      llama_token tok = argmax_token(ctx);
      if (tok == llama_token_eos(vocab)) break;
      out += token_to_string(tok);
      if (done(out)) break;

      BatchGuard g(1);
      batch_add(g.batch, tok, pos++, true);
      if (llama_decode(ctx, g.batch) != 0) throw CollaboratorError("assistant: decode failed");
    }
    return out;
  }

  std::string generate_json(const std::string& prompt) {
    std::string raw = generate(prompt, [](const std::string& s) { return !extract_first_json_object(s).empty(); });
    std::string obj = extract_first_json_object(raw);
    if (obj.empty()) throw CollaboratorError("assistant: no JSON object within " + std::to_string(opts.max_new_tokens) + " tokens");
    return obj;
  }
};

LlamaAssistant::LlamaAssistant(const std::string& model_path, const LlamaOptions& opts)
  : impl_(new Impl(model_path, opts)) {}

LlamaAssistant::~LlamaAssistant() { delete impl_; }

SummaryResult LlamaAssistant::summarize(const std::string& text, const std::string& instructions) {
  std::string prompt;
  prompt.reserve(text.size() + 512);
  prompt.append(SUMMARIZE_INSTRUCTIONS);
  prompt.append("\nTask: ").append(instructions);
  prompt.append("\nText:\n").append(text);
  prompt.append("\nJSON:");
  return parse_summary_reply(impl_->generate_json(prompt));
}

std::string LlamaAssistant::draft(const std::string& prompt, const std::vector<std::string>& evidence_blocks) {
  std::string full;
  full.append(DRAFT_INSTRUCTIONS);
  full.append("\nBrief:\n").append(prompt);
  full.append("\n\nEvidence:\n");
  for (auto& b : evidence_blocks) full.append(b).append("\n\n");
  full.append("Report:\n");
  std::string out = trim(impl_->generate(full, [](const std::string&) { return false; }));
  if (out.empty()) throw CollaboratorError("draft: model produced no text");
  return out;
}

GradeResult LlamaAssistant::grade(const std::string& claim_text, const std::string& evidence_text) {
  std::string prompt;
  prompt.append(GRADE_INSTRUCTIONS);
  prompt.append("\nClaim:\n").append(claim_text);
  prompt.append("\nEvidence:\n").append(evidence_text);
  prompt.append("\nJSON:");
  return parse_grade_reply(impl_->generate_json(prompt));
}
