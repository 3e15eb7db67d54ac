#include "embedder.hpp"
#include "errors.hpp"
#include "index.hpp"
#include <llama.h>
#include <memory>
#include <string>
#include <vector>

struct Embedder::Impl {
  llama_model* model = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 1024;
  int dim = 0;

  Impl(const std::string& model_path, int ctx_size) : n_ctx(ctx_size) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_load_model_from_file(model_path.c_str(), mp);
    if (!model) {
      llama_backend_free();
      throw CollaboratorError("embedder: failed to load model " + model_path);
    }
    vocab = llama_model_get_vocab(model);
    dim = llama_n_embd(model);
    if (dim <= 0) {
      llama_free_model(model);
      llama_backend_free();
      throw CollaboratorError("embedder: invalid embedding dim");
    }
  }

  ~Impl() {
    if (model) llama_free_model(model);
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& text) {
    // first pass for length
    int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                     nullptr, 0, /*add_bos=*/true, /*special=*/false);
    if (needed <= 0) throw CollaboratorError("embedder: tokenize failed (len)");
    std::vector<llama_token> toks(needed);
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(),
                               /*add_bos=*/true, /*special=*/false);
    if (n != needed) throw CollaboratorError("embedder: tokenize failed");
    // long chunks are embedded by their head
    if ((int)toks.size() > n_ctx) toks.resize((size_t)n_ctx);
    return toks;
  }

  std::vector<float> encode_text(const std::string& text) {
    auto toks = tokenize(text);

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;
    llama_context* raw = llama_new_context_with_model(model, cp);
    if (!raw) throw CollaboratorError("embedder: failed to create context");
    std::unique_ptr<llama_context, void (*)(llama_context*)> ctx(raw, llama_free);

    llama_batch batch = llama_batch_init((int)toks.size(), /*embd*/ 0, /*n_seq*/ 1);
    for (int i = 0; i < (int)toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int)toks.size();
    int rc = llama_decode(ctx.get(), batch);
    llama_batch_free(batch);
    if (rc != 0) throw CollaboratorError("embedder: llama_decode failed");

    // pooled sequence embedding when the model pools, else the last token
    const float* emb = llama_get_embeddings_seq(ctx.get(), 0);
    if (!emb) emb = llama_get_embeddings_ith(ctx.get(), -1);
    if (!emb) throw CollaboratorError("embedder: embeddings null");

    return l2_normalize(std::vector<float>(emb, emb + dim));
  }
};

Embedder::Embedder(const std::string& embed_model_path, int n_ctx)
  : impl_(new Impl(embed_model_path, n_ctx)) {
  dim_ = impl_->dim;
}

Embedder::~Embedder() { delete impl_; }

std::vector<float> Embedder::encode(const std::string& text) {
  if (text.empty()) return std::vector<float>((size_t)dim_, 0.0f);
  return impl_->encode_text(text);
}
