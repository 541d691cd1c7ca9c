#pragma once

#include <memory>
#include <string>

#include <onnxruntime_cxx_api.h>

#include "embedding_model.hpp"
#include "wordpiece_tokenizer.hpp"

#ifndef MINILM_INTRA_OP_THREADS
#define MINILM_INTRA_OP_THREADS 1
#endif

/* Sentence embeddings from an exported MiniLM (all-MiniLM-L6-v2) ONNX model:
 * mean of the token states under the attention mask, L2 normalized.
 */
class Minilm_Embedder : public Embedding_Model {
  public:
    explicit Minilm_Embedder(size_t max_length = 256);

    // disable copy constructor and copy assignment (non-copyable)
    Minilm_Embedder(Minilm_Embedder const&) = delete;
    Minilm_Embedder& operator=(Minilm_Embedder const&) = delete;

    // return false if the vocabulary or the model cant be loaded
    bool init(const std::string& model_path, const std::string& vocab_path);

    std::optional<std::vector<Embedding>> embed_batch(const std::vector<std::string>& texts) const override;

  private:
    size_t max_length_;
    Wordpiece_Tokenizer tokenizer_;

    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "pdf_outliner"};
    Ort::SessionOptions options_;
    std::unique_ptr<Ort::Session> session_;

    std::vector<std::string> input_names_;
    std::string output_name_;
};
