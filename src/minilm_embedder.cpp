#include "minilm_embedder.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>

namespace {

void l2_normalize(Embedding& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    if (sum <= 0.0) {
        return;
    }

    const double inv = 1.0 / std::sqrt(sum);
    for (float& x : v) {
        x = static_cast<float>(x * inv);
    }
}

}

Minilm_Embedder::Minilm_Embedder(size_t max_length) :
    max_length_(max_length) {

}

bool Minilm_Embedder::init(const std::string& model_path, const std::string& vocab_path) {
    if (!tokenizer_.load_vocab(vocab_path)) {
        LOG_CHANNEL_ERROR("ranker") << "cannot load vocabulary " << vocab_path;
        return false;
    }

    try {
        options_.SetIntraOpNumThreads(MINILM_INTRA_OP_THREADS);
        options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
        session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), options_);

        Ort::AllocatorWithDefaultOptions allocator;
        input_names_.clear();
        for (size_t i = 0; i < session_->GetInputCount(); ++i) {
            input_names_.emplace_back(session_->GetInputNameAllocated(i, allocator).get());
        }
        output_name_ = session_->GetOutputNameAllocated(0, allocator).get();
    } catch (const Ort::Exception& e) {
        LOG_CHANNEL_ERROR("ranker") << "cannot load model " << model_path << ": " << e.what();
        session_.reset();
        return false;
    }

    LOG_CHANNEL_INFO("ranker") << "loaded model " << model_path << " (" << input_names_.size() << " inputs)";
    return true;
}

std::optional<std::vector<Embedding>> Minilm_Embedder::embed_batch(const std::vector<std::string>& texts) const {
    if (!session_) {
        return std::nullopt;
    }
    if (texts.empty()) {
        return std::vector<Embedding>();
    }

    std::vector<std::vector<int64_t>> encoded;
    encoded.reserve(texts.size());
    size_t sequence_length = 0;
    for (const std::string& text : texts) {
        encoded.push_back(tokenizer_.encode(text, max_length_));
        sequence_length = std::max(sequence_length, encoded.back().size());
    }

    // one padded [batch, sequence] tensor per input
    const size_t batch = texts.size();
    std::vector<int64_t> ids(batch * sequence_length, tokenizer_.pad_id());
    std::vector<int64_t> mask(batch * sequence_length, 0);
    std::vector<int64_t> type_ids(batch * sequence_length, 0);
    for (size_t row = 0; row < batch; ++row) {
        for (size_t t = 0; t < encoded[row].size(); ++t) {
            ids[row * sequence_length + t] = encoded[row][t];
            mask[row * sequence_length + t] = 1;
        }
    }

    try {
        const std::vector<int64_t> shape{static_cast<int64_t>(batch), static_cast<int64_t>(sequence_length)};
        Ort::MemoryInfo memory = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

        std::vector<Ort::Value> inputs;
        std::vector<const char*> input_names;
        for (const std::string& name : input_names_) {
            std::vector<int64_t>* data = &ids;
            if (name == "attention_mask") {
                data = &mask;
            } else if (name == "token_type_ids") {
                data = &type_ids;
            }
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory, data->data(), data->size(), shape.data(), shape.size()));
            input_names.push_back(name.c_str());
        }

        const char* output_names[1] = {output_name_.c_str()};
        std::vector<Ort::Value> outputs = session_->Run(Ort::RunOptions{nullptr},
                                                        input_names.data(), inputs.data(), inputs.size(),
                                                        output_names, 1);

        std::vector<int64_t> output_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (output_shape.size() != 3) {
            LOG_CHANNEL_ERROR("ranker") << "unexpected output rank " << output_shape.size();
            return std::nullopt;
        }

        // [batch, sequence, hidden], contiguous
        const size_t hidden = static_cast<size_t>(output_shape[2]);
        const float* data = outputs[0].GetTensorData<float>();

        std::vector<Embedding> embeddings;
        embeddings.reserve(batch);
        for (size_t row = 0; row < batch; ++row) {
            Embedding pooled(hidden, 0.0f);
            double count = 0;
            for (size_t t = 0; t < sequence_length; ++t) {
                if (mask[row * sequence_length + t] == 0) {
                    continue;
                }
                count += 1;
                const float* state = data + (row * sequence_length + t) * hidden;
                for (size_t j = 0; j < hidden; ++j) {
                    pooled[j] += state[j];
                }
            }
            if (count > 0) {
                for (float& x : pooled) {
                    x = static_cast<float>(x / count);
                }
            }
            l2_normalize(pooled);
            embeddings.push_back(std::move(pooled));
        }
        return embeddings;
    } catch (const Ort::Exception& e) {
        LOG_CHANNEL_ERROR("ranker") << "embedding failed: " << e.what();
        return std::nullopt;
    }
}
