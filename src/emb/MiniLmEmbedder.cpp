#include "emb/MiniLmEmbedder.hpp"
#include "store/VectorStore.hpp"
#include <algorithm>
#include <stdexcept>

namespace emb {

MiniLmEmbedder::MiniLmEmbedder(const std::string& model_path, const std::string& vocab_path) {
    if (!m_tok.load_vocab(vocab_path)) {
        throw std::runtime_error("MiniLmEmbedder: failed to load vocab: " + vocab_path);
    }

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        // ORTCHAR_T is char on POSIX
        m_session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);

        Ort::AllocatorWithDefaultOptions allocator;
        auto name_alloc = m_session->GetOutputNameAllocated(0, allocator);
        m_out_name = name_alloc.get();

        // some exports drop token_type_ids
        m_input_count = std::min<size_t>(3, m_session->GetInputCount());
        if (m_input_count < 2) {
            throw std::runtime_error("MiniLmEmbedder: model needs input_ids and attention_mask");
        }
        auto in0 = m_session->GetInputNameAllocated(0, allocator);
        auto in1 = m_session->GetInputNameAllocated(1, allocator);
        m_in_ids = in0.get();
        m_in_mask = in1.get();
        if (m_input_count == 3) {
            auto in2 = m_session->GetInputNameAllocated(2, allocator);
            m_in_type = in2.get();
        }
    } catch (const Ort::Exception& e) {
        throw std::runtime_error("MiniLmEmbedder: " + std::string(e.what()) + " (model_path=" + model_path + ")");
    }
}

std::vector<float> MiniLmEmbedder::embed(const std::string& text, size_t max_len) const {
    std::vector<int64_t> ids = m_tok.encode(text, max_len);
    const size_t seq_len = ids.size();

    std::vector<int64_t> mask(seq_len, 1);
    std::vector<int64_t> type_ids(seq_len, 0);

    std::vector<int64_t> shape{1, (int64_t)seq_len};

    Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

    Ort::Value in_vals[3] = {
        Ort::Value::CreateTensor<int64_t>(mem, ids.data(), ids.size(), shape.data(), shape.size()),
        Ort::Value::CreateTensor<int64_t>(mem, mask.data(), mask.size(), shape.data(), shape.size()),
        Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()),
    };
    const char* in_names[3] = { m_in_ids.c_str(), m_in_mask.c_str(), m_in_type.c_str() };
    const char* out_names[1] = { m_out_name.c_str() };

    auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, in_vals, m_input_count, out_names, 1);

    Ort::Value& out = outs[0];
    auto shp = out.GetTensorTypeAndShapeInfo().GetShape();  // [1, seq_len, hidden]
    if (shp.size() != 3) return {};

    const size_t hidden = (size_t)shp[2];
    const float* data = out.GetTensorData<float>();

    std::vector<float> pooled(hidden, 0.0f);
    for (size_t t = 0; t < seq_len; ++t) {
        const float* row = data + t * hidden;
        for (size_t j = 0; j < hidden; ++j) pooled[j] += row[j];
    }
    const float inv = 1.0f / (float)seq_len;
    for (float& x : pooled) x *= inv;

    if (!store::l2_normalize(pooled)) return {};
    return pooled;
}

}  // namespace emb
