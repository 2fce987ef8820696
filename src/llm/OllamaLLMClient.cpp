#include "llm/OllamaLLMClient.hpp"
#include "llm/ProcUtil.hpp"
#include "nlohmann/json.hpp"
#include "util/TextUtil.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace llm {

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool ensure_dir(const fs::path& p) {
    std::error_code ec;
    fs::create_directories(p, ec);
    return !ec;
}

// very small FNV-1a hash for cache keys (deterministic, no deps)
static uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= (uint64_t)c;
        h *= 1099511628211ull;
    }
    return h;
}

static std::string hex_u64(uint64_t x) {
    const char* hex = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[i] = hex[x & 0xF];
        x >>= 4;
    }
    return out;
}

static bool mentions_quota(const std::string& s) {
    return textutil::contains_ci(s, "quota") || textutil::contains_ci(s, "billing") ||
           textutil::contains_ci(s, "insufficient credit");
}

OllamaLLMClient::OllamaLLMClient(OllamaOptions opt) : opt_(std::move(opt)) {
    if (!opt_.cache_dir.empty()) {
        cache_dir_ = opt_.cache_dir;
        ensure_dir(cache_dir_);
    }
}

std::string OllamaLLMClient::cache_key(const std::string& prompt) const {
    std::string s = opt_.model + "\n" + prompt;
    return "classify_v1-" + hex_u64(fnv1a64(s));
}

bool OllamaLLMClient::load_cache(const std::string& key, std::string& out) const {
    if (cache_dir_.empty()) return false;
    fs::path p = cache_dir_ / (key + ".txt");
    std::ifstream f(p, std::ios::in);
    if (!f) return false;
    out = read_all(f);
    return true;
}

void OllamaLLMClient::save_cache(const std::string& key, const std::string& content) const {
    if (cache_dir_.empty()) return;
    fs::path p = cache_dir_ / (key + ".txt");
    std::ofstream f(p, std::ios::out | std::ios::trunc);
    if (!f) return;
    f << content;
}

std::string OllamaLLMClient::run_ollama(const std::string& prompt) const {
    static std::atomic<unsigned> seq{0};

    fs::path work = cache_dir_.empty() ? fs::temp_directory_path() : cache_dir_;
    ensure_dir(work);

    // unique per call so concurrent validators don't share temp files
    const std::string tag = std::to_string((long)::getpid()) + "-" + std::to_string(seq++);
    fs::path payload = work / ("ollama_payload." + tag + ".json");
    fs::path resp = work / ("ollama_response." + tag + ".json");

    {
        json body = {
            {"model", opt_.model},
            {"prompt", prompt},
            {"stream", false},
            {"options", {{"temperature", opt_.temperature}, {"num_predict", opt_.num_predict}}},
        };
        std::ofstream f(payload, std::ios::out | std::ios::trunc);
        if (!f) throw std::runtime_error("failed to write ollama payload: " + payload.string());
        f << body.dump();
    }

    // write response to file, status code on stdout
    std::ostringstream cmd;
    cmd << "curl -s -S"
        << " --max-time " << opt_.timeout_seconds
        << " -o " << procutil::shell_quote(resp.string())
        << " -w '%{http_code}'"
        << " -H 'Content-Type: application/json'"
        << " --data-binary " << procutil::shell_quote("@" + payload.string())
        << " " << procutil::shell_quote(opt_.endpoint);

    procutil::ProcResult pr = procutil::run_capture(cmd.str());

    std::string body;
    {
        std::ifstream rf(resp, std::ios::in);
        if (rf) body = read_all(rf);
    }
    std::error_code ec;
    fs::remove(payload, ec);
    fs::remove(resp, ec);

    if (pr.exit_code == -1) throw std::runtime_error("failed to start curl");
    if (pr.exit_code == 6 || pr.exit_code == 7 || pr.exit_code == 28 || pr.exit_code == 52 || pr.exit_code == 56) {
        throw TransientError("ollama unreachable (curl exit " + std::to_string(pr.exit_code) + ")");
    }
    if (pr.exit_code != 0) {
        throw std::runtime_error("curl failed (exit " + std::to_string(pr.exit_code) + "): " +
                                 textutil::trim_copy(pr.output));
    }

    // -w output is the last three characters of the captured text
    const std::string out = textutil::trim_copy(pr.output);
    int http = 0;
    if (out.size() >= 3) http = std::atoi(out.substr(out.size() - 3).c_str());

    if (http == 429) {
        if (mentions_quota(body)) throw QuotaExceededError("ollama: " + textutil::trim_copy(body));
        throw TransientError("ollama rate limited (429)");
    }
    if (http == 402 || (http == 403 && mentions_quota(body))) {
        throw QuotaExceededError("ollama refused request (" + std::to_string(http) + ")");
    }
    if (http >= 500) throw TransientError("ollama server error (" + std::to_string(http) + ")");
    if (http != 200) throw std::runtime_error("ollama returned HTTP " + std::to_string(http));

    try {
        auto j = json::parse(body);
        if (j.contains("error") && j["error"].is_string()) {
            const std::string err = j["error"].get<std::string>();
            if (mentions_quota(err)) throw QuotaExceededError("ollama: " + err);
            throw std::runtime_error("ollama: " + err);
        }
        if (j.contains("response") && j["response"].is_string()) {
            return j["response"].get<std::string>();
        }
    } catch (const json::exception&) {
        // non-JSON body: treated as an empty answer
        return "";
    }

    return "";
}

std::string OllamaLLMClient::classify(const std::string& prompt) {
    const std::string key = cache_key(prompt);

    std::string cached;
    if (load_cache(key, cached)) return cached;

    std::string out = run_ollama(prompt);
    if (!out.empty()) save_cache(key, out);
    return out;
}

}  // namespace llm
