#pragma once

#include <memory>
#include <string>

#include "llm/LLMClient.hpp"
#include "recs/PipelineConfig.hpp"

// Subcommands take argv starting at the subcommand name.
// 0 = success, 1 = failed run or bad input, 2 = usage error.
int cmd_recommend(int argc, char** argv);
int cmd_rebuild(int argc, char** argv);
int cmd_graph(int argc, char** argv);
int cmd_embed(int argc, char** argv);

namespace cli {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
bool has_flag(int argc, char** argv, const std::string& key);

// --config file (if any) with the --llm_model / --llm_cache / --max_candidates / --selected / --type
// overrides applied. Without a config file the candidate pool defaults to 500.
recs::AppConfig load_config(int argc, char** argv);

// --llm_mock <json> -> scripted client, --no_llm -> null client, otherwise Ollama.
std::unique_ptr<llm::LLMClient> make_oracle(int argc, char** argv, const recs::LlmConfig& cfg);

}  // namespace cli
