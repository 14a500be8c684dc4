#pragma once
#include "kb/EngineConfig.hpp"
#include "kb/KnowledgeBase.hpp"

#include <memory>
#include <string>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

size_t get_size_arg(int argc, char** argv, const std::string& key, size_t def);
double get_double_arg(int argc, char** argv, const std::string& key, double def);

// --config <path> (optional) then per-flag overrides
kb::EngineConfig config_from_args(int argc, char** argv);

// Replays --manifest into a fresh knowledge base. Documents without inline
// concepts are sent through --concepts <dir> (mock extractor) when given.
// --incremental ingests one document at a time instead of one batch.
std::unique_ptr<kb::KnowledgeBase> load_knowledge_base(int argc, char** argv, bool verbose);
