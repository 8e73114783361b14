#include "model_mapper.hpp"

namespace linebridge {

std::vector<std::pair<std::string, std::string>> ModelMapper::DefaultTable() {
  return {
      {"claude-3.7-sonnet-thinking", "scira-anthropic"},
      {"gpt-4o", "scira-4o"},
      {"grok-3", "scira-grok-3"},
      {"gemini-2.5-flash-preview-05-26", "scira-google"},
  };
}

ModelMapper::ModelMapper() : ModelMapper(std::vector<std::pair<std::string, std::string>>{}) {}

ModelMapper::ModelMapper(const std::vector<std::pair<std::string, std::string>>& overrides) {
  for (const auto& kv : DefaultTable()) Add(kv.first, kv.second);
  for (const auto& kv : overrides) Add(kv.first, kv.second);
}

void ModelMapper::Add(const std::string& external, const std::string& internal) {
  auto it = to_backend_.find(external);
  if (it != to_backend_.end()) to_external_.erase(it->second);
  to_backend_[external] = internal;
  to_external_[internal] = external;
}

std::string ModelMapper::ToBackendName(const std::string& external) const {
  auto it = to_backend_.find(external);
  return it == to_backend_.end() ? external : it->second;
}

std::string ModelMapper::ToExternalName(const std::string& internal) const {
  auto it = to_external_.find(internal);
  return it == to_external_.end() ? internal : it->second;
}

}  // namespace linebridge
