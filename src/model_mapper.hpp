#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace linebridge {

// External (client-facing) model names to backend names and back. Unknown
// names map to themselves.
class ModelMapper {
 public:
  ModelMapper();
  explicit ModelMapper(const std::vector<std::pair<std::string, std::string>>& overrides);

  std::string ToBackendName(const std::string& external) const;
  std::string ToExternalName(const std::string& internal) const;

  static std::vector<std::pair<std::string, std::string>> DefaultTable();

 private:
  void Add(const std::string& external, const std::string& internal);

  std::unordered_map<std::string, std::string> to_backend_;
  std::unordered_map<std::string, std::string> to_external_;
};

}  // namespace linebridge
