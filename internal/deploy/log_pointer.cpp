#include "log_pointer.hpp"

#include <cctype>
#include <regex>

#include "internal/util/errors.hpp"

namespace shipyard::deploy {

LogPointerPolicy::LogPointerPolicy(std::string log_dir) : log_dir_(std::move(log_dir)) {
  while (log_dir_.size() > 1 && log_dir_.back() == '/') {
    log_dir_.pop_back();
  }
}

std::string LogPointerPolicy::NormalizeSlug(std::string_view slug) {
  std::string out;
  out.reserve(slug.size());
  for (char c : slug) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    } else if (!out.empty() && out.back() != '-') {
      out.push_back('-');
    }
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out.empty() ? "project" : out;
}

std::string LogPointerPolicy::Make(std::string_view slug, std::uint64_t epoch_ms) const {
  return log_dir_ + "/deploy-" + NormalizeSlug(slug) + "-" + std::to_string(epoch_ms) + ".log";
}

bool LogPointerPolicy::IsValid(std::string_view pointer) const {
  const std::string prefix = log_dir_ + "/";
  if (pointer.size() <= prefix.size() || pointer.substr(0, prefix.size()) != prefix) {
    return false;
  }

  // NAME_MAX
  constexpr std::size_t kMaxFileName = 255;

  static const std::regex kFileName(R"(^deploy-[a-z0-9][a-z0-9-]*-[0-9]+\.log$)");
  const auto              name = pointer.substr(prefix.size());
  if (name.size() > kMaxFileName) {
    return false;
  }
  return std::regex_match(name.begin(), name.end(), kFileName);
}

void LogPointerPolicy::Require(std::string_view pointer) const {
  if (!IsValid(pointer)) {
    throw util::InvalidArgument("invalid log file path: " + std::string(pointer));
  }
}

} // namespace shipyard::deploy
