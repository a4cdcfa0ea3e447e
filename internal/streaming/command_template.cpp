#include "command_template.hpp"

#include "internal/process/process.hpp"

namespace macrelay::streaming {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
  for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
    s.replace(pos, from.size(), to);
  }
}

} // namespace

std::vector<std::string> ExpandCommandTemplate(const std::string& tmpl, const std::string& link, std::chrono::seconds timeout,
                                               const std::string& proxy) {
  const auto tokens      = process::SplitCommand(tmpl);
  const auto timeout_str = std::to_string(timeout.count() * 1000000LL);

  std::vector<std::string> argv;
  argv.reserve(tokens.size());
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (proxy.empty() && tokens[i] == "-http_proxy" && i + 1 < tokens.size() && tokens[i + 1] == "<proxy>") {
      ++i;
      continue;
    }

    auto arg = tokens[i];
    ReplaceAll(arg, "<timeout>", timeout_str);
    ReplaceAll(arg, "<proxy>", proxy);
    ReplaceAll(arg, "<url>", link);
    argv.push_back(std::move(arg));
  }
  return argv;
}

} // namespace macrelay::streaming
