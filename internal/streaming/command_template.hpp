#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace macrelay::streaming {

/*
  Expands a stream command template into argv.

    <url>      resolved stream link
    <timeout>  upstream timeout in microseconds
    <proxy>    portal proxy; without one, "-http_proxy <proxy>" is dropped

  Placeholders are substituted per argument, so a link never splits.
*/
std::vector<std::string> ExpandCommandTemplate(const std::string& tmpl, const std::string& link, std::chrono::seconds timeout,
                                               const std::string& proxy);

} // namespace macrelay::streaming
