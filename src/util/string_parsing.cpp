// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace relaychain {
namespace util {

// Parse a full decimal string into a long. Rejects empty input, leading
// whitespace and trailing characters.
static std::optional<long> ParseWholeLong(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWholeLong(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWholeLong(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::string PeerAddress::ToString() const {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::optional<PeerAddress> ParsePeerAddress(const std::string& str) {
  std::string rest = str;

  // Strip scheme used by existing deployments
  static const std::string kScheme = "ws://";
  if (rest.compare(0, kScheme.size(), kScheme) == 0) {
    rest = rest.substr(kScheme.size());
    if (!rest.empty() && rest.back() == '/') {
      rest.pop_back();
    }
  }

  if (rest.empty()) {
    return std::nullopt;
  }

  PeerAddress out;
  std::string port_str;

  if (rest[0] == '[') {
    size_t bracket_end = rest.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return std::nullopt;
    }
    out.host = rest.substr(1, bracket_end - 1);
    if (bracket_end + 1 >= rest.size() || rest[bracket_end + 1] != ':') {
      return std::nullopt;
    }
    port_str = rest.substr(bracket_end + 2);
  } else {
    size_t colon = rest.find(':');
    if (colon == std::string::npos || rest.find(':', colon + 1) != std::string::npos) {
      return std::nullopt;
    }
    out.host = rest.substr(0, colon);
    port_str = rest.substr(colon + 1);
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  for (char c : out.host) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '/') {
      return std::nullopt;
    }
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }
  out.port = *port;
  return out;
}

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t comma = str.find(',', pos);
    if (comma == std::string::npos) {
      comma = str.size();
    }
    std::string item = str.substr(pos, comma - pos);
    size_t first = item.find_first_not_of(" \t");
    size_t last = item.find_last_not_of(" \t");
    if (first != std::string::npos) {
      items.push_back(item.substr(first, last - first + 1));
    }
    pos = comma + 1;
  }
  return items;
}

std::string EscapeJSONString(const std::string& str) {
  std::ostringstream oss;
  for (char c : str) {
    switch (c) {
      case '"':  oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(static_cast<unsigned char>(c));
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

std::string JsonError(const std::string& message) {
  return "{\"error\":\"" + EscapeJSONString(message) + "\"}\n";
}

std::string JsonSuccess(const std::string& result) {
  return "{\"result\":\"" + EscapeJSONString(result) + "\"}\n";
}

} // namespace util
} // namespace relaychain
