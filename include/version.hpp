// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace relaychain {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The relaychain developers";

// Full version info for display
inline std::string GetFullVersionString() {
  return "relaychain version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[1;32m";
} // namespace colors

inline std::string GetStartupBanner() {
  // Box is 65 display chars: "║  " prefix (3) + content + padding + "║" (1)
  auto line = [](const std::string &content) {
    size_t padding = content.length() < 61 ? 61 - content.length() : 0;
    return "║  " + content + std::string(padding, ' ') + "║\n";
  };

  std::string banner;
  banner += "\n";
  banner += colors::GREEN;
  banner +=
      "╔═══════════════════════════════════════════════════════════════╗\n";
  banner += line("");
  banner += line("relaychain - replicated append-only ledger");
  banner += line("");
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line("Version: " + GetVersionString());
  banner +=
      "╟───────────────────────────────────────────────────────────────╢\n";
  banner += line(GetCopyrightString());
  banner += "╚═══════════════════════════════════════════════════════════════╝";
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace relaychain
