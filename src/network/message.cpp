// Copyright (c) 2025 The relaychain developers
// Distributed under the MIT software license

#include "network/message.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace relaychain {
namespace message {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<std::vector<chain::Block>> ParseBlockArray(const json &arr) {
  if (!arr.is_array()) {
    return std::nullopt;
  }
  std::vector<chain::Block> blocks;
  blocks.reserve(arr.size());
  for (const auto &item : arr) {
    auto block = chain::BlockFromJson(item);
    if (!block) {
      return std::nullopt;
    }
    blocks.push_back(std::move(*block));
  }
  return blocks;
}

} // namespace

protocol::MessageType GetType(const Message &msg) {
  return std::visit(
      Overloaded{
          [](const QueryLatestMessage &) { return protocol::MessageType::QUERY_LATEST; },
          [](const QueryAllMessage &) { return protocol::MessageType::QUERY_ALL; },
          [](const ChainResponseMessage &) {
            return protocol::MessageType::RESPONSE_BLOCKCHAIN;
          },
      },
      msg);
}

const char *MessageName(const Message &msg) {
  switch (GetType(msg)) {
  case protocol::MessageType::QUERY_LATEST:
    return "query_latest";
  case protocol::MessageType::QUERY_ALL:
    return "query_all";
  case protocol::MessageType::RESPONSE_BLOCKCHAIN:
    return "response_blockchain";
  }
  return "unknown";
}

std::string Serialize(const Message &msg) {
  json envelope;
  envelope["type"] = static_cast<int>(GetType(msg));

  if (const auto *response = std::get_if<ChainResponseMessage>(&msg)) {
    json blocks = json::array();
    for (const auto &block : response->blocks) {
      blocks.push_back(block);
    }
    envelope["data"] = blocks.dump();
  } else {
    envelope["data"] = nullptr;
  }

  return envelope.dump();
}

std::optional<Message> Parse(std::string_view text) {
  json envelope = json::parse(text.begin(), text.end(), nullptr, false);
  if (envelope.is_discarded() || !envelope.is_object()) {
    LOG_NET_TRACE("Parse: not a JSON object");
    return std::nullopt;
  }

  auto type_it = envelope.find("type");
  if (type_it == envelope.end() || !type_it->is_number_integer()) {
    LOG_NET_TRACE("Parse: missing or non-integer type");
    return std::nullopt;
  }

  switch (type_it->get<int64_t>()) {
  case static_cast<int>(protocol::MessageType::QUERY_LATEST):
    return Message{QueryLatestMessage{}};
  case static_cast<int>(protocol::MessageType::QUERY_ALL):
    return Message{QueryAllMessage{}};
  case static_cast<int>(protocol::MessageType::RESPONSE_BLOCKCHAIN):
    break;
  default:
    LOG_NET_TRACE("Parse: unknown type {}", type_it->dump());
    return std::nullopt;
  }

  auto data_it = envelope.find("data");
  if (data_it == envelope.end()) {
    return std::nullopt;
  }

  std::optional<std::vector<chain::Block>> blocks;
  if (data_it->is_string()) {
    const auto &inner_text = data_it->get_ref<const std::string &>();
    json inner = json::parse(inner_text, nullptr, false);
    if (inner.is_discarded()) {
      LOG_NET_TRACE("Parse: block data is not valid JSON");
      return std::nullopt;
    }
    blocks = ParseBlockArray(inner);
  } else {
    blocks = ParseBlockArray(*data_it);
  }

  if (!blocks) {
    LOG_NET_TRACE("Parse: malformed block array");
    return std::nullopt;
  }
  return Message{ChainResponseMessage{std::move(*blocks)}};
}

} // namespace message
} // namespace relaychain
