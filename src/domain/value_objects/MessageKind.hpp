#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace obr::domain {

// Snapshot replaces the whole book for a symbol; Update is incremental.
enum class MessageKind : uint8_t { Snapshot, Update };

inline MessageKind message_kind_from_string(const std::string& str) {
    if (str == "snapshot") return MessageKind::Snapshot;
    if (str == "update") return MessageKind::Update;
    throw std::invalid_argument("Invalid message kind: " + str);
}

inline std::string to_string(MessageKind kind) {
    return kind == MessageKind::Snapshot ? "snapshot" : "update";
}

} // namespace obr::domain
