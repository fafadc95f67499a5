#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Ai,
    Spawn,
    System,
    Warning,
};

const char* messageKindName(MessageKind k);

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;
    uint32_t tick = 0;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    int repeat = 1;
};

// In-memory simulation log with bounded scrollback.
class SimLog {
public:
    static constexpr size_t MAX_MESSAGES = 400;
    static constexpr size_t TRIM_COUNT = 100;

    void push(const std::string& text, MessageKind kind, uint32_t tick);

    const std::vector<Message>& messages() const { return msgs_; }
    size_t count(MessageKind kind) const;
    void clear() { msgs_.clear(); }

private:
    std::vector<Message> msgs_;
};
