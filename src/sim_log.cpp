#include "sim_log.hpp"

const char* messageKindName(MessageKind k) {
    switch (k) {
        case MessageKind::Info: return "info";
        case MessageKind::Combat: return "combat";
        case MessageKind::Ai: return "ai";
        case MessageKind::Spawn: return "spawn";
        case MessageKind::System: return "system";
        case MessageKind::Warning: return "warning";
    }
    return "info";
}

void SimLog::push(const std::string& text, MessageKind kind, uint32_t tick) {
    // Coalesce consecutive identical messages to reduce spam from idle monsters.
    if (!msgs_.empty()) {
        Message& last = msgs_.back();
        if (last.text == text && last.kind == kind) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            last.tick = tick;
            return;
        }
    }

    // Keep some scrollback
    if (msgs_.size() >= MAX_MESSAGES) {
        msgs_.erase(msgs_.begin(), msgs_.begin() + static_cast<std::ptrdiff_t>(TRIM_COUNT));
    }
    msgs_.push_back({text, kind, tick, 1});
}

size_t SimLog::count(MessageKind kind) const {
    size_t n = 0;
    for (const Message& m : msgs_) {
        if (m.kind == kind) ++n;
    }
    return n;
}
