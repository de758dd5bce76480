#include "stream_assembler.hpp"

namespace clawlink {

Message& StreamAssembler::open_message() {
    if (!open_index_) {
        Message msg;
        msg.role = Role::Assistant;
        msg.sequence_index = messages_.size();
        messages_.push_back(std::move(msg));
        open_index_ = messages_.size() - 1;
    }
    return messages_[*open_index_];
}

ApplyOutcome StreamAssembler::apply(const Fragment& fragment) {
    ApplyOutcome out;

    if (seen_any_ && fragment.seq <= last_seq_) {
        out.result = fragment.seq == last_seq_ ? ApplyResult::Duplicate
                                               : ApplyResult::OutOfOrder;
        return out;
    }
    out.gap = seen_any_ && fragment.seq > last_seq_ + 1;
    last_seq_ = fragment.seq;
    seen_any_ = true;

    Message& msg = open_message();
    switch (fragment.kind) {
        case FragmentKind::Content:
            msg.content += fragment.delta;
            break;
        case FragmentKind::Thinking:
            msg.thinking += fragment.delta;
            break;
        case FragmentKind::Error:
            msg.error = fragment.delta.empty() ? "unknown error" : fragment.delta;
            msg.complete = true;
            break;
        case FragmentKind::End:
            msg.complete = true;
            break;
    }

    out.message = msg;
    if (msg.complete) {
        out.completed = true;
        open_index_.reset(); // next delta opens a fresh message
    }
    return out;
}

Message StreamAssembler::append_user(const std::string& text) {
    Message msg;
    msg.role = Role::User;
    msg.content = text;
    msg.complete = true;
    msg.sequence_index = messages_.size();
    messages_.push_back(msg);
    return msg;
}

size_t StreamAssembler::prepend_history(const std::vector<HistoryEntry>& entries) {
    if (entries.empty()) return 0;

    std::vector<Message> merged;
    merged.reserve(entries.size() + messages_.size());
    for (const auto& entry : entries) {
        Message msg;
        msg.role = entry.role;
        msg.content = entry.text;
        msg.complete = true;
        merged.push_back(std::move(msg));
    }
    for (auto& msg : messages_) merged.push_back(std::move(msg));
    messages_ = std::move(merged);

    for (size_t i = 0; i < messages_.size(); ++i) messages_[i].sequence_index = i;
    if (open_index_) *open_index_ += entries.size();
    return entries.size();
}

} // namespace clawlink
