#pragma once
#include "codec.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace clawlink {

struct Fragment {
    FragmentKind kind = FragmentKind::Content;
    std::string delta;   // content/thinking text, or the error message
    int64_t seq = 0;
};

enum class ApplyResult {
    Applied,
    Duplicate,    // seq equal to the last applied one (re-delivery)
    OutOfOrder,   // seq lower than the last applied one
};

struct ApplyOutcome {
    ApplyResult result = ApplyResult::Applied;
    std::optional<Message> message;   // snapshot after applying, if Applied
    bool completed = false;           // message became complete
    bool gap = false;                 // seq skipped ahead of last + 1
};

// Merges streamed fragments into the ordered message list of one session.
//
// Single writer: the owner serializes calls. Fragments are applied only when
// their seq is greater than the last applied seq for this channel; anything
// else is discarded, never reordered.
class StreamAssembler {
public:
    ApplyOutcome apply(const Fragment& fragment);

    // Record a user turn. Any assistant message still open stays open and
    // keeps its position.
    Message append_user(const std::string& text);

    // Insert earlier turns, complete, ahead of everything already held.
    // Sequence indexes are renumbered; seq tracking is unaffected.
    size_t prepend_history(const std::vector<HistoryEntry>& entries);

    const std::vector<Message>& messages() const { return messages_; }
    int64_t last_seq() const { return last_seq_; }
    bool has_open_message() const { return open_index_.has_value(); }

private:
    Message& open_message();

    std::vector<Message> messages_;
    std::optional<size_t> open_index_;
    int64_t last_seq_ = 0;
    bool seen_any_ = false;
};

} // namespace clawlink
