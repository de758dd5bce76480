#pragma once
#include <string>
#include <cstdint>

namespace clawlink {

enum class Role { User, Assistant };

struct Message {
    Role role = Role::Assistant;
    std::string content;
    std::string thinking;
    bool complete = false;
    uint64_t sequence_index = 0;   // position within the owning session
    std::string error;             // set when the backend ended the turn with an error
};

inline const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

} // namespace clawlink
