// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Clock.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voicetutor
{

enum class Role : std::uint8_t
{
    User,
    Assistant,
};

[[nodiscard]] constexpr auto roleName(Role role) -> std::string_view
{
    return role == Role::User ? "user" : "assistant";
}

/// @brief One party's contribution to the conversation.
struct ConversationTurn
{
    Role role = Role::User;
    std::string text;
    TimePoint startedAt {};
    TimePoint endedAt {};

    /// @brief An assistant turn cut short by barge-in.
    bool interrupted = false;
};

/// @brief Append-only log of committed turns, used for context bridging across interruptions.
class ConversationLog
{
  public:
    void append(ConversationTurn turn);

    /// @brief Replaces the text of the last user turn (a recognizer revision of the same utterance).
    /// @return False if the last turn is not a user turn.
    auto reviseLastUserTurn(std::string text) -> bool;

    [[nodiscard]] auto turns() const -> const std::vector<ConversationTurn>& { return _turns; }

    /// @brief Returns the most recent turn of @p role, or nullptr.
    [[nodiscard]] auto last(Role role) const -> const ConversationTurn*;

    [[nodiscard]] auto size() const -> std::size_t { return _turns.size(); }

    void clear();

  private:
    std::vector<ConversationTurn> _turns;
};

} // namespace voicetutor
