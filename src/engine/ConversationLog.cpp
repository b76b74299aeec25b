// SPDX-License-Identifier: Apache-2.0
#include "ConversationLog.hpp"

#include <ranges>
#include <utility>

namespace voicetutor
{

void ConversationLog::append(ConversationTurn turn)
{
    _turns.push_back(std::move(turn));
}

auto ConversationLog::reviseLastUserTurn(std::string text) -> bool
{
    if (_turns.empty() || _turns.back().role != Role::User)
        return false;
    _turns.back().text = std::move(text);
    return true;
}

auto ConversationLog::last(Role role) const -> const ConversationTurn*
{
    for (auto const& turn: std::views::reverse(_turns))
        if (turn.role == role)
            return &turn;
    return nullptr;
}

void ConversationLog::clear()
{
    _turns.clear();
}

} // namespace voicetutor
