#include "chatbridge/translate/tool_result_buffer.hpp"

namespace chatbridge::translate {

void ToolResultBuffer::add(std::string tool_use_id, std::string content) {
    pending_.push_back({
        {"type", "tool_result"},
        {"tool_use_id", std::move(tool_use_id)},
        {"content", std::move(content)},
    });
    state_ = State::Accumulating;
}

auto ToolResultBuffer::flush() -> std::optional<json> {
    if (state_ == State::Idle) return std::nullopt;

    json message = {
        {"role", "user"},
        {"content", std::move(pending_)},
    };
    pending_ = json::array();
    state_ = State::Idle;
    return message;
}

} // namespace chatbridge::translate
