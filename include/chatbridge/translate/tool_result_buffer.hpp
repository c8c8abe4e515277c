#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace chatbridge::translate {

using json = nlohmann::json;

/// Collects consecutive source-protocol `tool` messages so they can be
/// emitted as a single target-protocol `user` message.
///
/// Two states: Idle (nothing buffered) and Accumulating. `add()` always
/// leaves the buffer Accumulating; `flush()` always leaves it Idle.
class ToolResultBuffer {
public:
    enum class State {
        Idle,
        Accumulating,
    };

    /// Buffer one tool result, correlated to the invocation `tool_use_id`.
    void add(std::string tool_use_id, std::string content);

    /// Emit the synthetic user message carrying every buffered result in
    /// arrival order. Returns nullopt when Idle.
    [[nodiscard]] auto flush() -> std::optional<json>;

    [[nodiscard]] auto state() const noexcept -> State { return state_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return pending_.size(); }

private:
    State state_ = State::Idle;
    json pending_ = json::array();
};

} // namespace chatbridge::translate
