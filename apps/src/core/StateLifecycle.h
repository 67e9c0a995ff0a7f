#pragma once

/**
 * @file StateLifecycle.h
 * @brief Shared state machine lifecycle helpers for onEnter/onExit dispatch.
 *
 * States can define:
 * - Any onEnter(Engine&) - returns state to be in (self or redirect)
 * - void onEnter(Engine&) - stays in current state
 * - void onExit(Engine&) - cleanup on exit
 */

#include <concepts>
#include <utility>
#include <variant>

namespace NixBlitz {

// Invoke onEnter if present. Returns state to be in (same or redirect).
template <typename StateAny, typename Engine>
StateAny invokeOnEnter(StateAny&& state, Engine& engine)
{
    std::visit(
        [&engine, &state](auto& s) {
            if constexpr (requires {
                              { s.onEnter(engine) } -> std::convertible_to<StateAny>;
                          }) {
                state = s.onEnter(engine);
            }
            else if constexpr (requires { s.onEnter(engine); }) {
                s.onEnter(engine);
            }
        },
        state.getVariant());
    return std::move(state);
}

// Invoke onExit if present.
template <typename StateAny, typename Engine>
void invokeOnExit(StateAny& state, Engine& engine)
{
    std::visit(
        [&engine](auto& s) {
            if constexpr (requires { s.onExit(engine); }) {
                s.onExit(engine);
            }
        },
        state.getVariant());
}

// True when both values hold the same state alternative, regardless of payload.
template <typename StateAny>
bool isSameStateKind(const StateAny& a, const StateAny& b)
{
    return a.getVariant().index() == b.getVariant().index();
}

} // namespace NixBlitz
