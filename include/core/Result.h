#pragma once

#include <string>
#include <utility>
#include <variant>

namespace dae::core {

/**
 * @brief Reason a component fell back to its "unknown" output.
 */
struct Degraded {
    std::string reason;
};

/**
 * @brief Either a value produced by a component or a Degraded reason.
 *
 * Analyzers and collaborators return this instead of throwing for expected
 * failures (missing tool, too little input). The orchestrator turns the
 * reason into a diagnostic note and substitutes the default-shaped value.
 *
 * @tparam T The value type. Must be default-constructible so valueOr() and
 *           the degraded path can hand out the invariant "unknown" shape.
 */
template<typename T>
class Result {
public:
    Result(T value) : m_state(std::move(value)) {}
    Result(Degraded degraded) : m_state(std::move(degraded)) {}

    static Result degraded(std::string reason) {
        return Result(Degraded{std::move(reason)});
    }

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(m_state); }
    T& value() & { return std::get<T>(m_state); }
    T&& value() && { return std::get<T>(std::move(m_state)); }

    /**
     * @brief Returns the reason, or an empty string for a successful result.
     */
    const std::string& reason() const {
        static const std::string kNone;
        return ok() ? kNone : std::get<Degraded>(m_state).reason;
    }

    T valueOr(T fallback) const& {
        return ok() ? std::get<T>(m_state) : std::move(fallback);
    }

    T valueOr(T fallback) && {
        return ok() ? std::get<T>(std::move(m_state)) : std::move(fallback);
    }

private:
    std::variant<T, Degraded> m_state;
};

/**
 * @brief Whether an external backend can be used, resolved once at startup.
 */
struct Capability {
    bool available = false;
    std::string reason;

    static Capability yes() { return {true, {}}; }
    static Capability no(std::string why) { return {false, std::move(why)}; }
};

} // namespace dae::core
