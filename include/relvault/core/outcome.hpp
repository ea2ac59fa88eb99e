/**
 * @file outcome.hpp
 * @brief Outcome model for storage writer operations
 *
 * An outcome is a closed sum of three shapes:
 * - outcome_result: the step succeeded with a value
 * - outcome_warning: the step succeeded with a value, but a non-fatal fault
 *   happened along the way
 * - outcome_exception: the step failed; any partial value produced before
 *   the failure is kept
 *
 * outcomes<T> aggregates one outcome per input item, keyed and in input
 * order, so batch operations can report per-item results instead of failing
 * as a whole.
 *
 * @example
 * @code
 * auto o = relvault::outcome<int>::warning(42, cause);
 * o.visit(relvault::overloaded{
 *     [](const relvault::outcome_result<int>& r) { use(r.value); },
 *     [](const relvault::outcome_warning<int>& w) { log(w.cause); },
 *     [](const relvault::outcome_exception<int>& e) { report(e.cause); }});
 * @endcode
 */

#pragma once

#include "result.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace relvault {

/**
 * @brief Helper for building exhaustive visitors from lambdas
 */
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

/**
 * @brief Exception raised when a failed outcome is unwrapped
 */
class outcome_error : public std::runtime_error {
public:
    explicit outcome_error(error_info cause)
        : std::runtime_error(cause.message), cause_(std::move(cause)) {}

    [[nodiscard]] const error_info& cause() const noexcept { return cause_; }

private:
    error_info cause_;
};

/// Successful step
template <typename T>
struct outcome_result {
    T value;
};

/// Successful step that also produced a non-fatal fault
template <typename T>
struct outcome_warning {
    T value;
    error_info cause;
};

/// Failed step, with the progress made before the failure (if any)
template <typename T>
struct outcome_exception {
    error_info cause;
    std::optional<T> partial;
};

/**
 * @brief Result of one writer operation
 */
template <typename T>
class outcome {
public:
    using value_type = T;
    using variant_type = std::variant<outcome_result<T>, outcome_warning<T>,
                                      outcome_exception<T>>;

    outcome(outcome_result<T> r) : state_(std::move(r)) {}
    outcome(outcome_warning<T> w) : state_(std::move(w)) {}
    outcome(outcome_exception<T> e) : state_(std::move(e)) {}

    [[nodiscard]] static auto success(T value) -> outcome {
        return outcome(outcome_result<T>{std::move(value)});
    }

    [[nodiscard]] static auto warning(T value, error_info cause) -> outcome {
        return outcome(outcome_warning<T>{std::move(value), std::move(cause)});
    }

    [[nodiscard]] static auto failure(error_info cause) -> outcome {
        return outcome(outcome_exception<T>{std::move(cause), std::nullopt});
    }

    [[nodiscard]] static auto failure_after(error_info cause, T partial)
        -> outcome {
        return outcome(
            outcome_exception<T>{std::move(cause), std::move(partial)});
    }

    /**
     * @brief Convert a strict Result into an outcome
     */
    [[nodiscard]] static auto from_result(Result<T> result) -> outcome {
        if (result.is_err()) {
            return failure(result.error());
        }
        return success(std::move(result.value()));
    }

    // Queries

    [[nodiscard]] bool ok() const noexcept {
        return !std::holds_alternative<outcome_exception<T>>(state_);
    }

    [[nodiscard]] bool failed() const noexcept { return !ok(); }

    [[nodiscard]] bool has_warning() const noexcept {
        return std::holds_alternative<outcome_warning<T>>(state_);
    }

    [[nodiscard]] bool has_partial() const noexcept {
        const auto* e = std::get_if<outcome_exception<T>>(&state_);
        return e != nullptr && e->partial.has_value();
    }

    /**
     * @brief Warning or failure cause, if any
     */
    [[nodiscard]] auto cause() const -> std::optional<error_info> {
        if (const auto* w = std::get_if<outcome_warning<T>>(&state_)) {
            return w->cause;
        }
        if (const auto* e = std::get_if<outcome_exception<T>>(&state_)) {
            return e->cause;
        }
        return std::nullopt;
    }

    /**
     * @brief Value produced before a failure, if any
     */
    [[nodiscard]] auto partial() const noexcept -> const T* {
        const auto* e = std::get_if<outcome_exception<T>>(&state_);
        return (e != nullptr && e->partial) ? &*e->partial : nullptr;
    }

    // Access

    /**
     * @brief Value of a successful outcome
     * @throws outcome_error if the outcome is a failure
     */
    [[nodiscard]] auto value() const -> const T& {
        if (const auto* r = std::get_if<outcome_result<T>>(&state_)) {
            return r->value;
        }
        if (const auto* w = std::get_if<outcome_warning<T>>(&state_)) {
            return w->value;
        }
        throw outcome_error(std::get<outcome_exception<T>>(state_).cause);
    }

    [[nodiscard]] auto value() -> T& {
        return const_cast<T&>(std::as_const(*this).value());
    }

    /**
     * @brief Fail-fast access: value on success, raises the cause otherwise
     */
    [[nodiscard]] auto result_or_raise() const& -> const T& { return value(); }

    [[nodiscard]] auto result_or_raise() && -> T { return std::move(value()); }

    /**
     * @brief Collapse into a strict Result, dropping any warning
     */
    [[nodiscard]] auto to_result() const -> Result<T> {
        if (const auto* e = std::get_if<outcome_exception<T>>(&state_)) {
            return Result<T>(e->cause);
        }
        return Result<T>(value());
    }

    template <typename F>
    decltype(auto) visit(F&& f) const {
        return std::visit(std::forward<F>(f), state_);
    }

    /**
     * @brief Transform the carried value, keeping the shape and cause
     */
    template <typename F>
    [[nodiscard]] auto map(F&& f) const
        -> outcome<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        return std::visit(
            overloaded{
                [&](const outcome_result<T>& r) {
                    return outcome<U>::success(std::invoke(f, r.value));
                },
                [&](const outcome_warning<T>& w) {
                    return outcome<U>::warning(std::invoke(f, w.value),
                                               w.cause);
                },
                [&](const outcome_exception<T>& e) {
                    if (e.partial) {
                        return outcome<U>::failure_after(
                            e.cause, std::invoke(f, *e.partial));
                    }
                    return outcome<U>::failure(e.cause);
                }},
            state_);
    }

    [[nodiscard]] auto state() const noexcept -> const variant_type& {
        return state_;
    }

private:
    variant_type state_;
};

/**
 * @brief Ordered, keyed collection of outcomes
 *
 * Every appended item is kept; the collection never drops or merges entries,
 * even when two items share a key.
 */
template <typename T>
class outcomes {
public:
    struct entry {
        std::string key;
        outcome<T> item;
    };

    using const_iterator = typename std::vector<entry>::const_iterator;

    void append(std::string key, outcome<T> item) {
        entries_.push_back(entry{std::move(key), std::move(item)});
    }

    void append_result(std::string key, T value) {
        append(std::move(key), outcome<T>::success(std::move(value)));
    }

    void append_exception(std::string key, error_info cause) {
        append(std::move(key), outcome<T>::failure(std::move(cause)));
    }

    void extend(outcomes<T> other) {
        for (auto& e : other.entries_) {
            entries_.push_back(std::move(e));
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] auto begin() const noexcept -> const_iterator {
        return entries_.begin();
    }
    [[nodiscard]] auto end() const noexcept -> const_iterator {
        return entries_.end();
    }
    [[nodiscard]] auto entries() const noexcept -> const std::vector<entry>& {
        return entries_;
    }

    /// Number of successful entries (with or without warning)
    [[nodiscard]] auto result_count() const -> std::size_t {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.item.ok()) ++n;
        }
        return n;
    }

    /// Number of failed entries
    [[nodiscard]] auto exception_count() const -> std::size_t {
        return entries_.size() - result_count();
    }

    [[nodiscard]] auto warning_count() const -> std::size_t {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.item.has_warning()) ++n;
        }
        return n;
    }

    /// Values of all successful entries, in order
    [[nodiscard]] auto results() const -> std::vector<T> {
        std::vector<T> out;
        out.reserve(result_count());
        for (const auto& e : entries_) {
            if (e.item.ok()) out.push_back(e.item.value());
        }
        return out;
    }

    /// Causes of all failed entries, in order
    [[nodiscard]] auto exceptions() const -> std::vector<error_info> {
        std::vector<error_info> out;
        for (const auto& e : entries_) {
            if (e.item.failed()) out.push_back(*e.item.cause());
        }
        return out;
    }

    /// Causes of all warnings attached to successful entries, in order
    [[nodiscard]] auto warnings() const -> std::vector<error_info> {
        std::vector<error_info> out;
        for (const auto& e : entries_) {
            if (e.item.has_warning()) out.push_back(*e.item.cause());
        }
        return out;
    }

    template <typename Pred>
    [[nodiscard]] auto result_predicate_count(Pred&& pred) const
        -> std::size_t {
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.item.ok() && std::invoke(pred, e.item.value())) ++n;
        }
        return n;
    }

    /**
     * @brief First outcome recorded under @p key, or nullptr
     */
    [[nodiscard]] auto find(std::string_view key) const -> const outcome<T>* {
        for (const auto& e : entries_) {
            if (e.key == key) return &e.item;
        }
        return nullptr;
    }

    /**
     * @brief Apply @p f to the value of every successful entry in place
     *
     * Failed entries are left untouched.
     */
    template <typename F>
    void update_results(F&& f) {
        for (auto& e : entries_) {
            if (e.item.ok()) {
                std::invoke(f, e.item.value());
            }
        }
    }

    /**
     * @brief Build a new aggregate by transforming every carried value
     *
     * Failures keep their cause; a partial value is transformed as well.
     */
    template <typename F>
    [[nodiscard]] auto map_results(F&& f) const
        -> outcomes<std::invoke_result_t<F, const T&>> {
        outcomes<std::invoke_result_t<F, const T&>> out;
        for (const auto& e : entries_) {
            out.append(e.key, e.item.map(f));
        }
        return out;
    }

    /**
     * @brief All values, raising the first failure cause encountered
     */
    [[nodiscard]] auto results_or_raise() const -> std::vector<T> {
        std::vector<T> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) {
            out.push_back(e.item.result_or_raise());
        }
        return out;
    }

private:
    std::vector<entry> entries_;
};

} // namespace relvault
