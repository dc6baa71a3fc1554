#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <vector>

namespace rowpool::errctx {

// Error conditions that a caller may choose to downgrade. Values start at 1 so that no group
// compares equal to an empty error code.
enum class ErrorGroup {
    Truncate = 1,
    Overflow = 2
};

constexpr std::size_t kErrorGroupCount = 2U;

enum class ErrorLevel : std::uint8_t {
    Error,
    Warn,
    Ignore
};

using LevelMap = std::array<ErrorLevel, kErrorGroupCount>;

const std::error_category& error_group_category() noexcept;
std::error_condition make_error_condition(ErrorGroup group) noexcept;

class WarningHandler {
public:
    virtual ~WarningHandler() = default;

    virtual void append_warning(std::error_code warning) = 0;
};

class WarningCollector final : public WarningHandler {
public:
    void append_warning(std::error_code warning) override;

    [[nodiscard]] const std::vector<std::error_code>& warnings() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    void clear() noexcept;

private:
    std::vector<std::error_code> warnings_{};
};

class ErrorContext final {
public:
    // Strict context: every error is returned to the caller.
    ErrorContext() noexcept;
    ErrorContext(LevelMap levels, WarningHandler* warnings) noexcept;

    // Applies the configured level for the group `error` belongs to. Returns an empty code when
    // the error is suppressed (optionally recording it as a warning) and `error` otherwise.
    [[nodiscard]] std::error_code handle_error(std::error_code error) const;

    [[nodiscard]] ErrorContext with_level(ErrorGroup group, ErrorLevel level) const noexcept;
    [[nodiscard]] ErrorLevel level_for(ErrorGroup group) const noexcept;
    [[nodiscard]] WarningHandler* warning_handler() const noexcept;

private:
    LevelMap levels_{};
    WarningHandler* warnings_ = nullptr;
};

}  // namespace rowpool::errctx

namespace std {

template <>
struct is_error_condition_enum<rowpool::errctx::ErrorGroup> : true_type {
};

}  // namespace std
