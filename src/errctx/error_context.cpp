#include "rowpool/errctx/error_context.hpp"

#include <string>

namespace rowpool::errctx {

namespace {

class ErrorGroupCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "rowpool.errctx";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ErrorGroup>(condition)) {
        case ErrorGroup::Truncate:
            return "data truncated";
        case ErrorGroup::Overflow:
            return "value out of range";
        default:
            return "unknown error group";
        }
    }
};

const ErrorGroupCategory kCategory{};

constexpr std::array<ErrorGroup, kErrorGroupCount> kAllGroups{ErrorGroup::Truncate, ErrorGroup::Overflow};

constexpr std::size_t group_index(ErrorGroup group) noexcept
{
    return static_cast<std::size_t>(group) - 1U;
}

}  // namespace

const std::error_category& error_group_category() noexcept
{
    return kCategory;
}

std::error_condition make_error_condition(ErrorGroup group) noexcept
{
    return {static_cast<int>(group), error_group_category()};
}

void WarningCollector::append_warning(std::error_code warning)
{
    warnings_.push_back(warning);
}

const std::vector<std::error_code>& WarningCollector::warnings() const noexcept
{
    return warnings_;
}

std::size_t WarningCollector::size() const noexcept
{
    return warnings_.size();
}

void WarningCollector::clear() noexcept
{
    warnings_.clear();
}

ErrorContext::ErrorContext() noexcept
{
    levels_.fill(ErrorLevel::Error);
}

ErrorContext::ErrorContext(LevelMap levels, WarningHandler* warnings) noexcept
    : levels_{levels}
    , warnings_{warnings}
{}

std::error_code ErrorContext::handle_error(std::error_code error) const
{
    if (!error) {
        return {};
    }

    for (const auto group : kAllGroups) {
        if (error != group) {
            continue;
        }
        switch (level_for(group)) {
        case ErrorLevel::Warn:
            if (warnings_ != nullptr) {
                warnings_->append_warning(error);
            }
            return {};
        case ErrorLevel::Ignore:
            return {};
        case ErrorLevel::Error:
        default:
            return error;
        }
    }

    return error;
}

ErrorContext ErrorContext::with_level(ErrorGroup group, ErrorLevel level) const noexcept
{
    auto copy = *this;
    copy.levels_[group_index(group)] = level;
    return copy;
}

ErrorLevel ErrorContext::level_for(ErrorGroup group) const noexcept
{
    const auto index = group_index(group);
    if (index >= levels_.size()) {
        return ErrorLevel::Error;
    }
    return levels_[index];
}

WarningHandler* ErrorContext::warning_handler() const noexcept
{
    return warnings_;
}

}  // namespace rowpool::errctx
