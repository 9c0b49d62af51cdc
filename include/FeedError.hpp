#pragma once
#include <stdexcept>
#include <string>

// Fatal condition of one refresh attempt.
class FeedError : public std::runtime_error
{
public:
    enum class Kind
    {
        Fetch,
        Timeout,
        Archive,
        MissingTable,
        MissingColumn,
        UnresolvedStation
    };

    FeedError(Kind kind, std::string const& message)
        : std::runtime_error(message)
        , errorKind(kind)
    {
    }

    [[nodiscard]] Kind kind() const noexcept { return errorKind; }

private:
    Kind errorKind;
};
