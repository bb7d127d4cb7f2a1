#include "wql_error.hpp"

#include <format>

namespace wql
{
//=============================================================================
// Error implementations
//=============================================================================

Error::Error(Code code_, std::string message_)
    : errorCode(code_), text(std::move(message_))
{}

Error Error::fieldMismatch(std::string fieldType, std::string fieldName, std::string reason)
{
    Error e(Code::fieldMismatch,
            std::format("wql: cannot load field \"{}\" into a \"{}\": {}", fieldName, fieldType, reason));

    e.details = FieldMismatch { .fieldType = std::move(fieldType),
                                .fieldName = std::move(fieldName),
                                .reason    = std::move(reason) };
    return e;
}

void Error::append(std::optional<Error>& accumulated, Error next)
{
    if (! accumulated.has_value())
    {
        accumulated.emplace(Code::multiple, std::string());
    }
    else if (! accumulated->is(Code::multiple))
    {
        auto first = std::move(*accumulated);
        accumulated.emplace(Code::multiple, std::string());
        accumulated->nested.emplace_back(std::move(first));
    }

    if (next.is(Code::multiple))
    {
        for (auto& e : next.nested)
            accumulated->nested.emplace_back(std::move(e));
    }
    else
    {
        accumulated->nested.emplace_back(std::move(next));
    }

    accumulated->rebuildMessage();
}

void Error::rebuildMessage()
{
    text = std::format("{} {} occurred:", nested.size(), nested.size() == 1 ? "error" : "errors");

    for (auto const& e : nested)
        text += std::format("\n\t* {}", e.message());
}

char const* toString(Error::Code code) noexcept
{
    switch (code)
    {
    case Error::Code::fieldMismatch:   return "field mismatch";
    case Error::Code::invalidArgument: return "invalid argument";
    case Error::Code::notFound:        return "not found";
    case Error::Code::session:         return "session";
    case Error::Code::timedOut:        return "timed out";
    case Error::Code::alreadyRunning:  return "already running";
    case Error::Code::remote:          return "remote";
    case Error::Code::internal:        return "internal";
    case Error::Code::multiple:        return "multiple";
    }

    return "unknown";
}

std::ostream& operator<<(std::ostream& o, Error const& e)
{
    return o << "[" << toString(e.code()) << "] " << e.message();
}
} // namespace wql
