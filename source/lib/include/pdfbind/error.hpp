#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <pdfbind/util.hpp>

enum class ConversionErrorKind
{
    InvalidArgument,
    NotFound,
    IoFailure,
    LibraryFailure,
};

struct ConversionError
{
    ConversionErrorKind m_Kind;
    std::string m_Message;
};

// Holds the path of the written output on success
using ConversionResult = std::expected<fs::path, ConversionError>;

std::string_view ConversionErrorKindName(ConversionErrorKind kind);

/*
        Thrown below the engine boundary, where it is turned into a ConversionError
        The call stack at construction is kept so the failure can be logged with it
*/
class ConversionException : public std::runtime_error
{
  public:
    ConversionException(ConversionErrorKind kind, const std::string& message);

    ConversionErrorKind Kind() const
    {
        return m_Kind;
    }

    const std::vector<std::string>& StackTrace() const
    {
        return m_StackTrace;
    }

  private:
    ConversionErrorKind m_Kind;
    std::vector<std::string> m_StackTrace;
};

inline std::unexpected<ConversionError> MakeConversionError(ConversionErrorKind kind, std::string message)
{
    return std::unexpected{ ConversionError{ kind, std::move(message) } };
}
