#include <pdfbind/error.hpp>

#include <magic_enum/magic_enum.hpp>

#include <pdfbind/util/log.hpp>

std::string_view ConversionErrorKindName(ConversionErrorKind kind)
{
    return magic_enum::enum_name(kind);
}

ConversionException::ConversionException(ConversionErrorKind kind, const std::string& message)
    : std::runtime_error{ message }
    , m_Kind{ kind }
    , m_StackTrace{ Log::CaptureStacktrace(1) }
{
}
