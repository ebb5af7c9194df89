#include <pdfbind/pdf/conversion.hpp>

#include <system_error>
#include <utility>

#include <pdfbind/util/at_scope_exit.hpp>

ConversionResult LogFailure(std::string_view operation,
                            ConversionResult result,
                            std::vector<std::string> stack_trace)
{
    if (!result.has_value())
    {
        if (stack_trace.empty())
        {
            stack_trace = Log::CaptureStacktrace(1);
        }

        const auto& error{ result.error() };
        LogErrorWithStacktrace(std::move(stack_trace),
                               "{} failed ({}): {}",
                               operation,
                               ConversionErrorKindName(error.m_Kind),
                               error.m_Message);
    }
    return result;
}

fs::path WriteAtomically(PdfDocument& document, const fs::path& output_path)
{
    const auto temp_path{ TemporaryOutputPath(output_path) };
    AtScopeExit remove_temp_file{
        [&temp_path]()
        {
            std::error_code error;
            if (fs::remove(temp_path, error) && !error)
            {
                LogDebug("Removed partial output {}", temp_path.string());
            }
            else if (error)
            {
                LogWarning("Could not remove partial output {}: {}", temp_path.string(), error.message());
            }
        }
    };

    document.Write(temp_path);
    fs::rename(temp_path, output_path);
    remove_temp_file.Dismiss();
    return output_path;
}
