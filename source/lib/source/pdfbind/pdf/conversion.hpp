#pragma once

#include <filesystem>
#include <ios>
#include <string>
#include <string_view>
#include <vector>

#include <pdfbind/error.hpp>
#include <pdfbind/util.hpp>

#include <pdfbind/pdf/backend.hpp>

#include <pdfbind/util/log.hpp>

// Logs a failed result with stack_trace, or the current call stack if it is empty
// Successful results pass through untouched
ConversionResult LogFailure(std::string_view operation,
                            ConversionResult result,
                            std::vector<std::string> stack_trace = {});

/*
        Runs a conversion and turns every exception it throws into a ConversionError,
        callers of the engines never see an exception
*/
template<class FunT>
ConversionResult RunConversion(std::string_view operation, FunT&& fun)
{
    try
    {
        return LogFailure(operation, fun());
    }
    catch (const ConversionException& e)
    {
        return LogFailure(operation, MakeConversionError(e.Kind(), e.what()), e.StackTrace());
    }
    catch (const fs::filesystem_error& e)
    {
        return LogFailure(operation, MakeConversionError(ConversionErrorKind::IoFailure, e.what()));
    }
    catch (const std::ios_base::failure& e)
    {
        return LogFailure(operation, MakeConversionError(ConversionErrorKind::IoFailure, e.what()));
    }
    catch (const std::exception& e)
    {
        return LogFailure(operation, MakeConversionError(ConversionErrorKind::LibraryFailure, e.what()));
    }
}

// Writes next to output_path first and moves the result into place, output_path is never left half-written
fs::path WriteAtomically(PdfDocument& document, const fs::path& output_path);
