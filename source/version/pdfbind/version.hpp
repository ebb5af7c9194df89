#pragma once

#include <string_view>

std::string_view PdfBindVersion();
std::string_view PdfBindBuildTime();
