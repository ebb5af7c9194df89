#pragma once

#include <string>

#include <pdfbind/util.hpp>

class QString;

QString ToQString(const std::string& string);
QString ToQString(const fs::path& path);
