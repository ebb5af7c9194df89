#include <pdfbind/qt_util.hpp>

#include <QString>

QString ToQString(const std::string& string)
{
    return QString::fromStdString(string);
}

QString ToQString(const fs::path& path)
{
#ifdef _WIN32
    return QString::fromStdWString(path.wstring());
#else
    return QString::fromUtf8(path.c_str());
#endif
}
