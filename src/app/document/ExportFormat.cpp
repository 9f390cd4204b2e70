/**
 * @file ExportFormat.cpp
 */
#include "ExportFormat.h"

#include <QString>

namespace partcad::app {

const char* exportFormatName(ExportFormat format) {
    switch (format) {
        case ExportFormat::Step: return "STEP";
        case ExportFormat::Stl: return "STL";
        case ExportFormat::Obj: return "OBJ";
        case ExportFormat::Dxf: return "DXF";
        default: return "Unknown";
    }
}

std::optional<ExportFormat> parseExportFormat(const std::string& name) {
    const QString normalized = QString::fromStdString(name).trimmed().toUpper();
    if (normalized == "STEP") return ExportFormat::Step;
    if (normalized == "STL") return ExportFormat::Stl;
    if (normalized == "OBJ") return ExportFormat::Obj;
    if (normalized == "DXF") return ExportFormat::Dxf;
    return std::nullopt;
}

} // namespace partcad::app
