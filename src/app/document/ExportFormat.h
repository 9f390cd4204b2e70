/**
 * @file ExportFormat.h
 * @brief Interchange formats a document can be handed to an exporter in
 */
#ifndef PARTCAD_APP_DOCUMENT_EXPORTFORMAT_H
#define PARTCAD_APP_DOCUMENT_EXPORTFORMAT_H

#include <QByteArray>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace partcad::core::part {
class Part;
}

namespace partcad::app {

enum class ExportFormat {
    Step,
    Stl,
    Obj,
    Dxf
};

const char* exportFormatName(ExportFormat format);

/**
 * @brief Parse a format name ("STEP", "stl", ...), ignoring case and surrounding blanks
 */
std::optional<ExportFormat> parseExportFormat(const std::string& name);

/**
 * @brief Encoder that turns finished part tessellations into file bytes
 *
 * Implementations live outside the modeling core. Document::exportDocument
 * validates the format before calling exportParts().
 */
class DocumentExporter {
public:
    virtual ~DocumentExporter() = default;

    virtual QByteArray exportParts(const std::string& documentName,
                                   const std::vector<std::shared_ptr<core::part::Part>>& parts,
                                   ExportFormat format) = 0;
};

} // namespace partcad::app

#endif // PARTCAD_APP_DOCUMENT_EXPORTFORMAT_H
