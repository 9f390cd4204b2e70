#include "CadSystem.h"

#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace partcad::app {

Q_LOGGING_CATEGORY(logSystem, "partcad.app.system")

CadSystem::CadSystem(Settings settings)
    : settings_(std::move(settings)) {
    settings_.apply();
    qCInfo(logSystem) << "CadSystem ready"
                      << "version=" << version()
                      << "cylinderSegments=" << settings_.kernel.cylinderSegments;
}

std::unique_ptr<Document> CadSystem::newDocument(const std::string& name) const {
    const bool blank = std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        qCWarning(logSystem) << "newDocument: rejected blank name";
        throw std::invalid_argument("Document name must not be empty");
    }

    qCDebug(logSystem) << "newDocument" << "name=" << QString::fromStdString(name);
    return std::make_unique<Document>(name);
}

} // namespace partcad::app
