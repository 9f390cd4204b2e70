/**
 * @file CadSystem.h
 * @brief Application entry object: kernel settings plus document factory
 */
#ifndef PARTCAD_APP_CADSYSTEM_H
#define PARTCAD_APP_CADSYSTEM_H

#include "Settings.h"
#include "document/Document.h"

#include <memory>
#include <string>

namespace partcad::app {

class CadSystem {
public:
    /**
     * @brief Installs @p settings as the kernel defaults
     */
    explicit CadSystem(Settings settings = Settings::load());

    static const char* version() { return "1.0.0"; }

    /**
     * @brief Create an empty document
     * @throws std::invalid_argument if @p name is empty or only whitespace
     */
    std::unique_ptr<Document> newDocument(const std::string& name) const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
};

} // namespace partcad::app

#endif // PARTCAD_APP_CADSYSTEM_H
