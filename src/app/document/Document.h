/**
 * @file Document.h
 * @brief Document model holding parts and their edit history
 */

#ifndef PARTCAD_APP_DOCUMENT_DOCUMENT_H
#define PARTCAD_APP_DOCUMENT_DOCUMENT_H

#include <QByteArray>
#include <QObject>
#include <QString>
#include <memory>
#include <string>
#include <vector>

#include "DocumentAction.h"
#include "DocumentErrors.h"
#include "ExportFormat.h"
#include "../../core/part/Part.h"

namespace partcad::app {

/**
 * @brief Ordered collection of parts with an undo/redo action log
 *
 * Every recorded action lives in exactly one of history() or redoStack().
 * undo() moves the newest history entry to the redo stack and reverses it;
 * redo() moves it back and reapplies it. A new edit clears the redo stack.
 *
 * Emits signals when content changes so views and exporters can follow.
 * Not thread-safe.
 */
class Document : public QObject {
    Q_OBJECT

public:
    explicit Document(const std::string& name, QObject* parent = nullptr);
    ~Document() override;

    const std::string& name() const { return name_; }
    void setName(const std::string& name);

    // Part management
    /**
     * @brief Append a part and record an Add action
     * @return false (and nothing recorded) if @p part is null
     */
    bool addPart(std::shared_ptr<core::part::Part> part);
    bool addPart(core::part::Part part);

    /**
     * @brief First part whose display name is @p name
     * @return Pointer to part or nullptr if not found
     */
    core::part::Part* getPart(const std::string& name);
    const core::part::Part* getPart(const std::string& name) const;

    const std::vector<std::shared_ptr<core::part::Part>>& parts() const { return parts_; }
    size_t partCount() const { return parts_.size(); }

    // History
    /**
     * @brief Reverse the most recent action
     * @return The undone action
     * @throws NoHistoryError if there is nothing to undo
     */
    DocumentAction undo();

    /**
     * @brief Reapply the most recently undone action
     * @return The redone action
     * @throws NoRedoError if there is nothing to redo
     */
    DocumentAction redo();

    bool canUndo() const { return !history_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    const std::vector<DocumentAction>& history() const { return history_; }
    const std::vector<DocumentAction>& redoStack() const { return redoStack_; }

    // Export
    /**
     * @brief Validate @p format and hand the parts to @p exporter
     * @throws UnsupportedFormatError if @p format is not STEP, STL, OBJ or DXF
     */
    QByteArray exportDocument(const std::string& format, DocumentExporter& exporter) const;

    // Document state
    bool isModified() const { return modified_; }
    void setModified(bool modified);

signals:
    void partAdded(const QString& name);
    void partRemoved(const QString& name);
    void historyChanged();
    void modifiedChanged(bool modified);

private:
    void apply(const DocumentAction& action);
    void revert(const DocumentAction& action);

    std::string name_;
    std::vector<std::shared_ptr<core::part::Part>> parts_;
    std::vector<DocumentAction> history_;
    std::vector<DocumentAction> redoStack_;
    bool modified_ = false;
};

} // namespace partcad::app

#endif // PARTCAD_APP_DOCUMENT_DOCUMENT_H
