#include "Document.h"

#include <QLoggingCategory>

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

namespace partcad::app {

Q_LOGGING_CATEGORY(logDocument, "partcad.app.document")

Document::Document(const std::string& name, QObject* parent)
    : QObject(parent), name_(name)
{
}

Document::~Document() = default;

void Document::setName(const std::string& name) {
    if (name_ == name) {
        return;
    }
    name_ = name;
    setModified(true);
}

bool Document::addPart(std::shared_ptr<core::part::Part> part) {
    if (!part) {
        qCWarning(logDocument) << "addPart: rejected null part";
        return false;
    }

    AddPartAction action{std::move(part)};
    apply(action);
    history_.push_back(std::move(action));

    // A new edit invalidates any previously undone future.
    if (!redoStack_.empty()) {
        qCDebug(logDocument) << "addPart: clearing redo stack" << "entries=" << redoStack_.size();
        redoStack_.clear();
    }

    emit historyChanged();
    return true;
}

bool Document::addPart(core::part::Part part) {
    return addPart(std::make_shared<core::part::Part>(std::move(part)));
}

core::part::Part* Document::getPart(const std::string& name) {
    for (const auto& part : parts_) {
        if (part->name() == name) {
            return part.get();
        }
    }
    return nullptr;
}

const core::part::Part* Document::getPart(const std::string& name) const {
    for (const auto& part : parts_) {
        if (part->name() == name) {
            return part.get();
        }
    }
    return nullptr;
}

DocumentAction Document::undo() {
    if (history_.empty()) {
        throw NoHistoryError();
    }

    DocumentAction action = std::move(history_.back());
    history_.pop_back();
    revert(action);
    redoStack_.push_back(action);

    qCInfo(logDocument) << "undo" << "action=" << actionTypeName(actionType(action))
                        << "historySize=" << history_.size()
                        << "redoSize=" << redoStack_.size();
    emit historyChanged();
    return action;
}

DocumentAction Document::redo() {
    if (redoStack_.empty()) {
        throw NoRedoError();
    }

    DocumentAction action = std::move(redoStack_.back());
    redoStack_.pop_back();
    apply(action);
    history_.push_back(action);

    qCInfo(logDocument) << "redo" << "action=" << actionTypeName(actionType(action))
                        << "historySize=" << history_.size()
                        << "redoSize=" << redoStack_.size();
    emit historyChanged();
    return action;
}

QByteArray Document::exportDocument(const std::string& format, DocumentExporter& exporter) const {
    const std::optional<ExportFormat> parsed = parseExportFormat(format);
    if (!parsed) {
        qCWarning(logDocument) << "exportDocument: unsupported format"
                               << "format=" << QString::fromStdString(format);
        throw UnsupportedFormatError(format);
    }

    qCInfo(logDocument) << "exportDocument"
                        << "format=" << exportFormatName(*parsed)
                        << "parts=" << parts_.size();
    return exporter.exportParts(name_, parts_, *parsed);
}

void Document::setModified(bool modified) {
    if (modified_ != modified) {
        modified_ = modified;
        emit modifiedChanged(modified);
    }
}

void Document::apply(const DocumentAction& action) {
    const auto part = actionPart(action);
    switch (actionType(action)) {
        case ActionType::Add:
            parts_.push_back(part);
            setModified(true);
            emit partAdded(QString::fromStdString(part->name()));
            break;
    }
}

void Document::revert(const DocumentAction& action) {
    const auto part = actionPart(action);
    switch (actionType(action)) {
        case ActionType::Add: {
            // Remove this exact instance; other parts may share its name.
            auto it = std::find(parts_.rbegin(), parts_.rend(), part);
            if (it == parts_.rend()) {
                qCWarning(logDocument) << "undo: added part no longer in document"
                                       << "part=" << QString::fromStdString(part->name());
                break;
            }
            parts_.erase(std::next(it).base());
            setModified(true);
            emit partRemoved(QString::fromStdString(part->name()));
            break;
        }
    }
}

} // namespace partcad::app
