/**
 * @file Settings.cpp
 */
#include "Settings.h"

#include "Environment.h"

#include <QLoggingCategory>
#include <QSettings>
#include <QString>

namespace partcad::app {

Q_LOGGING_CATEGORY(logSettings, "partcad.app.settings")

namespace {

namespace mesh = core::mesh;

const QString kOrganization = QStringLiteral("PartCAD");
const QString kApplication = QStringLiteral("PartCAD");

template <typename T, typename Parse>
void applyOverride(const char* variable, T& target, Parse parse) {
    const auto raw = env::value(variable);
    if (!raw) {
        return;
    }
    bool ok = false;
    const T value = parse(*raw, &ok);
    if (!ok) {
        qCWarning(logSettings) << "ignoring unparsable override" << variable << "=" << *raw;
        return;
    }
    target = value;
}

void sanitize(mesh::TessellationSettings& kernel) {
    const mesh::TessellationSettings fallback;

    if (kernel.cylinderSegments < mesh::defaults::MIN_CYLINDER_SEGMENTS) {
        qCWarning(logSettings) << "cylinderSegments out of range, using default"
                               << "value=" << kernel.cylinderSegments;
        kernel.cylinderSegments = fallback.cylinderSegments;
    } else if (const int rest = kernel.cylinderSegments % mesh::defaults::CYLINDER_SEGMENT_STEP; rest != 0) {
        const int rounded = kernel.cylinderSegments + mesh::defaults::CYLINDER_SEGMENT_STEP - rest;
        qCWarning(logSettings) << "cylinderSegments not a multiple of 4, rounding up"
                               << "value=" << kernel.cylinderSegments << "rounded=" << rounded;
        kernel.cylinderSegments = rounded;
    }
    if (!(kernel.linearDeflection > 0.0)) {
        qCWarning(logSettings) << "linearDeflection must be positive, using default";
        kernel.linearDeflection = fallback.linearDeflection;
    }
    if (!(kernel.angularDeflection > 0.0)) {
        qCWarning(logSettings) << "angularDeflection must be positive, using default";
        kernel.angularDeflection = fallback.angularDeflection;
    }
    if (!(kernel.booleanFuzzyValue >= 0.0)) {
        qCWarning(logSettings) << "booleanFuzzyValue must not be negative, using default";
        kernel.booleanFuzzyValue = fallback.booleanFuzzyValue;
    }
    if (!(kernel.sewingTolerance > 0.0)) {
        qCWarning(logSettings) << "sewingTolerance must be positive, using default";
        kernel.sewingTolerance = fallback.sewingTolerance;
    }
}

} // namespace

Settings Settings::load() {
    Settings result;
    mesh::TessellationSettings& kernel = result.kernel;

    QSettings settings(kOrganization, kApplication);
    settings.beginGroup(QStringLiteral("kernel"));
    kernel.cylinderSegments = settings.value("cylinderSegments", kernel.cylinderSegments).toInt();
    kernel.linearDeflection = settings.value("linearDeflection", kernel.linearDeflection).toDouble();
    kernel.angularDeflection = settings.value("angularDeflection", kernel.angularDeflection).toDouble();
    kernel.booleanFuzzyValue = settings.value("booleanFuzzyValue", kernel.booleanFuzzyValue).toDouble();
    kernel.sewingTolerance = settings.value("sewingTolerance", kernel.sewingTolerance).toDouble();
    kernel.unifyFaces = settings.value("unifyFaces", kernel.unifyFaces).toBool();
    settings.endGroup();

    applyOverride("PARTCAD_CYLINDER_SEGMENTS", kernel.cylinderSegments,
                  [](const QString& raw, bool* ok) { return raw.toInt(ok); });
    applyOverride("PARTCAD_BOOLEAN_FUZZY", kernel.booleanFuzzyValue,
                  [](const QString& raw, bool* ok) { return raw.toDouble(ok); });
    if (const auto unify = env::flag("PARTCAD_UNIFY_FACES")) {
        kernel.unifyFaces = *unify;
    }

    sanitize(kernel);

    qCInfo(logSettings).noquote() << "Settings loaded"
                                  << "cylinderSegments=" << kernel.cylinderSegments
                                  << "linearDeflection=" << kernel.linearDeflection
                                  << "angularDeflection=" << kernel.angularDeflection
                                  << "booleanFuzzyValue=" << kernel.booleanFuzzyValue
                                  << "sewingTolerance=" << kernel.sewingTolerance
                                  << "unifyFaces=" << kernel.unifyFaces;
    return result;
}

void Settings::save() const {
    QSettings settings(kOrganization, kApplication);
    settings.beginGroup(QStringLiteral("kernel"));
    settings.setValue("cylinderSegments", kernel.cylinderSegments);
    settings.setValue("linearDeflection", kernel.linearDeflection);
    settings.setValue("angularDeflection", kernel.angularDeflection);
    settings.setValue("booleanFuzzyValue", kernel.booleanFuzzyValue);
    settings.setValue("sewingTolerance", kernel.sewingTolerance);
    settings.setValue("unifyFaces", kernel.unifyFaces);
    settings.endGroup();
    settings.sync();
}

void Settings::apply() const {
    core::mesh::TessellationSettings::setCurrent(kernel);
}

} // namespace partcad::app
