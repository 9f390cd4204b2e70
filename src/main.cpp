/**
 * @file main.cpp
 * @brief partcad command line: build a box and a cylinder and combine them
 */
#include "app/CadSystem.h"
#include "app/Logging.h"
#include "core/geometry/GeometryErrors.h"
#include "core/modeling/BooleanOperation.h"
#include "core/part/Part.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>

#include <exception>
#include <memory>
#include <optional>

using namespace partcad;

Q_LOGGING_CATEGORY(logMain, "partcad.main")

namespace {

struct CliOptions {
    double width = 20.0;
    double height = 30.0;
    double depth = 10.0;
    double radius = 5.0;
    QString op = QStringLiteral("difference");
    bool debug = false;
};

std::optional<double> parseDimension(const QCommandLineParser& parser, const QCommandLineOption& option) {
    bool ok = false;
    const double value = parser.value(option).toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

std::optional<CliOptions> parseArguments(const QCoreApplication& app, QString& error) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Combine a box and a centred cylinder"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption widthOption(QStringLiteral("width"), QStringLiteral("Box width (X)."),
                                         QStringLiteral("value"), QStringLiteral("20"));
    const QCommandLineOption heightOption(QStringLiteral("height"), QStringLiteral("Box height (Y)."),
                                          QStringLiteral("value"), QStringLiteral("30"));
    const QCommandLineOption depthOption(QStringLiteral("depth"), QStringLiteral("Box depth (Z)."),
                                         QStringLiteral("value"), QStringLiteral("10"));
    const QCommandLineOption radiusOption(QStringLiteral("radius"), QStringLiteral("Cylinder radius."),
                                          QStringLiteral("value"), QStringLiteral("5"));
    const QCommandLineOption opOption(QStringLiteral("op"),
                                      QStringLiteral("union, difference or intersection."),
                                      QStringLiteral("name"), QStringLiteral("difference"));
    const QCommandLineOption debugOption(QStringLiteral("debug"), QStringLiteral("Enable debug logging."));
    parser.addOptions({widthOption, heightOption, depthOption, radiusOption, opOption, debugOption});

    parser.process(app);

    CliOptions options;
    const auto width = parseDimension(parser, widthOption);
    const auto height = parseDimension(parser, heightOption);
    const auto depth = parseDimension(parser, depthOption);
    const auto radius = parseDimension(parser, radiusOption);
    if (!width || !height || !depth || !radius) {
        error = QStringLiteral("Dimensions must be numbers");
        return std::nullopt;
    }
    options.width = *width;
    options.height = *height;
    options.depth = *depth;
    options.radius = *radius;
    options.op = parser.value(opOption);
    options.debug = parser.isSet(debugOption);
    return options;
}

void printPart(QTextStream& out, const core::part::Part& part) {
    const core::geometry::Extents extents = part.geometry().boundingBox();
    out << QString::fromStdString(part.name()) << ": "
        << "extents=" << extents.width << " x " << extents.height << " x " << extents.depth
        << " volume=" << part.geometry().tessellate().volume()
        << " triangles=" << part.geometry().tessellate().triangleCount() << Qt::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("PartCAD"));
    QCoreApplication::setApplicationName(QStringLiteral("PartCAD"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(app::CadSystem::version()));

    QTextStream out(stdout);
    QTextStream err(stderr);

    QString parseError;
    const std::optional<CliOptions> options = parseArguments(app, parseError);
    if (!options) {
        err << "error: " << parseError << Qt::endl;
        return 1;
    }

    app::LoggingOptions loggingOptions;
    loggingOptions.appName = QStringLiteral("partcad");
    loggingOptions.debug = options->debug;
    if (!app::Logging::initialize(loggingOptions)) {
        qCDebug(logMain) << "Running without a log file";
    }

    int exitCode = 0;
    try {
        app::CadSystem system;
        std::unique_ptr<app::Document> document = system.newDocument("cli");

        auto box = std::make_shared<core::part::Part>(
            core::part::Part::box(options->width, options->height, options->depth));
        auto cylinder = std::make_shared<core::part::Part>(
            core::part::Part::cylinder(options->radius, options->depth * 1.2));

        const core::part::Part result =
            core::modeling::BooleanOperation::combine(*box, *cylinder, options->op.toStdString());

        document->addPart(box);
        document->addPart(cylinder);
        document->addPart(result);

        for (const auto& part : document->parts()) {
            printPart(out, *part);
        }
        qCInfo(logMain) << "done" << "parts=" << document->partCount();
    } catch (const core::geometry::InvalidOperationError& e) {
        qCWarning(logMain) << "invalid operator" << "op=" << options->op;
        err << "error: " << e.what() << Qt::endl;
        exitCode = 1;
    } catch (const core::geometry::BooleanOperationError& e) {
        qCWarning(logMain) << "boolean failed" << "error=" << e.what();
        err << "error: " << e.what() << Qt::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        qCCritical(logMain) << "failed" << "error=" << e.what();
        err << "error: " << e.what() << Qt::endl;
        exitCode = 1;
    }

    app::Logging::shutdown();
    return exitCode;
}
