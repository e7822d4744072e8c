#include <QApplication>
#include <QCommandLineParser>
#include "app/mainwindow.h"
#include "gdal/gdalvectorloader.h"
#include "geometry/geosbridge.h"
#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("BrushSelect");
    app.setOrganizationName("Geomatics");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Paint over a map to select vector features");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption categorizeOption("categorize",
        "Categorize loaded layers by the values of <field>.", "field");
    QCommandLineOption hideOption("hide-category",
        "Hide the category <value> (repeatable). Hidden features are not selectable.", "value");
    parser.addOption(categorizeOption);
    parser.addOption(hideOption);
    parser.addPositionalArgument("files", "Vector files to open.", "[files...]");
    parser.process(app);

    GdalVectorLoader::initialize();
    GeosBridge::initialize();

    int result = 0;
    {
        MainWindow window;
        const QString categoryField = parser.value(categorizeOption);
        for (const QString& file : parser.positionalArguments()) {
            window.openFile(file, categoryField);
        }

        const QStringList hidden = parser.values(hideOption);
        for (VectorLayer* layer : window.layers()->layers()) {
            for (const QString& value : hidden) {
                layer->setCategoryVisible(value, false);
            }
        }

        window.show();
        result = app.exec();
    }

    GeosBridge::cleanup();
    return result;
}
