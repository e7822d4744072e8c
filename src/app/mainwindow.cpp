#include "app/mainwindow.h"
#include "brush/brushtool.h"
#include "brushsettings.h"
#include "canvas/mapcanvas.h"
#include "gdal/gdalvectorloader.h"
#include "layers/layerregistry.h"
#include "layers/vectorlayer.h"

#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QSlider>
#include <QStatusBar>
#include <QToolBar>

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle("BrushSelect");
    resize(1200, 800);

    m_layers = new LayerRegistry(this);

    m_canvas = new MapCanvas(this);
    m_canvas->setLayerRegistry(m_layers);
    setCentralWidget(m_canvas);

    m_brush = new BrushTool(m_canvas, m_layers, this);
    m_brush->setConfig(BrushSettings::load());

    setupMenus();
    setupToolbar();
    setupStatusBar();

    connect(m_canvas, &MapCanvas::mouseWorldPosition, this, &MainWindow::updateCoordinates);
    connect(m_canvas, &MapCanvas::zoomChanged, this, &MainWindow::updateZoom);
    connect(m_canvas, &MapCanvas::statusMessage, statusBar(), &QStatusBar::showMessage);
    connect(m_brush, &BrushTool::radiusChanged, this, &MainWindow::onRadiusChanged);
    connect(m_brush, &BrushTool::selectionFinished, this, &MainWindow::onSelectionFinished);
    connect(m_layers, &LayerRegistry::layersChanged, this, &MainWindow::updateLayerCombo);
    connect(m_layers, &LayerRegistry::currentLayerChanged, this, &MainWindow::updateLayerCombo);

    m_brushAction->setChecked(true);
}

MainWindow::~MainWindow()
{
    m_canvas->unsetMapTool();
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu("&File");
    QAction* openAction = fileMenu->addAction("&Open Vector File...", this, &MainWindow::openVectorFile);
    openAction->setShortcut(QKeySequence::Open);
    fileMenu->addSeparator();
    QAction* exitAction = fileMenu->addAction("E&xit", this, &QWidget::close);
    exitAction->setShortcut(QKeySequence::Quit);

    QMenu* viewMenu = menuBar()->addMenu("&View");
    QAction* fitAction = viewMenu->addAction("&Fit to Window", m_canvas, &MapCanvas::fitToWindow);
    fitAction->setShortcut(QKeySequence("F"));
    QAction* zoomInAction = viewMenu->addAction("Zoom &In", m_canvas, &MapCanvas::zoomIn);
    zoomInAction->setShortcut(QKeySequence::ZoomIn);
    QAction* zoomOutAction = viewMenu->addAction("Zoom &Out", m_canvas, &MapCanvas::zoomOut);
    zoomOutAction->setShortcut(QKeySequence::ZoomOut);

    QMenu* selectMenu = menuBar()->addMenu("&Selection");
    m_brushAction = selectMenu->addAction("&Brush Select");
    m_brushAction->setCheckable(true);
    m_brushAction->setShortcut(QKeySequence("B"));
    connect(m_brushAction, &QAction::toggled, this, &MainWindow::toggleBrush);
    QAction* clearAction = selectMenu->addAction("&Clear Selection", this, &MainWindow::clearSelection);
    clearAction->setShortcut(QKeySequence("Esc"));
}

void MainWindow::setupToolbar()
{
    const BrushConfig& config = m_brush->config();

    QToolBar* toolbar = addToolBar("Brush");
    toolbar->setMovable(false);
    toolbar->addAction(m_brushAction);
    toolbar->addSeparator();

    toolbar->addWidget(new QLabel(" Radius: "));
    m_radiusSlider = new QSlider(Qt::Horizontal);
    m_radiusSlider->setRange(BrushConfig::MinRadiusPx, BrushConfig::MaxRadiusPx);
    m_radiusSlider->setValue(config.radiusPx);
    m_radiusSlider->setFixedWidth(160);
    m_radiusSlider->setToolTip("Brush radius in screen pixels (Shift+Wheel on the map)");
    toolbar->addWidget(m_radiusSlider);
    m_radiusLabel = new QLabel(QString("%1 px").arg(config.radiusPx));
    m_radiusLabel->setMinimumWidth(50);
    toolbar->addWidget(m_radiusLabel);
    connect(m_radiusSlider, &QSlider::valueChanged, m_brush, &BrushTool::setRadiusPx);

    toolbar->addSeparator();
    toolbar->addWidget(new QLabel(" Layer: "));
    m_layerCombo = new QComboBox();
    m_layerCombo->setMinimumWidth(150);
    toolbar->addWidget(m_layerCombo);
    connect(m_layerCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onLayerComboChanged);

    toolbar->addSeparator();
    m_activeOnlyCheck = new QCheckBox("Active layer only");
    m_activeOnlyCheck->setChecked(config.activeLayerOnly);
    toolbar->addWidget(m_activeOnlyCheck);
    connect(m_activeOnlyCheck, &QCheckBox::toggled, m_brush, &BrushTool::setActiveLayerOnly);
    connect(m_activeOnlyCheck, &QCheckBox::toggled, this, &MainWindow::saveBrushSettings);

    m_addCheck = new QCheckBox("Add to selection");
    m_addCheck->setChecked(config.selectBehavior == SelectBehavior::AddToSelection);
    m_addCheck->setToolTip("Hold Shift while painting to invert");
    toolbar->addWidget(m_addCheck);
    connect(m_addCheck, &QCheckBox::toggled, m_brush, &BrushTool::setAddToSelection);
    connect(m_addCheck, &QCheckBox::toggled, this, &MainWindow::saveBrushSettings);

    m_polygonOnlyCheck = new QCheckBox("Polygons only");
    m_polygonOnlyCheck->setChecked(config.geometryFilter == GeometryType::Polygon);
    toolbar->addWidget(m_polygonOnlyCheck);
    connect(m_polygonOnlyCheck, &QCheckBox::toggled, this, [this](bool checked) {
        m_brush->setGeometryFilter(checked ? GeometryType::Polygon : GeometryType::Unknown);
        saveBrushSettings();
    });
}

void MainWindow::setupStatusBar()
{
    m_coordLabel = new QLabel("X: 0.000  Y: 0.000");
    m_coordLabel->setMinimumWidth(200);
    statusBar()->addWidget(m_coordLabel);

    m_crsLabel = new QLabel("");
    m_crsLabel->setMinimumWidth(100);
    statusBar()->addWidget(m_crsLabel);

    m_selectedLabel = new QLabel("Selected: 0");
    m_selectedLabel->setMinimumWidth(100);
    statusBar()->addPermanentWidget(m_selectedLabel);

    m_zoomLabel = new QLabel("Zoom: 100%");
    m_zoomLabel->setMinimumWidth(100);
    statusBar()->addPermanentWidget(m_zoomLabel);
}

bool MainWindow::openFile(const QString& fileName, const QString& categoryAttribute)
{
    QApplication::setOverrideCursor(Qt::WaitCursor);

    GdalVectorLoader loader;
    loader.setCategoryAttribute(categoryAttribute);
    const bool success = loader.load(fileName, *m_layers);

    QApplication::restoreOverrideCursor();

    if (!success) {
        QMessageBox::warning(this, "Open Vector File",
            QString("Failed to load vector file:\n%1\n\nError: %2")
                .arg(fileName)
                .arg(loader.lastError()));
        return false;
    }

    setWindowTitle(QString("BrushSelect - %1").arg(QFileInfo(fileName).fileName()));

    const VectorLayer* first = m_layers->layer(loader.loadedLayers().first());
    m_crsLabel->setText((first && !first->crs().isEmpty()) ? first->crs() : QString("Unknown CRS"));

    m_canvas->fitToWindow();
    statusBar()->showMessage(QString("Loaded: %1 features in %2 layer(s)")
        .arg(loader.featuresLoaded())
        .arg(loader.loadedLayers().size()), 5000);
    return true;
}

void MainWindow::openVectorFile()
{
    QString fileName = QFileDialog::getOpenFileName(this,
        "Open Vector File", QString(),
        GdalVectorLoader::fileFilter());

    if (fileName.isEmpty()) return;
    openFile(fileName);
}

void MainWindow::updateCoordinates(const QPointF& pos)
{
    m_coordLabel->setText(QString("X: %1  Y: %2")
        .arg(pos.x(), 0, 'f', 3)
        .arg(pos.y(), 0, 'f', 3));
}

void MainWindow::updateZoom(double zoom)
{
    m_zoomLabel->setText(QString("Zoom: %1%").arg(zoom * 100.0, 0, 'f', zoom < 0.1 ? 3 : 0));
}

void MainWindow::updateLayerCombo()
{
    QSignalBlocker blocker(m_layerCombo);
    m_layerCombo->clear();
    for (const VectorLayer* layer : m_layers->layers()) {
        m_layerCombo->addItem(QString("%1 [%2]").arg(layer->name(), geometryTypeName(layer->geometryType())),
                              layer->name());
    }
    m_layerCombo->setCurrentIndex(m_layerCombo->findData(m_layers->currentLayer()));
}

void MainWindow::onLayerComboChanged(int index)
{
    m_layers->setCurrentLayer(index < 0 ? QString() : m_layerCombo->itemData(index).toString());
}

void MainWindow::onRadiusChanged(int radiusPx)
{
    // Shift+wheel resizes the brush on the canvas; keep the slider in step
    QSignalBlocker blocker(m_radiusSlider);
    m_radiusSlider->setValue(radiusPx);
    m_radiusLabel->setText(QString("%1 px").arg(radiusPx));
    BrushSettings::setRadiusPx(radiusPx);
}

void MainWindow::saveBrushSettings()
{
    BrushSettings::save(m_brush->config());
}

void MainWindow::onSelectionFinished(const SelectionResult& result)
{
    Q_UNUSED(result);
    int selected = 0;
    for (const VectorLayer* layer : m_layers->layers()) {
        selected += layer->selectedFeatureCount();
    }
    m_selectedLabel->setText(QString("Selected: %1").arg(selected));
}

void MainWindow::toggleBrush(bool enabled)
{
    if (enabled) {
        m_canvas->setMapTool(m_brush);
        statusBar()->showMessage("Brush select - drag to select, Shift inverts add/replace, Shift+Wheel resizes", 5000);
    } else {
        m_canvas->unsetMapTool();
    }
}

void MainWindow::clearSelection()
{
    for (VectorLayer* layer : m_layers->layers()) {
        layer->removeSelection();
    }
    m_selectedLabel->setText("Selected: 0");
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    saveBrushSettings();
    event->accept();
}
