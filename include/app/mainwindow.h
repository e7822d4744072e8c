#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QStringList>

#include "brush/selectionengine.h"

class MapCanvas;
class BrushTool;
class LayerRegistry;
class QLabel;
class QSlider;
class QComboBox;
class QCheckBox;
class QAction;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    MapCanvas* canvas() const { return m_canvas; }
    LayerRegistry* layers() const { return m_layers; }
    BrushTool* brushTool() const { return m_brush; }

    // Load a vector file; categoryAttribute builds a categorized renderer
    bool openFile(const QString& fileName, const QString& categoryAttribute = QString());

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void openVectorFile();
    void updateCoordinates(const QPointF& pos);
    void updateZoom(double zoom);
    void updateLayerCombo();
    void onLayerComboChanged(int index);
    void onRadiusChanged(int radiusPx);
    void onSelectionFinished(const SelectionResult& result);
    void toggleBrush(bool enabled);
    void clearSelection();
    void saveBrushSettings();

private:
    void setupMenus();
    void setupToolbar();
    void setupStatusBar();

    LayerRegistry* m_layers{nullptr};
    MapCanvas* m_canvas{nullptr};
    BrushTool* m_brush{nullptr};

    // Toolbar
    QAction* m_brushAction{nullptr};
    QSlider* m_radiusSlider{nullptr};
    QLabel* m_radiusLabel{nullptr};
    QComboBox* m_layerCombo{nullptr};
    QCheckBox* m_activeOnlyCheck{nullptr};
    QCheckBox* m_addCheck{nullptr};
    QCheckBox* m_polygonOnlyCheck{nullptr};

    // Status bar
    QLabel* m_coordLabel{nullptr};
    QLabel* m_crsLabel{nullptr};
    QLabel* m_selectedLabel{nullptr};
    QLabel* m_zoomLabel{nullptr};
};

#endif // MAINWINDOW_H
