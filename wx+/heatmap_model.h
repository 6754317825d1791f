// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_MODEL_H_7712093845610293847
#define HEATMAP_MODEL_H_7712093845610293847

#include <functional>
#include <memory>
#include <optional>
#include "heatmap_hit_test.h"
#include "heatmap_render.h"


namespace heat
{
/*  state of one heatmap widget: data snapshot, configuration, adapters and the geometry shared by paint and hit-test

    - every data binding or setter invalidates the geometry and triggers the change callback (=> re-measure, redraw)
    - adapters run inline during paint() and click(): changes requested from within an adapter are deferred
      until the outermost pass has returned, so a pass observes one consistent state                         */
class HeatmapModel
{
public:
    explicit HeatmapModel(const HeatmapAttributes& attr = HeatmapAttributes());

    //----------------------- data -----------------------
    //headers: replace headers and column count; std::nullopt: keep previous
    template <class T, class LabelFun, class DetailsFun, class IndexFun = std::nullptr_t>
    void setData(const std::vector<T>& items, LabelFun labelOf, DetailsFun detailsOf, IndexFun indexOf = nullptr,
                 std::optional<std::vector<std::wstring>> headers = std::nullopt) //throw X
    {
        setRows(bindRows(items, labelOf, detailsOf, indexOf), std::move(headers)); //extractors run now: previous snapshot is kept on exception
    }

    void setRows(std::vector<RowData> rows, std::optional<std::vector<std::wstring>> headers = std::nullopt);

    std::shared_ptr<const HeatmapSnapshot> getSnapshot() const { return snapshot_; }

    size_t getRowCount   () const { return snapshot_->rows   .size(); }
    size_t getColumnCount() const { return snapshot_->headers.size(); }
    const std::vector<std::wstring>& getColumnHeaders() const { return snapshot_->headers; }
    const CellValue* getCellValue(size_t row, size_t col) const; //nullptr: no data

    //----------------------- adapters -----------------------
    //empty function: default behavior
    void setColorFunction   (const CellColorFunction& getCellColor);
    void setCellDrawFunction(const CellDrawFunction&  drawCell);
    void setClickListener   (const CellClickFunction& onCellClick);
    bool hasClickListener() const { return static_cast<bool>(onCellClick_); }

    //----------------------- configuration -----------------------
    const HeatmapAttributes& getAttributes() const { return attr_; }
    void setAttributes(const HeatmapAttributes& attr);

    void setActiveColors  (const CellColors& colors);
    void setInactiveColors(const CellColors& colors);
    void setCellGap         (double gap);
    void setCellCornerRadius(double radius);
    void setLabelPosition (LabelPos pos);
    void setLabelGridGap  (double gap);
    void setLabelTextColor(const wxColor& col);
    void setLabelTextSize (double size);
    void setHeaderPosition (HeaderPos pos);
    void setHeaderGridGap  (double gap);
    void setHeaderTextColor(const wxColor& col);
    void setHeaderTextSize (double size);

    const Padding& getPadding() const { return padding_; }
    void setPadding(const Padding& padding);

    //----------------------- layout, paint, interaction -----------------------
    const LayoutGeometry& getGeometry(double availableWidth, const TextMetrics& metrics) const; //cached until next change
    void invalidateGeometry(); //text metrics changed, e.g. new font

    void paint(HeatmapCanvas& canvas, double availableWidth); //throw X: adapter exceptions

    std::optional<CellHit> hitTest(const wxPoint2DDouble& pos, double availableWidth, const TextMetrics& metrics) const;

    //return "true" if a cell was hit and the click listener was called
    bool click(const wxPoint2DDouble& pos, double availableWidth, const TextMetrics& metrics); //throw X: listener exceptions

    void setChangeCallback(const std::function<void()>& onChange) { onChange_ = onChange; } //owner: schedule re-measure and redraw

private:
    HeatmapModel           (const HeatmapModel&) = delete;
    HeatmapModel& operator=(const HeatmapModel&) = delete;

    template <class Function>
    void applyChange(Function change);
    void flushDeferredChanges();

    std::shared_ptr<const HeatmapSnapshot> snapshot_;
    HeatmapAttributes attr_;
    Padding padding_;

    CellColorFunction getCellColor_;
    CellDrawFunction  drawCell_;
    CellClickFunction onCellClick_;

    struct CachedGeometry
    {
        double availableWidth = 0;
        LayoutGeometry geo;
    };
    mutable std::optional<CachedGeometry> geoCache_;

    int callbackDepth_ = 0; //> 0 while an adapter may be running
    std::vector<std::function<void()>> deferredChanges_;

    std::function<void()> onChange_;
};
}

#endif //HEATMAP_MODEL_H_7712093845610293847
