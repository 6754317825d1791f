// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_RENDER_H_5501928374650192837
#define HEATMAP_RENDER_H_5501928374650192837

#include <functional>
#include <memory>
#include <optional>
#include <wx/graphics.h>
#include "heatmap_layout.h"


namespace heat
{
//drawing surface of a single paint pass
class HeatmapCanvas : public TextMetrics
{
public:
    struct Gradient //backend resource: vertical gradient spanning one row band
    {
        virtual ~Gradient() {}
    };

    virtual std::unique_ptr<Gradient> createVerticalGradient(double top, double bottom, const CellColors& colors) = 0;

    virtual void fillRoundedRect        (const wxRect2DDouble& rect, double radius, const wxColor& col) = 0;
    virtual void fillRoundedRectGradient(const wxRect2DDouble& rect, double radius, const Gradient& gradient) = 0; //gradient created by this canvas

    virtual void drawText(std::wstring_view text, double x /*left*/, double y /*top*/, double textSize, const wxColor& col) = 0; //text box as measured by getTextExtent()

    virtual wxGraphicsContext* getGraphicsContext() { return nullptr; } //native surface for custom cell content; nullptr if none
};


//nullptr if cell has no data; std::nullopt: use configured active/inactive colors
using CellColorFunction = std::function<std::optional<wxColor>(const CellValue* value)>;

//custom cell content: called for cells with data only, after the cell's background was drawn
using CellDrawFunction = std::function<void(HeatmapCanvas& canvas, const wxRect2DDouble& cellRect, size_t row, size_t col, const CellValue& value)>;


//draws only: no state is modified
void paintHeatmap(HeatmapCanvas& canvas,
                  const HeatmapSnapshot& snapshot,
                  const LayoutGeometry& geo, //measured for "snapshot"
                  const Padding& padding,
                  const HeatmapAttributes& attr,
                  const CellColorFunction& getCellColor, //optional
                  const CellDrawFunction& drawCell);     //


class GraphicsCanvas : public HeatmapCanvas
{
public:
    GraphicsCanvas(wxGraphicsContext& gc, const wxFont& baseFont) : gc_(gc), baseFont_(baseFont) {}

    TextExtent getTextExtent(std::wstring_view text, double textSize) const override;

    std::unique_ptr<Gradient> createVerticalGradient(double top, double bottom, const CellColors& colors) override;

    void fillRoundedRect        (const wxRect2DDouble& rect, double radius, const wxColor& col) override;
    void fillRoundedRectGradient(const wxRect2DDouble& rect, double radius, const Gradient& gradient) override;

    void drawText(std::wstring_view text, double x, double y, double textSize, const wxColor& col) override;

    wxGraphicsContext* getGraphicsContext() override { return &gc_; }

private:
    GraphicsCanvas           (const GraphicsCanvas&) = delete;
    GraphicsCanvas& operator=(const GraphicsCanvas&) = delete;

    wxFont getFont(double textSize) const;

    wxGraphicsContext& gc_;
    const wxFont baseFont_;
};
}

#endif //HEATMAP_RENDER_H_5501928374650192837
