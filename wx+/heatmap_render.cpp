// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "heatmap_render.h"
#include <algorithm>
#include <cmath>
#include <heat/basic_math.h>

using namespace heat;


namespace
{
//both categories share one row band => at most two gradients per row, created on first use
class RowGradients
{
public:
    RowGradients(HeatmapCanvas& canvas, double top, double bottom) : canvas_(canvas), top_(top), bottom_(bottom) {}

    const HeatmapCanvas::Gradient& get(bool active, const CellColors& colors)
    {
        std::unique_ptr<HeatmapCanvas::Gradient>& grad = active ? active_ : inactive_;
        if (!grad)
            grad = canvas_.createVerticalGradient(top_, bottom_, colors);
        return *grad;
    }

private:
    HeatmapCanvas& canvas_;
    const double top_;
    const double bottom_;
    std::unique_ptr<HeatmapCanvas::Gradient> active_;
    std::unique_ptr<HeatmapCanvas::Gradient> inactive_;
};
}


void heat::paintHeatmap(HeatmapCanvas& canvas,
                        const HeatmapSnapshot& snapshot,
                        const LayoutGeometry& geo,
                        const Padding& padding,
                        const HeatmapAttributes& attr,
                        const CellColorFunction& getCellColor,
                        const CellDrawFunction& drawCell)
{
    const double padLeft = numeric::nonNegative(padding.left);
    const bool drawCells = geo.cellSide > 0 && geo.columnCount > 0;
    const double radius = std::min(numeric::nonNegative(attr.cellCornerRadius), geo.cellSide / 2);

    const ptrdiff_t headerRow = attr.headerPos == HeaderPos::leading ? 0 : std::ssize(snapshot.rows) - 1;

    for (ptrdiff_t rowIdx = 0; rowIdx < std::ssize(snapshot.rows); ++rowIdx)
    {
        const RowData& row = snapshot.rows[rowIdx];
        const double rowTop = getRowTop(geo, padding, rowIdx);

        //row label: vertically centered on the row band
        {
            const TextExtent te = canvas.getTextExtent(row.label, attr.labelTextSize);
            const double top = rowTop + (geo.cellSide - getTextHeight(te)) / 2;
            const double x = attr.labelPos == LabelPos::leading ?
                             padLeft :
                             padLeft + geo.contentWidth - te.width; //right-aligned at the content's far edge
            canvas.drawText(row.label, x, top, attr.labelTextSize, attr.labelTextColor);
        }

        if (!drawCells)
            continue;

        RowGradients gradients(canvas, rowTop, rowTop + geo.cellSide);

        for (ptrdiff_t col = 0; col < geo.columnCount; ++col)
        {
            const wxRect2DDouble rect = getCellRect(geo, padding, rowIdx, col);

            auto it = row.cells.find(static_cast<size_t>(col));
            const CellValue* value = it != row.cells.end() ? &it->second : nullptr;

            std::optional<wxColor> cellColor;
            if (getCellColor)
                cellColor = getCellColor(value); //no-data cells may be colored, too

            if (cellColor)
                canvas.fillRoundedRect(rect, radius, *cellColor);
            else
            {
                const CellColors& colors = value ? attr.activeColors : attr.inactiveColors;
                if (isGradient(colors))
                    canvas.fillRoundedRectGradient(rect, radius, gradients.get(value != nullptr, colors));
                else
                    canvas.fillRoundedRect(rect, radius, colors.top);
            }

            if (value && drawCell)
                drawCell(canvas, rect, static_cast<size_t>(rowIdx), static_cast<size_t>(col), *value);

            if (rowIdx == headerRow && col < std::ssize(snapshot.headers))
            {
                const std::wstring& header = snapshot.headers[col];
                const TextExtent te = canvas.getTextExtent(header, attr.headerTextSize);

                const double headerGap = numeric::nonNegative(attr.headerGridGap);
                const double top = attr.headerPos == HeaderPos::leading ?
                                   rect.m_y - headerGap - getTextHeight(te) :
                                   rect.m_y + rect.m_height + headerGap;

                canvas.drawText(header, rect.m_x + (rect.m_width - te.width) / 2, top, attr.headerTextSize, attr.headerTextColor);
            }
        }
    }
}

//----------------------------------------------------------------------------------------------------------------

namespace
{
struct GraphicsGradient : public HeatmapCanvas::Gradient
{
    explicit GraphicsGradient(const wxGraphicsBrush& b) : brush(b) {}
    wxGraphicsBrush brush;
};
}


wxFont GraphicsCanvas::getFont(double textSize) const
{
    wxFont font = baseFont_;
    font.SetPixelSize({0, std::max(1, static_cast<int>(std::lround(numeric::nonNegative(textSize))))});
    return font;
}


TextExtent GraphicsCanvas::getTextExtent(std::wstring_view text, double textSize) const
{
    gc_.SetFont(getFont(textSize), *wxBLACK);

    wxDouble width = 0;
    wxDouble height = 0;
    wxDouble descent = 0;
    wxDouble externalLeading = 0;
    gc_.GetTextExtent(wxString(text.data(), text.size()), &width, &height, &descent, &externalLeading);

    return {width, height - descent, descent};
}


std::unique_ptr<HeatmapCanvas::Gradient> GraphicsCanvas::createVerticalGradient(double top, double bottom, const CellColors& colors)
{
    return std::make_unique<GraphicsGradient>(gc_.CreateLinearGradientBrush(0, top, 0, bottom, colors.top, colors.bottom));
}


void GraphicsCanvas::fillRoundedRect(const wxRect2DDouble& rect, double radius, const wxColor& col)
{
    gc_.SetPen(*wxTRANSPARENT_PEN);
    gc_.SetBrush(wxBrush(col));
    gc_.DrawRoundedRectangle(rect.m_x, rect.m_y, rect.m_width, rect.m_height, radius);
}


void GraphicsCanvas::fillRoundedRectGradient(const wxRect2DDouble& rect, double radius, const Gradient& gradient)
{
    gc_.SetPen(*wxTRANSPARENT_PEN);
    gc_.SetBrush(static_cast<const GraphicsGradient&>(gradient).brush);
    gc_.DrawRoundedRectangle(rect.m_x, rect.m_y, rect.m_width, rect.m_height, radius);
}


void GraphicsCanvas::drawText(std::wstring_view text, double x, double y, double textSize, const wxColor& col)
{
    gc_.SetFont(getFont(textSize), col);
    gc_.DrawText(wxString(text.data(), text.size()), x, y);
}
