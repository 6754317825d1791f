// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "heatmap_layout.h"
#include <algorithm>
#include <cmath>
#include <heat/basic_math.h>

using namespace heat;


double heat::getTextHeight(const TextExtent& te)
{
    return std::abs(te.ascent) + std::abs(te.descent);
}


bool heat::operator==(const LayoutGeometry& lhs, const LayoutGeometry& rhs)
{
    return lhs.cellSide         == rhs.cellSide         &&
           lhs.cellGap          == rhs.cellGap          &&
           lhs.labelAreaWidth   == rhs.labelAreaWidth   &&
           lhs.headerAreaHeight == rhs.headerAreaHeight &&
           lhs.gridOffsetX      == rhs.gridOffsetX      &&
           lhs.gridOffsetY      == rhs.gridOffsetY      &&
           lhs.contentWidth     == rhs.contentWidth     &&
           lhs.requiredHeight   == rhs.requiredHeight   &&
           lhs.columnCount      == rhs.columnCount      &&
           lhs.rowCount         == rhs.rowCount;
}


LayoutGeometry heat::measureHeatmap(double availableWidth,
                                    const Padding& padding,
                                    const std::vector<RowData>& rows,
                                    ptrdiff_t columnCount,
                                    const HeatmapAttributes& attr,
                                    const TextMetrics& metrics)
{
    using namespace numeric;

    const double padLeft   = nonNegative(padding.left);
    const double padRight  = nonNegative(padding.right);
    const double padTop    = nonNegative(padding.top);
    const double padBottom = nonNegative(padding.bottom);

    LayoutGeometry geo;
    geo.cellGap     = nonNegative(attr.cellGap);
    geo.columnCount = std::max<ptrdiff_t>(columnCount, 0);
    geo.rowCount    = std::ssize(rows);

    double maxLabelWidth = 0;
    for (const RowData& row : rows)
        maxLabelWidth = std::max(maxLabelWidth, nonNegative(metrics.getTextExtent(row.label, attr.labelTextSize).width));

    geo.labelAreaWidth = rows.empty() ? 0 : maxLabelWidth + nonNegative(attr.labelGridGap);

    geo.contentWidth = nonNegative(availableWidth - padLeft - padRight);
    const double gridAvailableWidth = nonNegative(geo.contentWidth - geo.labelAreaWidth);

    if (geo.columnCount > 0)
        geo.cellSide = nonNegative((gridAvailableWidth - (geo.columnCount - 1) * geo.cellGap) / geo.columnCount);
    if (!std::isfinite(geo.cellSide)) //infinite available width
        geo.cellSide = 0;

    //header band is reserved even without rows
    geo.headerAreaHeight = nonNegative(attr.headerGridGap) + getTextHeight(metrics.getTextExtent(L"Ag", attr.headerTextSize)); //font height, not glyph height

    geo.gridOffsetX = attr.labelPos  == LabelPos ::leading ? geo.labelAreaWidth   : 0;
    geo.gridOffsetY = attr.headerPos == HeaderPos::leading ? geo.headerAreaHeight : 0;

    double contentHeight = geo.headerAreaHeight;
    if (geo.rowCount > 0)
        contentHeight += geo.rowCount * geo.cellSide + (geo.rowCount - 1) * geo.cellGap;

    geo.requiredHeight = contentHeight + padTop + padBottom;
    return geo;
}


double heat::getRowTop(const LayoutGeometry& geo, const Padding& padding, ptrdiff_t row)
{
    return numeric::nonNegative(padding.top) + geo.gridOffsetY + row * (geo.cellSide + geo.cellGap);
}


wxRect2DDouble heat::getCellRect(const LayoutGeometry& geo, const Padding& padding, ptrdiff_t row, ptrdiff_t col)
{
    return wxRect2DDouble(numeric::nonNegative(padding.left) + geo.gridOffsetX + col * (geo.cellSide + geo.cellGap),
                          getRowTop(geo, padding, row),
                          geo.cellSide,
                          geo.cellSide);
}
