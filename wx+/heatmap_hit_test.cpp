// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "heatmap_hit_test.h"
#include <algorithm>
#include <cmath>
#include <heat/basic_math.h>

using namespace heat;


std::optional<CellHit> heat::resolveCell(const wxPoint2DDouble& pos,
                                         const Padding& padding,
                                         const LayoutGeometry& geo,
                                         const std::vector<RowData>& rows)
{
    const ptrdiff_t rowCount = std::min(geo.rowCount, std::ssize(rows));
    if (geo.columnCount <= 0 || rowCount <= 0 || geo.cellSide <= 0)
        return std::nullopt;

    const double pitch = geo.cellSide + geo.cellGap;
    if (numeric::isNull(pitch))
        return std::nullopt;

    //relative to grid origin
    const double x = pos.m_x - numeric::nonNegative(padding.left) - geo.gridOffsetX;
    const double y = pos.m_y - numeric::nonNegative(padding.top)  - geo.gridOffsetY;

    const double gridWidth  = geo.columnCount * pitch - geo.cellGap;
    const double gridHeight = rowCount        * pitch - geo.cellGap;

    if (!(0 <= x && x <= gridWidth &&
          0 <= y && y <= gridHeight)) //NaN-safe
        return std::nullopt;

    //x == gridWidth with zero gap lands on index columnCount
    const ptrdiff_t col = std::min(static_cast<ptrdiff_t>(std::floor(x / pitch)), geo.columnCount - 1);
    const ptrdiff_t row = std::min(static_cast<ptrdiff_t>(std::floor(y / pitch)), rowCount        - 1);

    //reject gap between cells: re-derive the exact cell bounds
    const wxRect2DDouble rect = getCellRect(geo, padding, row, col);
    if (!(rect.m_x <= pos.m_x && pos.m_x <= rect.m_x + rect.m_width &&
          rect.m_y <= pos.m_y && pos.m_y <= rect.m_y + rect.m_height))
        return std::nullopt;

    const RowData& rowData = rows[row];
    auto it = rowData.cells.find(static_cast<size_t>(col));

    return CellHit{static_cast<size_t>(row), static_cast<size_t>(col), it != rowData.cells.end() ? &it->second : nullptr};
}
