// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_HIT_TEST_H_1928374650192837465
#define HEATMAP_HIT_TEST_H_1928374650192837465

#include <functional>
#include <optional>
#include "heatmap_layout.h"


namespace heat
{
struct CellHit
{
    size_t row = 0;
    size_t col = 0;
    const CellValue* value = nullptr; //nullptr: cell without data
};

//value == nullptr: cell without data
using CellClickFunction = std::function<void(size_t row, size_t col, const CellValue* value)>;


//map a client position to the cell drawn there: std::nullopt for gaps, labels, headers, padding and everything outside
std::optional<CellHit> resolveCell(const wxPoint2DDouble& pos,
                                   const Padding& padding,
                                   const LayoutGeometry& geo, //same geometry the last paint used
                                   const std::vector<RowData>& rows);
}

#endif //HEATMAP_HIT_TEST_H_1928374650192837465
