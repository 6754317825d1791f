// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_LAYOUT_H_8374651029384756102
#define HEATMAP_LAYOUT_H_8374651029384756102

#include <string_view>
#include <vector>
#include <wx/geometry.h>
#include "heatmap_attr.h"
#include "heatmap_data.h"


namespace heat
{
struct TextExtent
{
    double width   = 0;
    double ascent  = 0; //distance baseline to top: implementations may report either sign
    double descent = 0; //distance baseline to bottom
};

double getTextHeight(const TextExtent& te); //|ascent| + |descent|


struct TextMetrics
{
    virtual ~TextMetrics() {}
    virtual TextExtent getTextExtent(std::wstring_view text, double textSize) const = 0;
};


/*  x-axis:  | padding.left | label area | grid (columnCount cells) | padding.right |   (labels leading)
    y-axis:  | padding.top  | rows ... | header area | padding.bottom |                  (header trailing)   */
struct LayoutGeometry
{
    double cellSide         = 0; //>= 0
    double cellGap          = 0; //>= 0
    double labelAreaWidth   = 0; //widest label + label gap; 0 without rows
    double headerAreaHeight = 0; //header gap + header text height
    double gridOffsetX      = 0; //grid origin relative to the padded content origin
    double gridOffsetY      = 0; //
    double contentWidth     = 0; //available width minus horizontal padding
    double requiredHeight   = 0; //including vertical padding
    ptrdiff_t columnCount   = 0;
    ptrdiff_t rowCount      = 0;
};
bool operator==(const LayoutGeometry& lhs, const LayoutGeometry& rhs);


LayoutGeometry measureHeatmap(double availableWidth,
                              const Padding& padding,
                              const std::vector<RowData>& rows,
                              ptrdiff_t columnCount, //<= 0: grid without cells
                              const HeatmapAttributes& attr,
                              const TextMetrics& metrics);

//exact bounds of a cell in client coordinates
wxRect2DDouble getCellRect(const LayoutGeometry& geo, const Padding& padding, ptrdiff_t row, ptrdiff_t col);

//top of row band "row" in client coordinates
double getRowTop(const LayoutGeometry& geo, const Padding& padding, ptrdiff_t row);
}

#endif //HEATMAP_LAYOUT_H_8374651029384756102
