// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_ATTR_H_3019284756102938475
#define HEATMAP_ATTR_H_3019284756102938475

#include <wx/colour.h>
#include "dc.h"


namespace heat
{
enum class LabelPos //row labels relative to the grid
{
    leading,  //left
    trailing, //right
};

enum class HeaderPos //column headers relative to the grid
{
    leading,  //top
    trailing, //bottom
};


struct CellColors //vertical gradient: no gradient is created if both are equal
{
    wxColor top;
    wxColor bottom;
};
inline bool isGradient(const CellColors& cc) { return cc.top != cc.bottom; }

//a category given only a single color is drawn solid
inline CellColors makeCellColors(const wxColor& top) { return {top, top}; }
inline CellColors makeCellColors(const wxColor& top, const wxColor& bottom) { return {top, bottom}; }


struct Padding //insets of the content region
{
    double left   = 0;
    double top    = 0;
    double right  = 0;
    double bottom = 0;
};
inline bool operator==(const Padding& lhs, const Padding& rhs) { return lhs.left == rhs.left && lhs.top == rhs.top && lhs.right == rhs.right && lhs.bottom == rhs.bottom; }


//all lengths in wxsize units
struct HeatmapAttributes
{
    CellColors activeColors   = makeCellColors({0x11, 0x63, 0x29}, {0x2d, 0xa4, 0x4e}); //cells with data: dark to light green
    CellColors inactiveColors = makeCellColors({0x22, 0x22, 0x22});                     //cells without data

    double cellGap          = dipToWxsize(8);
    double cellCornerRadius = dipToWxsize(4);

    LabelPos labelPos     = LabelPos::leading;
    double   labelGridGap = dipToWxsize(10);
    wxColor  labelTextColor = {0xff, 0xff, 0xff};
    double   labelTextSize  = dipToWxsize(14);

    HeaderPos headerPos     = HeaderPos::trailing;
    double    headerGridGap = dipToWxsize(10);
    wxColor   headerTextColor = {0x80, 0x80, 0x80};
    double    headerTextSize  = dipToWxsize(12);
};
}

#endif //HEATMAP_ATTR_H_3019284756102938475
