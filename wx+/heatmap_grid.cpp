// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "heatmap_grid.h"
#include <cmath>
#include <heat/extra_log.h>
#include <heat/i18n.h>
#include "dc.h"

using namespace heat;


namespace
{
struct NullTextMetrics : public TextMetrics //no measuring context available: text takes no space
{
    TextExtent getTextExtent(std::wstring_view text, double textSize) const override { return {}; }
};


wxPoint2DDouble toPoint2D(const wxPoint& pt) { return {static_cast<wxDouble>(pt.x), static_cast<wxDouble>(pt.y)}; }
}


HeatmapGrid::HeatmapGrid(wxWindow* parent,
                         wxWindowID winid,
                         const wxPoint& pos,
                         const wxSize& size,
                         long style,
                         const wxString& name,
                         const HeatmapAttributes& attr) :
    wxPanel(parent, winid, pos, size, style, name),
    model_(attr)
{
    model_.setChangeCallback([this] { onModelChanged(); });

    measureGc_.reset(wxGraphicsContext::Create()); //measuring-only context
    if (measureGc_)
        measureCanvas_ = std::make_unique<GraphicsCanvas>(*measureGc_, GetFont());
    else
        logExtraError(_("Cannot create graphics context for text measurement."));

    Bind(wxEVT_PAINT, [this](wxPaintEvent& event) { onPaintEvent(event); });
    Bind(wxEVT_SIZE,  [this](wxSizeEvent&  event) { onSizeEvent (event); });
    Bind(wxEVT_ERASE_BACKGROUND, [](wxEraseEvent& event) {}); //https://wiki.wxwidgets.org/Flicker-Free_Drawing

    SetBackgroundStyle(wxBG_STYLE_PAINT);

    Bind(wxEVT_LEFT_DOWN, [this](wxMouseEvent& event) { onMouseLeftDown(event); });
    Bind(wxEVT_MOTION,    [this](wxMouseEvent& event) { onMouseMovement(event); });
}


bool HeatmapGrid::SetFont(const wxFont& font)
{
    if (!wxPanel::SetFont(font))
        return false;

    if (measureGc_)
        measureCanvas_ = std::make_unique<GraphicsCanvas>(*measureGc_, GetFont());
    model_.invalidateGeometry();
    return true;
}


const TextMetrics& HeatmapGrid::getTextMetrics() const
{
    if (measureCanvas_)
        return *measureCanvas_;

    static const NullTextMetrics nullMetrics;
    return nullMetrics;
}


wxSize HeatmapGrid::DoGetBestClientSize() const
{
    const int width = GetClientSize().GetWidth();
    const LayoutGeometry& geo = model_.getGeometry(width, getTextMetrics());
    return {width, static_cast<int>(std::ceil(geo.requiredHeight))};
}


void HeatmapGrid::updateMinSize()
{
    const int height = DoGetBestClientSize().GetHeight() + (GetSize().GetHeight() - GetClientSize().GetHeight());

    if (GetMinSize().GetHeight() != height)
    {
        SetMinSize({GetMinSize().GetWidth(), height}); //SetMinClientSize() is not working reliably
        PostSizeEventToParent(); //parent sizer: re-layout with the new height
    }
}


void HeatmapGrid::onModelChanged()
{
    InvalidateBestSize();
    updateMinSize();
    Refresh();
}


void HeatmapGrid::onSizeEvent(wxSizeEvent& event)
{
    updateMinSize(); //height depends on width
    Refresh();
    event.Skip();
}


void HeatmapGrid::onPaintEvent(wxPaintEvent& event)
{
    BufferedPaintDC dc(*this, doubleBuffer_);
    if (!doubleBuffer_) //empty client area
        return;

    clearArea(dc, GetClientRect(), GetBackgroundColour());

    std::unique_ptr<wxGraphicsContext> gc(wxGraphicsContext::Create(dc));
    if (!gc)
        return logExtraError(_("Cannot create graphics context for painting."));

    GraphicsCanvas canvas(*gc, GetFont());
    model_.paint(canvas, GetClientSize().GetWidth()); //throw X: adapter exceptions are not handled here and end the application
}


void HeatmapGrid::onMouseLeftDown(wxMouseEvent& event)
{
    if (!model_.click(toPoint2D(event.GetPosition()), GetClientSize().GetWidth(), getTextMetrics()))
        event.Skip(); //not a cell or no click listener: let parent, e.g. a wxScrolledWindow, handle it
}


void HeatmapGrid::onMouseMovement(wxMouseEvent& event)
{
    const bool overCell = model_.hasClickListener() &&
                          model_.hitTest(toPoint2D(event.GetPosition()), GetClientSize().GetWidth(), getTextMetrics());

    SetCursor(overCell ? wxCursor(wxCURSOR_HAND) : wxNullCursor);
    event.Skip();
}
