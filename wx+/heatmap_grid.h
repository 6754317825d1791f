// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_GRID_H_4401928374651029384
#define HEATMAP_GRID_H_4401928374651029384

#include <memory>
#include <optional>
#include <wx/panel.h>
#include <wx/bitmap.h>
#include "heatmap_model.h"


//contribution heatmap as wxPanel specialization
namespace heat
{
/*  m_heatmap = new HeatmapGrid(this);
    m_heatmap->setData(users,
                       [](const User& u) { return u.name; },
                       [](const User& u) { return u.activities; },
                       [](const Activity& a) { return a.day - 1; },
                       std::vector<std::wstring>{L"M", L"T", L"W", L"T", L"F", L"S", L"S"});

    m_heatmap->setColorFunction([](const CellValue* v) -> std::optional<wxColor> { ... });
    m_heatmap->setClickListener([](size_t row, size_t col, const CellValue* v) { ... });       */

class HeatmapGrid : public wxPanel
{
public:
    HeatmapGrid(wxWindow* parent,
                wxWindowID winid     = wxID_ANY,
                const wxPoint& pos   = wxDefaultPosition,
                const wxSize& size   = wxDefaultSize,
                long style           = wxTAB_TRAVERSAL | wxNO_BORDER,
                const wxString& name = wxASCII_STR(wxPanelNameStr),
                const HeatmapAttributes& attr = HeatmapAttributes());

    //throw X
    template <class T, class LabelFun, class DetailsFun, class IndexFun = std::nullptr_t>
    void setData(const std::vector<T>& items, LabelFun labelOf, DetailsFun detailsOf, IndexFun indexOf = nullptr,
                 std::optional<std::vector<std::wstring>> headers = std::nullopt)
    { model_.setData(items, labelOf, detailsOf, indexOf, std::move(headers)); }

    void setRows(std::vector<RowData> rows, std::optional<std::vector<std::wstring>> headers = std::nullopt) { model_.setRows(std::move(rows), std::move(headers)); }

    size_t getRowCount   () const { return model_.getRowCount(); }
    size_t getColumnCount() const { return model_.getColumnCount(); }
    const std::vector<std::wstring>& getColumnHeaders() const { return model_.getColumnHeaders(); }
    const CellValue* getCellValue(size_t row, size_t col) const { return model_.getCellValue(row, col); }

    void setColorFunction   (const CellColorFunction& getCellColor) { model_.setColorFunction(getCellColor); }
    void setCellDrawFunction(const CellDrawFunction&  drawCell    ) { model_.setCellDrawFunction(drawCell); }
    void setClickListener   (const CellClickFunction& onCellClick ) { model_.setClickListener(onCellClick); }

    const HeatmapAttributes& getAttributes() const { return model_.getAttributes(); }
    void setAttributes(const HeatmapAttributes& attr) { model_.setAttributes(attr); }

    void setActiveColors   (const CellColors& colors) { model_.setActiveColors  (colors); }
    void setInactiveColors (const CellColors& colors) { model_.setInactiveColors(colors); }
    void setCellGap         (double gap   ) { model_.setCellGap(gap); }
    void setCellCornerRadius(double radius) { model_.setCellCornerRadius(radius); }
    void setLabelPosition (LabelPos pos      ) { model_.setLabelPosition (pos); }
    void setLabelGridGap  (double gap        ) { model_.setLabelGridGap  (gap); }
    void setLabelTextColor(const wxColor& col) { model_.setLabelTextColor(col); }
    void setLabelTextSize (double size       ) { model_.setLabelTextSize (size); }
    void setHeaderPosition (HeaderPos pos     ) { model_.setHeaderPosition (pos); }
    void setHeaderGridGap  (double gap        ) { model_.setHeaderGridGap  (gap); }
    void setHeaderTextColor(const wxColor& col) { model_.setHeaderTextColor(col); }
    void setHeaderTextSize (double size       ) { model_.setHeaderTextSize (size); }

    void setPadding(const Padding& padding) { model_.setPadding(padding); }

    bool SetFont(const wxFont& font) override;

protected:
    wxSize DoGetBestClientSize() const override; //height for the current width

private:
    void onPaintEvent(wxPaintEvent& event);
    void onSizeEvent(wxSizeEvent& event);
    void onMouseLeftDown(wxMouseEvent& event);
    void onMouseMovement(wxMouseEvent& event);

    void onModelChanged();
    void updateMinSize();
    const TextMetrics& getTextMetrics() const;

    HeatmapModel model_;

    std::optional<wxBitmap> doubleBuffer_;

    std::unique_ptr<wxGraphicsContext> measureGc_; //text measurement outside of paint events
    std::unique_ptr<GraphicsCanvas> measureCanvas_;
};
}

#endif //HEATMAP_GRID_H_4401928374651029384
