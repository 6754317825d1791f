// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "main_dlg.h"
#include <wx/panel.h>
#include <wx/sizer.h>
#include <heat/i18n.h>
#include <wx+/dc.h>
#include "week_data.h"

using namespace heat;
using namespace hgd;


namespace
{
const wxColor backColor = {0x0d, 0x11, 0x17}; //dark: default label color is white


std::vector<std::wstring> getWeekdayHeaders() { return {L"M", L"T", L"W", L"T", L"F", L"S", L"S"}; }


wxSizer* createWeekNavigation(wxWindow* parent, wxButton*& buttonPrev, wxStaticText*& textRange, wxButton*& buttonNext)
{
    buttonPrev = new wxButton(parent, wxID_ANY, _("Previous week"));
    buttonNext = new wxButton(parent, wxID_ANY, _("Next week"));
    textRange  = new wxStaticText(parent, wxID_ANY, wxString(), wxDefaultPosition, wxDefaultSize, wxALIGN_CENTRE_HORIZONTAL | wxST_NO_AUTORESIZE);
    textRange->SetForegroundColour(*wxWHITE);

    wxBoxSizer* bSizerNav = new wxBoxSizer(wxHORIZONTAL);
    bSizerNav->Add(buttonPrev, 0, wxALIGN_CENTER_VERTICAL);
    bSizerNav->Add(textRange,  1, wxALIGN_CENTER_VERTICAL | wxLEFT | wxRIGHT, dipToWxsize(10));
    bSizerNav->Add(buttonNext, 0, wxALIGN_CENTER_VERTICAL);
    return bSizerNav;
}
}


void MainDialog::create()
{
    auto frame = new MainDialog();
    frame->Show();
    wxTheApp->SetTopWindow(frame);
}


MainDialog::MainDialog() : wxFrame(nullptr, wxID_ANY, L"HeatGrid", wxDefaultPosition, {dipToWxsize(640), dipToWxsize(720)}),
    athleteNames_{L"Pulse", L"Track", L"Lift", L"Strength"}
{
    wxPanel* panel = new wxPanel(this);
    panel->SetBackgroundColour(backColor);

    const double pad = dipToWxsize(16);
    const Padding padding{pad, pad, pad, pad};

    //------------------ presence-only rows, one column per month ------------------
    m_heatmapMonthly = new HeatmapGrid(panel);
    m_heatmapMonthly->SetBackgroundColour(backColor);
    m_heatmapMonthly->setPadding(padding);

    //------------------ business data: workouts per weekday ------------------
    HeatmapAttributes attrWeekly;
    attrWeekly.cellGap          = dipToWxsize(6);
    attrWeekly.cellCornerRadius = dipToWxsize(6);
    attrWeekly.headerPos        = HeaderPos::leading;

    m_heatmapWeekly = new HeatmapGrid(panel, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxTAB_TRAVERSAL | wxNO_BORDER, wxASCII_STR(wxPanelNameStr), attrWeekly);
    m_heatmapWeekly->SetBackgroundColour(backColor);
    m_heatmapWeekly->setPadding(padding);

    m_heatmapWeekly->setColorFunction([](const CellValue* value) -> std::optional<wxColor>
    {
        if (const Workout* w = cellValueAs<Workout>(value))
            return getWorkoutColor(w->minutes);
        return std::nullopt; //rest day: inactive color
    });

    m_heatmapWeekly->setCellDrawFunction([](HeatmapCanvas& canvas, const wxRect2DDouble& rect, size_t row, size_t col, const CellValue& value)
    {
        if (const Workout* w = cellValueAs<Workout>(&value))
        {
            const std::wstring txt = std::to_wstring(w->minutes);
            const double textSize = rect.m_height / 3;
            const TextExtent te = canvas.getTextExtent(txt, textSize);

            canvas.drawText(txt,
                            rect.m_x + (rect.m_width - te.width) / 2,
                            rect.m_y + (rect.m_height - getTextHeight(te)) / 2,
                            textSize, *wxBLACK);
        }
    });

    m_heatmapWeekly->setClickListener([this](size_t row, size_t col, const CellValue* value) { onWorkoutClicked(row, col, value); });

    //------------------ layout ------------------
    wxBoxSizer* bSizerMain = new wxBoxSizer(wxVERTICAL);
    bSizerMain->Add(createWeekNavigation(panel, m_buttonPrevWeekMonthly, m_staticTextRangeMonthly, m_buttonNextWeekMonthly), 0, wxEXPAND | wxALL, dipToWxsize(10));
    bSizerMain->Add(m_heatmapMonthly, 0, wxEXPAND);
    bSizerMain->Add(createWeekNavigation(panel, m_buttonPrevWeekWeekly, m_staticTextRangeWeekly, m_buttonNextWeekWeekly), 0, wxEXPAND | wxALL, dipToWxsize(10));
    bSizerMain->Add(m_heatmapWeekly, 0, wxEXPAND);
    panel->SetSizer(bSizerMain);

    CreateStatusBar();

    m_buttonPrevWeekMonthly->Bind(wxEVT_BUTTON, [this](wxCommandEvent& event) { onPrevWeekMonthly(event); });
    m_buttonNextWeekMonthly->Bind(wxEVT_BUTTON, [this](wxCommandEvent& event) { onNextWeekMonthly(event); });
    m_buttonPrevWeekWeekly ->Bind(wxEVT_BUTTON, [this](wxCommandEvent& event) { onPrevWeekWeekly (event); });
    m_buttonNextWeekWeekly ->Bind(wxEVT_BUTTON, [this](wxCommandEvent& event) { onNextWeekWeekly (event); });

    Bind(wxEVT_CLOSE_WINDOW, [this](wxCloseEvent& event) { onClose(event); });

    updateMonthlyView();
    updateWeeklyView();
}


void MainDialog::updateMonthlyView()
{
    m_staticTextRangeMonthly->SetLabel(formatWeekRange(getWeekStart(wxDateTime::Today(), weekOffsetMonthly_), DateFormat::monthDay));

    const std::vector<std::wstring> weekDays{L"Mon", L"Tue", L"Wed", L"Thu", L"Fri", L"Sat", L"Sun"};

    //index 12 is one past the last column: stored, but not drawn
    m_heatmapMonthly->setRows(generateActivityRows(weekDays, 12 /*maxActive*/, 12 /*maxIndex*/, rng_), getDefaultColumnHeaders());
}


void MainDialog::updateWeeklyView()
{
    m_staticTextRangeWeekly->SetLabel(formatWeekRange(getWeekStart(wxDateTime::Today(), weekOffsetWeekly_), DateFormat::numeric));

    m_heatmapWeekly->setData(generateAthletes(athleteNames_, rng_),
                             [](const Athlete& a) { return a.name; },
                             [](const Athlete& a) -> const std::vector<Workout>& { return a.workouts; },
                             [](const Workout& w) { return w.day - 1; },
                             getWeekdayHeaders());
    SetStatusText(wxString());
}


void MainDialog::onWorkoutClicked(size_t row, size_t col, const CellValue* value)
{
    const std::vector<std::wstring>& headers = m_heatmapWeekly->getColumnHeaders();
    const std::wstring rowName = row < athleteNames_.size() ? athleteNames_[row] : std::wstring();
    const std::wstring colName = col < headers.size() ? headers[col] : std::wstring();

    if (const Workout* w = cellValueAs<Workout>(value))
        SetStatusText(rowName + L", " + colName + L": " + _P("1 minute", "%x minutes", w->minutes));
    else
        SetStatusText(rowName + L", " + colName + L": " + _("Rest day"));
}
