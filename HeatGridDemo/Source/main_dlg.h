// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef MAIN_DLG_H_8820193746512093847
#define MAIN_DLG_H_8820193746512093847

#include <random>
#include <wx/frame.h>
#include <wx/button.h>
#include <wx/stattext.h>
#include <wx+/heatmap_grid.h>


namespace hgd
{
class MainDialog : public wxFrame
{
public:
    static void create();

private:
    MainDialog();

    void onClose(wxCloseEvent& event) { Destroy(); }

    void onPrevWeekMonthly(wxCommandEvent& event) { --weekOffsetMonthly_; updateMonthlyView(); }
    void onNextWeekMonthly(wxCommandEvent& event) { ++weekOffsetMonthly_; updateMonthlyView(); }
    void onPrevWeekWeekly (wxCommandEvent& event) { --weekOffsetWeekly_;  updateWeeklyView(); }
    void onNextWeekWeekly (wxCommandEvent& event) { ++weekOffsetWeekly_;  updateWeeklyView(); }

    void onWorkoutClicked(size_t row, size_t col, const heat::CellValue* value);

    void updateMonthlyView();
    void updateWeeklyView();

    wxButton*     m_buttonPrevWeekMonthly = nullptr;
    wxButton*     m_buttonNextWeekMonthly = nullptr;
    wxStaticText* m_staticTextRangeMonthly = nullptr;
    heat::HeatmapGrid* m_heatmapMonthly = nullptr;

    wxButton*     m_buttonPrevWeekWeekly = nullptr;
    wxButton*     m_buttonNextWeekWeekly = nullptr;
    wxStaticText* m_staticTextRangeWeekly = nullptr;
    heat::HeatmapGrid* m_heatmapWeekly = nullptr;

    int weekOffsetMonthly_ = 0; //0: this week, -1: last week
    int weekOffsetWeekly_  = 0; //

    std::vector<std::wstring> athleteNames_; //row labels of m_heatmapWeekly

    std::mt19937 rng_{std::random_device()()};
};
}

#endif //MAIN_DLG_H_8820193746512093847
