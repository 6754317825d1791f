// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef WEEK_DATA_H_2290183746501928374
#define WEEK_DATA_H_2290183746501928374

#include <random>
#include <string>
#include <vector>
#include <wx/colour.h>
#include <wx/datetime.h>
#include <wx+/heatmap_data.h>


//sample data for the demo: week navigation and random activity
namespace hgd
{
//Monday of the week "weekOffset" weeks away from the week containing "today" (0: this week, -1: last week)
wxDateTime getWeekStart(const wxDateTime& today, int weekOffset);

enum class DateFormat
{
    monthDay, //"Oct 12"
    numeric,  //"12.10.2026."
};
std::wstring formatDate(const wxDateTime& date, DateFormat fmt);
std::wstring formatWeekRange(const wxDateTime& weekStart, DateFormat fmt); //"Oct 12 - Oct 18"


//presence-only rows: between 1 and "maxActive" distinct indices drawn from [0, maxIndex]
std::vector<heat::RowData> generateActivityRows(const std::vector<std::wstring>& labels, int maxActive, int maxIndex, std::mt19937& rng);


struct Workout
{
    int day     = 1; //1: Monday ... 7: Sunday
    int minutes = 0;
};

struct Athlete
{
    std::wstring name;
    std::vector<Workout> workouts; //ordered by day, days without workout are missing
};

const int maxWorkoutMinutes = 120;

std::vector<Athlete> generateAthletes(const std::vector<std::wstring>& names, std::mt19937& rng);

wxColor getWorkoutColor(int minutes); //light to dark green, clamped to [0, maxWorkoutMinutes]
}

#endif //WEEK_DATA_H_2290183746501928374
