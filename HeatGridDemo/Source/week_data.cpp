// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "week_data.h"
#include <algorithm>
#include <cassert>
#include <numeric>
#include <heat/basic_math.h>

using namespace heat;
using namespace hgd;


wxDateTime hgd::getWeekStart(const wxDateTime& today, int weekOffset)
{
    wxDateTime weekStart = today;
    weekStart.ResetTime();
    weekStart.SetToWeekDayInSameWeek(wxDateTime::Mon, wxDateTime::Monday_First);
    weekStart.Add(wxDateSpan::Weeks(weekOffset));
    return weekStart;
}


std::wstring hgd::formatDate(const wxDateTime& date, DateFormat fmt)
{
    switch (fmt)
    {
        case DateFormat::monthDay:
        {
            static const std::vector<std::wstring> monthNames = getDefaultColumnHeaders(); //English on purpose: matches the grid headers
            return monthNames[date.GetMonth()] + wxString::Format(L" %02d", date.GetDay()).ToStdWstring();
        }
        case DateFormat::numeric:
            return wxString::Format(L"%02d.%02d.%04d.", date.GetDay(), static_cast<int>(date.GetMonth()) + 1, date.GetYear()).ToStdWstring();
    }
    assert(false);
    return std::wstring();
}


std::wstring hgd::formatWeekRange(const wxDateTime& weekStart, DateFormat fmt)
{
    const wxDateTime weekEnd = weekStart + wxDateSpan::Days(6);
    return formatDate(weekStart, fmt) + L" - " + formatDate(weekEnd, fmt);
}


std::vector<RowData> hgd::generateActivityRows(const std::vector<std::wstring>& labels, int maxActive, int maxIndex, std::mt19937& rng)
{
    std::vector<int> indices(std::max(maxIndex + 1, 0));
    std::iota(indices.begin(), indices.end(), 0);

    std::vector<RowData> rows;
    for (const std::wstring& label : labels)
    {
        const int activeCount = std::uniform_int_distribution<int>(1, std::max(maxActive, 1))(rng);

        std::shuffle(indices.begin(), indices.end(), rng);
        const auto itEnd = indices.begin() + std::min<ptrdiff_t>(activeCount, indices.size());

        rows.push_back(makeActivityRow(label, std::vector<int>(indices.begin(), itEnd)));
    }
    return rows;
}


std::vector<Athlete> hgd::generateAthletes(const std::vector<std::wstring>& names, std::mt19937& rng)
{
    std::vector<Athlete> athletes;
    for (const std::wstring& name : names)
    {
        Athlete& a = athletes.emplace_back(Athlete{name, {}});

        for (int day = 1; day <= 7; ++day)
            if (std::bernoulli_distribution(0.6)(rng)) //rest day otherwise
                a.workouts.push_back({day, std::uniform_int_distribution<int>(10, maxWorkoutMinutes)(rng)});
    }
    return athletes;
}


wxColor hgd::getWorkoutColor(int minutes)
{
    const int m = std::clamp(minutes, 0, maxWorkoutMinutes);

    //interpolate #9BE9A8 (light) => #216E39 (dark)
    auto mix = [m](int from, int to) { return static_cast<unsigned char>(from + numeric::intDivRound((to - from) * m, maxWorkoutMinutes)); };
    return {mix(0x9b, 0x21), mix(0xe9, 0x6e), mix(0xa8, 0x39)};
}
