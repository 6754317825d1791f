// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HEATMAP_DATA_H_6109283746510928374
#define HEATMAP_DATA_H_6109283746510928374

#include <any>
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>


//project arbitrary business data onto the fixed column space of a heatmap grid
namespace heat
{
/*  std::vector<RowData> rows = bindRows(users,
                                         [](const User& u) { return u.name; },
                                         [](const User& u) { return u.activities; },
                                         [](const Activity& a) { return a.day - 1; }); //optional: position in list otherwise      */

using CellValue = std::any; //caller-defined, stored and handed back verbatim; only presence is evaluated

template <class T>
const T* cellValueAs(const CellValue* value) { return value ? std::any_cast<T>(value) : nullptr; } //nullptr if absent or of different type


struct RowData
{
    std::wstring label;
    std::unordered_map<size_t, CellValue> cells; //column index => value; missing key means "no data"
};


struct HeatmapSnapshot //immutable once published: replaced wholesale on every data binding
{
    std::vector<RowData> rows;
    std::vector<std::wstring> headers; //headers.size() == column count
};

std::vector<std::wstring> getDefaultColumnHeaders(); //Jan..Dec


//throw X: exceptions from caller-supplied extractors propagate unchanged
template <class T, class LabelFun, class DetailsFun, class IndexFun = std::nullptr_t>
std::vector<RowData> bindRows(const std::vector<T>& items, LabelFun labelOf, DetailsFun detailsOf, IndexFun indexOf = nullptr);

//presence-only row: negative indices are dropped
template <class Container>
RowData makeActivityRow(const std::wstring& label, const Container& activeIndices);








//######################## implementation ##########################
namespace impl
{
template <class F> struct IsNullableFunction : std::is_pointer<F> {};
template <class S> struct IsNullableFunction<std::function<S>> : std::true_type {};
}


inline
std::vector<std::wstring> getDefaultColumnHeaders()
{
    return { L"Jan", L"Feb", L"Mar", L"Apr", L"May", L"Jun",
             L"Jul", L"Aug", L"Sep", L"Oct", L"Nov", L"Dec" };
}


template <class T, class LabelFun, class DetailsFun, class IndexFun>
std::vector<RowData> bindRows(const std::vector<T>& items, LabelFun labelOf, DetailsFun detailsOf, IndexFun indexOf)
{
    std::vector<RowData> rows;
    rows.reserve(items.size());

    for (const T& item : items)
    {
        RowData row;
        row.label = labelOf(item); //throw X

        decltype(auto) details = detailsOf(item); //throw X
        ptrdiff_t pos = 0;
        for (const auto& detail : details)
        {
            const ptrdiff_t colIdx = [&]() -> ptrdiff_t
            {
                if constexpr (std::is_same_v<IndexFun, std::nullptr_t>)
                    return pos;
                else
                {
                    if constexpr (impl::IsNullableFunction<IndexFun>::value) //empty std::function or null function pointer
                        if (!indexOf)
                            return pos;
                    return static_cast<ptrdiff_t>(indexOf(detail)); //throw X
                }
            }();
            ++pos;

            if (colIdx >= 0) //negative: silently dropped
                row.cells.insert_or_assign(static_cast<size_t>(colIdx), CellValue(detail)); //later details win
        }
        rows.push_back(std::move(row));
    }
    return rows;
}


template <class Container> inline
RowData makeActivityRow(const std::wstring& label, const Container& activeIndices)
{
    RowData row{label, {}};
    for (const auto idx : activeIndices)
        if (idx >= 0)
            row.cells.emplace(static_cast<size_t>(idx), CellValue());
    return row;
}
}

#endif //HEATMAP_DATA_H_6109283746510928374
