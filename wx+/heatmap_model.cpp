// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "heatmap_model.h"
#include <utility>
#include <heat/scope_guard.h>

using namespace heat;


HeatmapModel::HeatmapModel(const HeatmapAttributes& attr) :
    snapshot_(std::make_shared<const HeatmapSnapshot>(HeatmapSnapshot{{}, getDefaultColumnHeaders()})),
    attr_(attr) {}


template <class Function>
void HeatmapModel::applyChange(Function change)
{
    if (callbackDepth_ > 0)
    {
        deferredChanges_.emplace_back(std::move(change));
        return;
    }
    change();
    geoCache_.reset();

    if (onChange_)
        onChange_();
}


void HeatmapModel::flushDeferredChanges()
{
    if (callbackDepth_ == 0 && !deferredChanges_.empty())
    {
        for (const std::function<void()>& change : std::exchange(deferredChanges_, {}))
            change();
        geoCache_.reset();

        if (onChange_)
            onChange_();
    }
}


void HeatmapModel::setRows(std::vector<RowData> rows, std::optional<std::vector<std::wstring>> headers)
{
    applyChange([this, rows = std::move(rows), headers = std::move(headers)]() mutable
    {
        auto newSnapshot = std::make_shared<HeatmapSnapshot>();
        newSnapshot->rows = std::move(rows);
        newSnapshot->headers = headers ? std::move(*headers) : snapshot_->headers; //evaluated when applied: a deferred change must not resurrect older headers
        snapshot_ = std::move(newSnapshot);
    });
}


const CellValue* HeatmapModel::getCellValue(size_t row, size_t col) const
{
    if (row < snapshot_->rows.size())
    {
        const auto& cells = snapshot_->rows[row].cells;
        if (auto it = cells.find(col);
            it != cells.end())
            return &it->second;
    }
    return nullptr;
}


void HeatmapModel::setColorFunction   (const CellColorFunction& getCellColor) { applyChange([this, getCellColor] { getCellColor_ = getCellColor; }); }
void HeatmapModel::setCellDrawFunction(const CellDrawFunction&  drawCell    ) { applyChange([this, drawCell    ] { drawCell_     = drawCell;     }); }
void HeatmapModel::setClickListener   (const CellClickFunction& onCellClick ) { applyChange([this, onCellClick ] { onCellClick_  = onCellClick;  }); }

void HeatmapModel::setAttributes(const HeatmapAttributes& attr) { applyChange([this, attr] { attr_ = attr; }); }

void HeatmapModel::setActiveColors  (const CellColors& colors) { applyChange([this, colors] { attr_.activeColors   = colors; }); }
void HeatmapModel::setInactiveColors(const CellColors& colors) { applyChange([this, colors] { attr_.inactiveColors = colors; }); }

void HeatmapModel::setCellGap         (double gap   ) { applyChange([this, gap   ] { attr_.cellGap          = gap;    }); }
void HeatmapModel::setCellCornerRadius(double radius) { applyChange([this, radius] { attr_.cellCornerRadius = radius; }); }

void HeatmapModel::setLabelPosition (LabelPos pos      ) { applyChange([this, pos ] { attr_.labelPos       = pos;  }); }
void HeatmapModel::setLabelGridGap  (double gap        ) { applyChange([this, gap ] { attr_.labelGridGap   = gap;  }); }
void HeatmapModel::setLabelTextColor(const wxColor& col) { applyChange([this, col ] { attr_.labelTextColor = col;  }); }
void HeatmapModel::setLabelTextSize (double size       ) { applyChange([this, size] { attr_.labelTextSize  = size; }); }

void HeatmapModel::setHeaderPosition (HeaderPos pos     ) { applyChange([this, pos ] { attr_.headerPos       = pos;  }); }
void HeatmapModel::setHeaderGridGap  (double gap        ) { applyChange([this, gap ] { attr_.headerGridGap   = gap;  }); }
void HeatmapModel::setHeaderTextColor(const wxColor& col) { applyChange([this, col ] { attr_.headerTextColor = col;  }); }
void HeatmapModel::setHeaderTextSize (double size       ) { applyChange([this, size] { attr_.headerTextSize  = size; }); }

void HeatmapModel::setPadding(const Padding& padding) { applyChange([this, padding] { padding_ = padding; }); }


const LayoutGeometry& HeatmapModel::getGeometry(double availableWidth, const TextMetrics& metrics) const
{
    if (!geoCache_ || geoCache_->availableWidth != availableWidth)
        geoCache_ = CachedGeometry{availableWidth, measureHeatmap(availableWidth, padding_, snapshot_->rows, std::ssize(snapshot_->headers), attr_, metrics)};
    return geoCache_->geo;
}


void HeatmapModel::invalidateGeometry() { applyChange([] {}); }


void HeatmapModel::paint(HeatmapCanvas& canvas, double availableWidth)
{
    const std::shared_ptr<const HeatmapSnapshot> snapshot = snapshot_;
    const LayoutGeometry geo = getGeometry(availableWidth, canvas);
    {
        ++callbackDepth_;
        HEAT_ON_SCOPE_FAIL(if (callbackDepth_ == 0) deferredChanges_.clear()); //failed pass: its requested changes are dropped
        HEAT_ON_SCOPE_EXIT(--callbackDepth_);

        paintHeatmap(canvas, *snapshot, geo, padding_, attr_, getCellColor_, drawCell_); //throw X
    }
    flushDeferredChanges();
}


std::optional<CellHit> HeatmapModel::hitTest(const wxPoint2DDouble& pos, double availableWidth, const TextMetrics& metrics) const
{
    return resolveCell(pos, padding_, getGeometry(availableWidth, metrics), snapshot_->rows);
}


bool HeatmapModel::click(const wxPoint2DDouble& pos, double availableWidth, const TextMetrics& metrics)
{
    if (!onCellClick_) //inactive: leave pointer events to the host
        return false;

    const std::shared_ptr<const HeatmapSnapshot> snapshot = snapshot_; //keep CellHit::value alive
    const std::optional<CellHit> hit = hitTest(pos, availableWidth, metrics);
    if (!hit)
        return false;
    {
        ++callbackDepth_;
        HEAT_ON_SCOPE_FAIL(if (callbackDepth_ == 0) deferredChanges_.clear()); //runs after the depth is restored
        HEAT_ON_SCOPE_EXIT(--callbackDepth_);

        onCellClick_(hit->row, hit->col, hit->value); //throw X
    }
    flushDeferredChanges();
    return true;
}
