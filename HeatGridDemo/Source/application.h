// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef APPLICATION_H_6650192837461029384
#define APPLICATION_H_6650192837461029384

#include <wx/app.h>


namespace hgd
{
class Application : public wxApp
{
private:
    bool OnInit() override;
    wxLayoutDirection GetLayoutDirection() const override;

    void onEnterEventLoop();
};
}

#endif //APPLICATION_H_6650192837461029384
