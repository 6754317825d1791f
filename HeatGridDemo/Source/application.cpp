// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "application.h"
#include <iostream>
#include <wx/string.h>
#include <heat/extra_log.h>
#include <heat/i18n.h>
#include "main_dlg.h"

using namespace heat;
using namespace hgd;


IMPLEMENT_APP(Application)


namespace
{
void notifyAppError(const std::wstring& msg)
{
    //no GUI available at this point (or any more)
    std::cerr << wxString(_("Error") + L": " + msg).utf8_string() + '\n';
}
}


bool Application::OnInit()
{
    //do not call wxApp::OnInit() to avoid using wxWidgets command line parser

    initExtraLog([](const ErrorLog& log) //don't call functions depending on global state (which might be destroyed already!)
    {
        std::wstring msg;
        for (const LogEntry& e : log)
            msg += formatMessage(e);
        notifyAppError(msg);
    });

    SetAppName(L"HeatGridDemo"); //if not set, defaults to executable name

    CallAfter([&] { onEnterEventLoop(); });

    return true; //true: continue processing; false: exit immediately.
}


wxLayoutDirection Application::GetLayoutDirection() const { return languageLayoutIsRtl() ? wxLayout_RightToLeft : wxLayout_LeftToRight; }


void Application::onEnterEventLoop()
{
    MainDialog::create();
}
