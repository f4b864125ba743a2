#ifdef _WIN32
#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <shlobj.h>
#include <glog/logging.h>

namespace setupcore::platform {

	//---Получение пути к собственному исполняемому файлу
    fs::path selfExePath()
    {
        wchar_t buf[MAX_PATH]{};
        DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
        if (n == 0 || n >= MAX_PATH) return {};
        return fs::path(buf);
    }

	//---Проверка, что процесс запущен с правами администратора
    bool isElevated()
    {
        BOOL isAdmin = FALSE;
        PSID adminGroup = NULL;
        SID_IDENTIFIER_AUTHORITY NtAuthority = SECURITY_NT_AUTHORITY;

        if (AllocateAndInitializeSid(
            &NtAuthority, 2,
            SECURITY_BUILTIN_DOMAIN_RID,
            DOMAIN_ALIAS_RID_ADMINS,
            0, 0, 0, 0, 0, 0,
            &adminGroup))
        {
            CheckTokenMembership(NULL, adminGroup, &isAdmin);
            FreeSid(adminGroup);
        }
        return isAdmin == TRUE;
    }

    //---C:\Windows\System32
    fs::path systemDir()
    {
        wchar_t sysDir[MAX_PATH]{};
        UINT n = GetSystemDirectoryW(sysDir, MAX_PATH);
        if (n == 0 || n >= MAX_PATH) return {};   // утилиты будут искаться в PATH
        return fs::path(sysDir);
    }

    //---C:\ProgramData\kolibri
    fs::path defaultDataRoot()
    {
        PWSTR wpath = nullptr;
        HRESULT hr = SHGetKnownFolderPath(FOLDERID_ProgramData, 0, nullptr, &wpath);
        if (FAILED(hr) || !wpath)
        {
            LOG(WARNING) << "SHGetKnownFolderPath(ProgramData) failed, hr=" << hr;
            if (wpath) CoTaskMemFree(wpath);
            return fs::path(L"C:\\ProgramData") / L"kolibri";
        }
        fs::path base(wpath);
        CoTaskMemFree(wpath);
        return base / L"kolibri";
    }

    //---Версия ОС через RtlGetVersion (GetVersionEx врёт без манифеста совместимости)
    OsVersion osVersion()
    {
        using RtlGetVersionFn = LONG(WINAPI*)(PRTL_OSVERSIONINFOW);

        OsVersion v;
        HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
        if (!ntdll)
        {
            LOG(WARNING) << "ntdll.dll is not loaded, OS version unknown";
            return v;
        }

        auto fn = reinterpret_cast<RtlGetVersionFn>(GetProcAddress(ntdll, "RtlGetVersion"));
        if (!fn)
        {
            LOG(WARNING) << "RtlGetVersion not found, OS version unknown";
            return v;
        }

        RTL_OSVERSIONINFOW info{};
        info.dwOSVersionInfoSize = sizeof(info);
        if (fn(&info) != 0)
        {
            LOG(WARNING) << "RtlGetVersion failed, OS version unknown";
            return v;
        }

        v.major = info.dwMajorVersion;
        v.minor = info.dwMinorVersion;
        v.build = info.dwBuildNumber;
        return v;
    }

} // namespace setupcore::platform
#endif
