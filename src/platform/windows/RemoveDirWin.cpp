#ifdef _WIN32

#include "platform/PlatformImpl.hpp"
#include <windows.h>
#include <shlobj.h>
#include <wchar.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <glog/logging.h>

namespace setupcore::platform {

    namespace fs = std::filesystem;

    namespace {

    //---Известная папка Windows (пустой путь, если не удалось)
    static fs::path knownFolder(REFKNOWNFOLDERID id)
    {
        PWSTR w = nullptr;
        fs::path p;
        if (SUCCEEDED(SHGetKnownFolderPath(id, 0, nullptr, &w)) && w) p = fs::path(w);
        if (w) CoTaskMemFree(w);
        return p.lexically_normal();
    }

    //---Пути, которые удалять нельзя ни при каких опциях:
    //   пустой, корень диска, сами Windows / Program Files / ProgramData
    static bool isProtectedPath(const fs::path& p)
    {
        if (p.empty()) return true;

        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        if (ec) abs = p;
        abs = abs.lexically_normal();

        if (abs == abs.root_path() || abs.relative_path().empty()) return true;

        for (REFKNOWNFOLDERID id : { FOLDERID_Windows, FOLDERID_ProgramFiles, FOLDERID_ProgramFilesX86, FOLDERID_ProgramData })
        {
            const fs::path known = knownFolder(id);
            if (!known.empty() && _wcsicmp(known.c_str(), abs.c_str()) == 0) return true;
        }
        return false;
    }

    //---ReadOnly/Hidden/System мешают remove_all: снимаем их со всего дерева
    static void resetAttributes(const fs::path& root)
    {
        auto reset = [](const fs::path& p) {
            const DWORD attr = GetFileAttributesW(p.c_str());
            if (attr == INVALID_FILE_ATTRIBUTES) return;

            const DWORD mask = FILE_ATTRIBUTE_READONLY | FILE_ATTRIBUTE_HIDDEN | FILE_ATTRIBUTE_SYSTEM;
            if (attr & mask) SetFileAttributesW(p.c_str(), attr & ~mask);
        };

        reset(root);

        std::error_code ec;
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
            !ec && it != end; it.increment(ec))
        {
            reset(it->path());
        }
    }

    //---Немедленное удаление. Отсутствующий каталог - успех
    static bool removeNow(const fs::path& dir, std::string& error)
    {
        std::error_code ec;
        if (!fs::exists(dir, ec)) return true;

        resetAttributes(dir);

        fs::remove_all(dir, ec);
        if (!ec) return true;

        error = "remove_all failed for '" + dir.string() + "': " + ec.message();
        return false;
    }

    //---Повторное удаление через cmd.exe, когда помощник уже завершится
    static bool scheduleRemoval(const fs::path& dir, std::string& error)
    {
        const fs::path sys = systemDir();
        const fs::path cmdExe = sys.empty() ? fs::path(L"cmd.exe") : sys / L"cmd.exe";

        std::wstring cmdLine = L"\"" + cmdExe.wstring() + L"\" /C \"timeout /t 3 /nobreak >nul & rmdir /s /q \""
            + dir.wstring() + L"\"\"";
        std::vector<wchar_t> buf(cmdLine.c_str(), cmdLine.c_str() + cmdLine.size() + 1);

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};

        if (!CreateProcessW(nullptr, buf.data(), nullptr, nullptr, FALSE,
            CREATE_NO_WINDOW | DETACHED_PROCESS, nullptr, nullptr, &si, &pi))
        {
            const DWORD rc = GetLastError();
            error = "cannot start cmd.exe for deferred removal, error=" + std::to_string(rc);
            LOG(ERROR) << error;
            return false;
        }
        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);

        LOG(INFO) << "Deferred removal scheduled for " << dir;
        return true;
    }

    //---Общая часть: проверка пути, попытка сразу, затем отложенное удаление.
    //   deferred = true, если каталог будет удалён после выхода
    static bool removeTree(const fs::path& dir, std::string* error, bool& deferred)
    {
        deferred = false;
        if (dir.empty())
        {
            LOG(ERROR) << "Refuse to delete: empty path";
            if (error) *error = "Refuse to delete: empty path";
            return false;
        }

        if (isProtectedPath(dir))
        {
            LOG(ERROR) << "Refuse to delete protected path: " << dir;
            if (error) *error = "Refuse to delete protected path: " + dir.string();
            return false;
        }

        std::string nowErr;
        if (removeNow(dir, nowErr)) return true;
        LOG(WARNING) << nowErr;

        std::string deferErr;
        deferred = scheduleRemoval(dir, deferErr);
        if (error) *error = deferred ? nowErr : nowErr + "; " + deferErr;
        return false;
    }

    } // namespace

    //------------------------------------------------------------
    //  Каталог установки. Помощник сам лежит в нём, поэтому
    //  отложенное удаление после выхода считается успехом
    //------------------------------------------------------------
    bool removeInstallDir(const fs::path& installDir, std::string* error)
    {
        bool deferred = false;
        if (removeTree(installDir, error, deferred)) return true;
        return deferred;
    }
    //------------------------------------------------------------
    //  Каталог данных. Если файл занят - повторная попытка после выхода,
    //  но результат всё равно ошибка: каталог может остаться
    //------------------------------------------------------------
    bool removeDataRoot(const fs::path& dataRoot, std::string* error)
    {
        bool deferred = false;
        if (removeTree(dataRoot, error, deferred)) return true;

        if (deferred && error) *error += "; deferred removal scheduled";
        return false;
    }
} // namespace setupcore::platform

#endif // _WIN32
