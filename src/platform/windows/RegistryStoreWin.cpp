#ifdef _WIN32

#include "platform/PlatformImpl.hpp"
#include "setup_core/KeyValueStore.hpp"

#include <windows.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <glog/logging.h>

namespace setupcore {

    namespace {

    //---UTF-8 → UTF-16
    static std::wstring utf8ToWide(const std::string& s)
    {
        if (s.empty()) return {};
        int n = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), nullptr, 0);
        if (n <= 0) return {};
        std::wstring w((size_t)n, L'\0');
        MultiByteToWideChar(CP_UTF8, 0, s.c_str(), (int)s.size(), w.data(), n);
        return w;
    }
    //---UTF-16 → UTF-8
    static std::string wideToUtf8(std::wstring_view w)
    {
        if (w.empty()) return {};
        int n = WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), nullptr, 0, nullptr, nullptr);
        if (n <= 0) return {};
        std::string s((size_t)n, '\0');
        WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), s.data(), n, nullptr, nullptr);
        return s;
    }
    //---HKLM / HKCU
    static HKEY rootFor(Scope scope)
    {
        return scope == Scope::Machine ? HKEY_LOCAL_MACHINE : HKEY_CURRENT_USER;
    }
    //---"HKLM\SOFTWARE\...\name" для сообщений
    static std::string describeKey(const StoreKey& key)
    {
        return std::string(key.scope == Scope::Machine ? "HKLM\\" : "HKCU\\") + key.path + "\\" + key.name;
    }
    //---Ошибка реестра
    static bool storeFailure(Error* error, const char* what, const StoreKey& key, LSTATUS rc)
    {
        const std::string msg = std::string(what) + " " + describeKey(key) + " failed, error=" + std::to_string((long)rc);
        LOG(ERROR) << msg;
        return fail(error, ErrorKind::StoreFailure, msg);
    }

    //---Хранилище в реестре Windows (REG_SZ, 64-битное представление;
    //   пути WOW6432Node адресуют 32-битное явно)
    class RegistryStore final : public IKeyValueStore {
    public:
		//---Чтение строкового значения
        bool get(const StoreKey& key, std::optional<std::string>& out, Error* error) override
        {
            out.reset();

            const std::wstring sub = utf8ToWide(key.path);
            const std::wstring name = utf8ToWide(key.name);

            HKEY h = nullptr;
            LSTATUS rc = RegOpenKeyExW(rootFor(key.scope), sub.c_str(), 0, KEY_QUERY_VALUE | KEY_WOW64_64KEY, &h);
            if (rc == ERROR_FILE_NOT_FOUND || rc == ERROR_PATH_NOT_FOUND) return true;  // ключа нет
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegOpenKeyEx", key, rc);

            DWORD size = 0;
            rc = RegGetValueW(h, nullptr, name.c_str(), RRF_RT_REG_SZ, nullptr, nullptr, &size);
            if (rc == ERROR_FILE_NOT_FOUND)
            {
                RegCloseKey(h);
                return true;    // значения нет
            }
            if (rc != ERROR_SUCCESS)
            {
                RegCloseKey(h);
                return storeFailure(error, "RegGetValue", key, rc);
            }

            std::wstring buf(size / sizeof(wchar_t) + 1, L'\0');
            size = (DWORD)(buf.size() * sizeof(wchar_t));
            rc = RegGetValueW(h, nullptr, name.c_str(), RRF_RT_REG_SZ, nullptr, buf.data(), &size);
            RegCloseKey(h);
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegGetValue", key, rc);

            //---size включает завершающий \0
            buf.resize(size >= sizeof(wchar_t) ? size / sizeof(wchar_t) - 1 : 0);
            out = wideToUtf8(buf);
            return true;
        }
		//---Запись строкового значения (ключ создаётся при необходимости)
        bool set(const StoreKey& key, const std::string& value, Error* error) override
        {
            const std::wstring sub = utf8ToWide(key.path);
            const std::wstring name = utf8ToWide(key.name);
            const std::wstring data = utf8ToWide(value);

            HKEY h = nullptr;
            LSTATUS rc = RegCreateKeyExW(rootFor(key.scope), sub.c_str(), 0, nullptr, REG_OPTION_NON_VOLATILE,
                KEY_SET_VALUE | KEY_WOW64_64KEY, nullptr, &h, nullptr);
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegCreateKeyEx", key, rc);

            rc = RegSetValueExW(h, name.c_str(), 0, REG_SZ,
                reinterpret_cast<const BYTE*>(data.c_str()), (DWORD)((data.size() + 1) * sizeof(wchar_t)));
            RegCloseKey(h);
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegSetValueEx", key, rc);

            LOG(INFO) << "Registry set " << describeKey(key);
            return true;
        }
		//---Удаление значения; отсутствующее значение - не ошибка
        bool remove(const StoreKey& key, Error* error) override
        {
            const std::wstring sub = utf8ToWide(key.path);
            const std::wstring name = utf8ToWide(key.name);

            HKEY h = nullptr;
            LSTATUS rc = RegOpenKeyExW(rootFor(key.scope), sub.c_str(), 0, KEY_SET_VALUE | KEY_WOW64_64KEY, &h);
            if (rc == ERROR_FILE_NOT_FOUND || rc == ERROR_PATH_NOT_FOUND) return true;
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegOpenKeyEx", key, rc);

            rc = RegDeleteValueW(h, name.c_str());
            RegCloseKey(h);
            if (rc == ERROR_FILE_NOT_FOUND) return true;
            if (rc != ERROR_SUCCESS) return storeFailure(error, "RegDeleteValue", key, rc);

            LOG(INFO) << "Registry removed " << describeKey(key);
            return true;
        }
    };

    } // namespace

} // namespace setupcore

namespace setupcore::platform {

    //---Хранилище ключ-значение для Windows
    std::unique_ptr<IKeyValueStore> makeKeyValueStore()
    {
        return std::make_unique<setupcore::RegistryStore>();
    }

} // namespace setupcore::platform

#endif
