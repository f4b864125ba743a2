#if defined(__linux__)

#include "platform/PlatformImpl.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <glog/logging.h>

namespace setupcore::platform {
    namespace fs = std::filesystem;

    //---Не даём снести "/" и пустой путь
    static bool isDangerousPath(const fs::path& p)
    {
        if (p.empty()) return true;

        std::error_code ec;
        fs::path abs = fs::absolute(p, ec);
        if (ec) abs = p;

        abs = abs.lexically_normal();
        if (abs == abs.root_path()) return true; // "/"
        if (abs.string().size() <= 1) return true;

        return false;
    }

    //---Немедленное рекурсивное удаление; отсутствующий каталог - успех,
    //   пустой путь - ошибка
    static bool removeTreeNow(const fs::path& dir, std::string* error)
    {
        if (dir.empty())
        {
            if (error) *error = "Refuse to delete: empty path";
            LOG(ERROR) << "Refuse to delete: empty path";
            return false;
        }

        if (isDangerousPath(dir))
        {
            if (error) *error = "Refuse to delete dangerous path: " + dir.string();
            LOG(ERROR) << "Refuse to delete dangerous path: " << dir;
            return false;
        }

        std::error_code ec;
        if (!fs::exists(dir, ec)) return true;

        ec.clear();
        (void)fs::remove_all(dir, ec);
        if (!ec) return true;

        if (error) *error = "remove_all failed for '" + dir.string() + "': " + ec.message();
        return false;
    }

    bool removeInstallDir(const fs::path& installDir, std::string* error)
    {
        return removeTreeNow(installDir, error);
    }

    bool removeDataRoot(const fs::path& dataRoot, std::string* error)
    {
        return removeTreeNow(dataRoot, error);
    }

} // namespace setupcore::platform

#endif
