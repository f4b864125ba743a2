#ifdef _WIN32

#include "platform/PlatformImpl.hpp"
#include "setup_core/Prompt.hpp"

#include <windows.h>
#include <memory>
#include <string>

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

    //---Диалоги MessageBox (помощник запускается без консоли)
    class MessageBoxPrompt final : public IUserPrompt {
    public:
        bool askYesNo(const std::string& question) override
        {
            const int rc = MessageBoxW(nullptr, utf8ToWide(question).c_str(), L"Setup",
                MB_YESNO | MB_ICONQUESTION | MB_SETFOREGROUND | MB_TOPMOST);
            return rc == IDYES;
        }
        void showError(const std::string& message) override
        {
            MessageBoxW(nullptr, utf8ToWide(message).c_str(), L"Setup",
                MB_OK | MB_ICONERROR | MB_SETFOREGROUND | MB_TOPMOST);
        }
    };

    } // namespace

} // namespace setupcore

namespace setupcore::platform {

    //---Диалоги для Windows
    std::unique_ptr<IUserPrompt> makePrompt()
    {
        return std::make_unique<setupcore::MessageBoxPrompt>();
    }

} // namespace setupcore::platform

#endif
