#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace setupcore::process {

    namespace fs = std::filesystem;

    struct RunOptions final {
        fs::path workingDir;          // Рабочий каталог для запускаемого процесса (опционально)
        bool hideWindow = true;       // Скрыть окно консоли (Windows: CREATE_NO_WINDOW, Linux: игнорируется)
    };

    //---Результат одного запуска. Если launched == false, exitCode не имеет смысла
    struct ExecutionResult final {
        bool launched = false;        // Удалось ли запустить процесс
        int exitCode = 0;             // Код завершения процесса
        std::uint32_t sysError = 0;   // Код системной ошибки (GetLastError() на Windows или errno на Linux)
    };

    //---Запускает внешний процесс и ждёт его завершения
    //
    // Параметры:
    //   exe - путь к исполняемому файлу
    //   args - аргументы командной строки для передачи процессу
    //   opt - опции запуска процесса
    // Возвращает:
    //   результат запуска; launched == false при ошибке запуска
    // Примечание:
    //   Функция блокирующая, таймаута нет - зависший процесс блокирует вызывающего
    ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
        const RunOptions& opt = {});

    //---Интерфейс запуска процессов (шов для тестовых двойников)
    class IProcessRunner {
    public:
        virtual ~IProcessRunner() = default;

        virtual ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
            const RunOptions& opt) = 0;
    };

    //---Реальный запуск через платформенную реализацию
    class SystemProcessRunner final : public IProcessRunner {
    public:
        ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
            const RunOptions& opt) override;
    };

} // namespace setupcore::process
