#include "setup_core/Process.hpp"
#include "platform/ProcessImpl.hpp"

namespace setupcore::process {

// Реализация публичной функции запуска процесса
// Делегирует выполнение detail::runPlatform(), которая содержит реальную
// реализацию для конкретной операционной системы (Windows/Linux)
    ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
        const RunOptions& opt)
    {
        ExecutionResult out;
        (void)detail::runPlatform(exe, args, out, opt);
        return out;
    }

    ExecutionResult SystemProcessRunner::run(const fs::path& exe, const std::vector<std::string>& args,
        const RunOptions& opt)
    {
        return process::run(exe, args, opt);
    }

} // namespace setupcore::process
