#pragma once
#include "setup_core/Process.hpp"

namespace setupcore::process::detail {

    //---Запуск и ожидание процесса средствами ОС (ProcessWin.cpp / ProcessLinux.cpp).
    //   out заполняется всегда. false - процесс не запущен или код завершения
    //   не удалось получить (out.launched == false, out.sysError - код ОС)
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        ExecutionResult& out, const RunOptions& opt);

} // namespace setupcore::process::detail
