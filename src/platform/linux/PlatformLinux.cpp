#if defined(__linux__)
#include "platform/PlatformImpl.hpp"
#include "setup_core/KeyValueStore.hpp"
#include "setup_core/Prompt.hpp"

#include <sys/utsname.h>
#include <unistd.h>
#include <cstdio>
#include <iostream>
#include <vector>

namespace setupcore::platform {

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
	}
	//---Проверка, что процесс запущен с правами root
	bool isElevated()
	{
		return ::geteuid() == 0;
	}
	//---Системный каталог утилит
	fs::path systemDir()
	{
		return fs::path("/usr/bin");
	}
	//---Каталог данных по умолчанию
	fs::path defaultDataRoot()
	{
		return fs::path("/var/lib/kolibri");
	}
	//---Версия ядра "6.1.0-..." → 6.1.0
	OsVersion osVersion()
	{
		OsVersion v;
		struct utsname u{};
		if (::uname(&u) != 0) return v;

		unsigned major = 0, minor = 0, build = 0;
		if (std::sscanf(u.release, "%u.%u.%u", &major, &minor, &build) >= 1)
		{
			v.major = major;
			v.minor = minor;
			v.build = build;
		}
		return v;
	}
	//---Реестра на Linux нет
	std::unique_ptr<IKeyValueStore> makeKeyValueStore()
	{
		return nullptr;
	}
	//---Диалоги через консоль
	std::unique_ptr<IUserPrompt> makePrompt()
	{
		return std::make_unique<ConsolePrompt>(std::cin, std::cout);
	}

} // namespace setupcore::platform
#endif
