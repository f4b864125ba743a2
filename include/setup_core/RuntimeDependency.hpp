#pragma once
#include <cstdint>

#include "KeyValueStore.hpp"

namespace setupcore {

	//---Версия ОС
	struct OsVersion final {
		std::uint32_t major = 0;
		std::uint32_t minor = 0;
		std::uint32_t build = 0;
	};

	//---Минимальное поколение ОС, которое поддерживает установщик зависимости (Windows 10)
	inline constexpr std::uint32_t kRuntimeMinOsMajor = 10;

	//---Места регистрации общей среды выполнения (WebView2 Evergreen Runtime)
	StoreKey runtimeMachineKey();
	StoreKey runtimeUserKey();

	//---Проверка наличия общей среды выполнения
	class RuntimeDependencyDetector final {
	public:
		RuntimeDependencyDetector(IKeyValueStore& store, OsVersion os);

		//---Зарегистрирована в области машины или пользователя
		bool isPresent();

		//---false на поколениях ОС старше kRuntimeMinOsMajor
		bool shouldInstall() const;

		//---Нужно ли запускать установщик зависимости
		bool installRequired() { return !isPresent() && shouldInstall(); }

	private:
		bool presentAt(const StoreKey& key);

		IKeyValueStore& store_;
		OsVersion os_;
	};

};//---namespace setupcore
