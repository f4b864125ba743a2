#pragma once
#include <optional>
#include <string>

#include "Error.hpp"

namespace setupcore {

	//---Область хранения
	enum class Scope {
		Machine,		//	Для всей машины (HKLM)
		User			//	Для текущего пользователя (HKCU)
	};

	//---Адрес значения: область + ключ + имя значения
	struct StoreKey final {
		Scope scope = Scope::Machine;
		std::string path;				//	например "SOFTWARE\\Kolibri"
		std::string name;				//	имя значения
	};

	//---Хранилище ключ-значение (реестр на Windows, память в тестах).
	//   set/remove идемпотентны: повторный set перезаписывает, remove отсутствующего - успех
	class IKeyValueStore {
	public:
		virtual ~IKeyValueStore() = default;

		//---nullopt если значения нет; ошибка чтения -> false
		virtual bool get(const StoreKey& key, std::optional<std::string>& out, Error* error) = 0;
		virtual bool set(const StoreKey& key, const std::string& value, Error* error) = 0;
		virtual bool remove(const StoreKey& key, Error* error) = 0;
	};

};//---namespace setupcore
