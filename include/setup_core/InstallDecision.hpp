#pragma once
#include <optional>
#include <string>

#include "Error.hpp"
#include "KeyValueStore.hpp"

namespace setupcore {

	class Interaction;

	//---Решение об установке
	enum class InstallDecision {
		Fresh,				//	Предыдущей версии нет
		Repair,				//	Та же версия (нужно подтверждение)
		Upgrade,			//	Более новая версия (нужно подтверждение)
		RejectDowngrade		//	Установлена более новая версия - отказ
	};

	const char* toString(InstallDecision d);

	//---Чистая функция решения: installed == nullopt -> Fresh.
	//   Ошибка разбора любой из версий -> VersionParseError (incoming проверяется и для Fresh)
	bool decideInstall(const std::optional<std::string>& installed, const std::string& incoming,
		InstallDecision& out, Error* error);

	//---Единственный шлюз перед любыми изменениями системы
	class InstallDecisionEngine final {
	public:
		InstallDecisionEngine(IKeyValueStore& store, StoreKey versionKey, Interaction& ui);

		//---Читает установленную версию, принимает решение и спрашивает подтверждение.
		//   true - можно продолжать. false - error: RejectDowngrade, Cancelled,
		//   VersionParseError или StoreFailure
		bool evaluate(const std::string& incoming, InstallDecision& decision, Error* error);

		//---Запись установленной версии после успешной настройки
		bool recordInstalled(const std::string& version, Error* error);

		//---Удаление записи о версии при деинсталляции
		bool clearInstalled(Error* error);

	private:
		IKeyValueStore& store_;
		StoreKey versionKey_;
		Interaction& ui_;
	};

};//---namespace setupcore
