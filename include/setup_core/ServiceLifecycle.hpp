#pragma once
#include <string>

#include "Error.hpp"
#include "KeyValueStore.hpp"
#include "ServiceSpec.hpp"

namespace setupcore {

	class IServiceBackend;
	class SystemCommands;

	//---Запись автозапуска приложения в трее
	struct AutostartEntry final {
		StoreKey key;
		std::string value;		//	Команда запуска
	};

	//---Приводит службу к состоянию ServiceSpec.
	//   apply() идемпотентна: из любого начального состояния (нет службы, устаревшая,
	//   уже правильная) результат один и тот же
	class ServiceLifecycleManager final {
	public:
		ServiceLifecycleManager(IServiceBackend& backend, SystemCommands& sys,
			IKeyValueStore& store, AutostartEntry tray);

		//---Создание/обновление службы, права, описание, тип запуска, запуск/остановка,
		//   автозапуск трея. Любая ошибка, кроме остановки "по возможности", прерывает применение
		bool apply(const ServiceSpec& spec, bool enabled, Error* error);

		//---То же, enabled берётся из spec.startType
		bool apply(const ServiceSpec& spec, Error* error);

	private:
		bool createOrUpdate(const ServiceSpec& spec, Error* error);
		bool applyCommon(const ServiceSpec& spec, Error* error);
		bool applyStartType(const ServiceSpec& spec, bool enabled, Error* error);
		bool applyTrayAutostart(bool enabled, Error* error);

		IServiceBackend& backend_;
		SystemCommands& sys_;
		IKeyValueStore& store_;
		AutostartEntry tray_;
	};

};//---namespace setupcore
