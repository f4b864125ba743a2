#include "setup_core/ServiceLifecycle.hpp"
#include "setup_core/IServiceBackend.hpp"
#include "setup_core/Paths.hpp"
#include "setup_core/SystemCommands.hpp"

#include <system_error>
#include <utility>
#include <glog/logging.h>

namespace setupcore {

	namespace {
		//------------------------------------------------------------
		//	Значение свойства Start обёртки служб
		//------------------------------------------------------------
		static const char* startValue(StartType t)
		{
			return t == StartType::Automatic ? "SERVICE_AUTO_START" : "SERVICE_DISABLED";
		}
		//------------------------------------------------------------
		//	Создание каталога, если он не существует
		//------------------------------------------------------------
		static bool ensureDirectory(const fs::path& dir, Error* error)
		{
			std::error_code ec;
			if (fs::exists(dir, ec)) return true;

			fs::create_directories(dir, ec);
			if (ec)
			{
				LOG(ERROR) << "Error creating directory " << dir << ": " << ec.message();
				return fail(error, ErrorKind::FilesystemFailure,
					"Failed to create directory '" + pathToUtf8(dir) + "': " + ec.message());
			}
			LOG(INFO) << "Directory created: " << dir;
			return true;
		}
	} // namespace

	//------------------------------------------------------------
	const char* toString(StartType t)
	{
		return t == StartType::Automatic ? "Automatic" : "Disabled";
	}
	//------------------------------------------------------------
	ServiceLifecycleManager::ServiceLifecycleManager(IServiceBackend& backend, SystemCommands& sys,
		IKeyValueStore& store, AutostartEntry tray)
		: backend_(backend), sys_(sys), store_(store), tray_(std::move(tray))
	{
	}
	//------------------------------------------------------------
	bool ServiceLifecycleManager::apply(const ServiceSpec& spec, Error* error)
	{
		return apply(spec, spec.startType == StartType::Automatic, error);
	}
	//------------------------------------------------------------
	//	Применение спецификации службы целиком
	//------------------------------------------------------------
	bool ServiceLifecycleManager::apply(const ServiceSpec& spec, bool enabled, Error* error)
	{
		if (spec.name.empty()) return fail(error, ErrorKind::InvalidArgument, "apply: empty service name");
		if (spec.exeAbs.empty()) return fail(error, ErrorKind::InvalidArgument, "apply: empty executable path");
		if (spec.account.empty()) return fail(error, ErrorKind::InvalidArgument, "apply: empty run-as account");
		if (spec.dataDir.empty()) return fail(error, ErrorKind::InvalidArgument, "apply: empty data directory");

		LOG(INFO) << "Configuring service " << spec.name << " (start type: "
			<< toString(enabled ? StartType::Automatic : StartType::Disabled) << ")";

		//---1-2. Регистрация или обновление
		if (!createOrUpdate(spec, error)) return false;
		//---3. Общая настройка в фиксированном порядке
		if (!applyCommon(spec, error)) return false;
		//---4. Тип запуска и запуск/остановка
		if (!applyStartType(spec, enabled, error)) return false;
		//---5. Автозапуск приложения в трее
		if (!applyTrayAutostart(enabled, error)) return false;

		LOG(INFO) << "Service " << spec.name << " configured";
		return true;
	}
	//------------------------------------------------------------
	//	Существующая служба - три отдельных свойства (остальные метаданные сохраняются),
	//	новая - одна команда регистрации
	//------------------------------------------------------------
	bool ServiceLifecycleManager::createOrUpdate(const ServiceSpec& spec, Error* error)
	{
		bool exists = false;
		if (!backend_.exists(spec.name, exists, error)) return false;

		if (exists)
		{
			if (!backend_.setProperty(spec.name, "Application", { pathToUtf8(spec.exeAbs) }, error)) return false;
			if (!backend_.setProperty(spec.name, "AppParameters", { spec.args }, error)) return false;
			if (!backend_.setProperty(spec.name, "AppDirectory", { pathToUtf8(spec.workingDir) }, error)) return false;
			return true;
		}

		if (!backend_.install(spec.name, spec.exeAbs, spec.args, error)) return false;

		//---Обёртка по умолчанию берёт каталог exe; другой каталог задаём сразу,
		//   чтобы первый прогон давал то же состояние, что и повторный
		if (!spec.workingDir.empty() && spec.workingDir != spec.exeAbs.parent_path())
		{
			if (!backend_.setProperty(spec.name, "AppDirectory", { pathToUtf8(spec.workingDir) }, error)) return false;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Учётная запись, права службы, права пользователей, описание
	//------------------------------------------------------------
	bool ServiceLifecycleManager::applyCommon(const ServiceSpec& spec, Error* error)
	{
		if (!backend_.setProperty(spec.name, "ObjectName", { spec.account }, error)) return false;

		if (!ensureDirectory(spec.dataDir, error)) return false;
		if (!sys_.grantModify(spec.dataDir, spec.serviceGrantee, error)) return false;
		if (!sys_.grantModify(spec.dataDir, spec.usersGrantee, error)) return false;

		const std::string& description = spec.description.empty() ? spec.name : spec.description;
		return backend_.setProperty(spec.name, "Description", { description }, error);
	}
	//------------------------------------------------------------
	//	Включена: Automatic + запуск.
	//	Выключена: остановка "по возможности" (могла работать с прошлой настройки) + Disabled
	//------------------------------------------------------------
	bool ServiceLifecycleManager::applyStartType(const ServiceSpec& spec, bool enabled, Error* error)
	{
		if (enabled)
		{
			if (!backend_.setProperty(spec.name, "Start", { startValue(StartType::Automatic) }, error)) return false;
			return backend_.start(spec.name, error);
		}

		int code = 0;
		if (!backend_.stopBestEffort(spec.name, &code, error)) return false;

		return backend_.setProperty(spec.name, "Start", { startValue(StartType::Disabled) }, error);
	}
	//------------------------------------------------------------
	//	Запись автозапуска: установить или удалить (не добавлять)
	//------------------------------------------------------------
	bool ServiceLifecycleManager::applyTrayAutostart(bool enabled, Error* error)
	{
		if (enabled)
		{
			LOG(INFO) << "Tray autostart: set " << tray_.key.path << "\\" << tray_.key.name;
			return store_.set(tray_.key, tray_.value, error);
		}
		LOG(INFO) << "Tray autostart: remove " << tray_.key.path << "\\" << tray_.key.name;
		return store_.remove(tray_.key, error);
	}
}; //---namespace setupcore
