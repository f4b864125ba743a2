#pragma once
#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "setup_core/Config.hpp"
#include "setup_core/KeyValueStore.hpp"
#include "setup_core/Process.hpp"
#include "setup_core/Prompt.hpp"

namespace setupcore::test {

	namespace fs = std::filesystem;

	//---Пути к утилитам в тестах: процессы не запускаются, важны только имена файлов
	inline ToolPaths fakeTools()
	{
		ToolPaths t;
		t.sc = "/sys32/sc.exe";
		t.serviceWrapper = "/app/nssm.exe";
		t.taskkill = "/sys32/taskkill.exe";
		t.icacls = "/sys32/icacls.exe";
		return t;
	}

	//---Один запуск: имя утилиты + аргументы
	struct Call {
		std::string tool;
		std::vector<std::string> args;
	};

	//---Модель менеджера служб, которую видят sc.exe и nssm.exe
	struct ServiceState {
		bool running = false;
		std::map<std::string, std::string> props;

		bool operator==(const ServiceState&) const = default;
	};

	//------------------------------------------------------------
	//	Двойник запуска процессов: моделирует sc/nssm/taskkill/icacls.
	//	exitCodes и failLaunch переопределяют модель по ключу
	//	"sc.exe stop", "nssm.exe set", "taskkill.exe", "icacls.exe"
	//------------------------------------------------------------
	class FakeProcessRunner final : public process::IProcessRunner {
	public:
		process::ExecutionResult run(const fs::path& exe, const std::vector<std::string>& args,
			const process::RunOptions&) override
		{
			const std::string tool = exe.filename().string();
			calls.push_back({ tool, args });

			const std::string key = keyOf(tool, args);
			if (failLaunch.count(key) || failLaunch.count(tool))
			{
				return process::ExecutionResult{ false, 0, 2 };
			}
			if (auto it = exitCodes.find(key); it != exitCodes.end())
			{
				return process::ExecutionResult{ true, it->second, 0 };
			}
			return process::ExecutionResult{ true, simulate(tool, args), 0 };
		}

		//---Сколько раз вызывалась команда с ключом key
		int count(const std::string& key) const
		{
			int n = 0;
			for (const auto& c : calls) if (keyOf(c.tool, c.args) == key) n++;
			return n;
		}

		static std::string keyOf(const std::string& tool, const std::vector<std::string>& args)
		{
			if ((tool == "sc.exe" || tool == "nssm.exe") && !args.empty()) return tool + " " + args[0];
			return tool;
		}

		std::vector<Call> calls;
		std::map<std::string, int> exitCodes;
		std::set<std::string> failLaunch;

		std::map<std::string, ServiceState> services;
		std::set<std::string> runningImages;
		std::map<std::string, std::set<std::string>> acl;

	private:
		static std::string join(const std::vector<std::string>& v, std::size_t from)
		{
			std::string s;
			for (std::size_t i = from; i < v.size(); i++)
			{
				if (i > from) s += " ";
				s += v[i];
			}
			return s;
		}

		int simulate(const std::string& tool, const std::vector<std::string>& a)
		{
			if (tool == "sc.exe" && a.size() >= 2)
			{
				auto it = services.find(a[1]);
				if (a[0] == "query") return it != services.end() ? 0 : 1060;
				if (it == services.end()) return 1060;

				ServiceState& s = it->second;
				if (a[0] == "start")
				{
					if (s.running) return 1056;
					if (s.props["Start"] == "SERVICE_DISABLED") return 1058;
					s.running = true;
					return 0;
				}
				if (a[0] == "stop")
				{
					if (!s.running) return 1062;
					s.running = false;
					return 0;
				}
				if (a[0] == "delete")
				{
					services.erase(it);
					return 0;
				}
				return 1;
			}
			if (tool == "nssm.exe" && a.size() >= 3)
			{
				if (a[0] == "install")
				{
					if (services.count(a[1])) return 5;
					ServiceState s;
					s.props["Application"] = a[2];
					s.props["AppParameters"] = join(a, 3);
					s.props["AppDirectory"] = fs::path(a[2]).parent_path().string();
					s.props["ObjectName"] = "LocalSystem";
					s.props["Start"] = "SERVICE_AUTO_START";
					services[a[1]] = s;
					return 0;
				}
				if (a[0] == "set")
				{
					auto it = services.find(a[1]);
					if (it == services.end()) return 3;
					it->second.props[a[2]] = join(a, 3);
					return 0;
				}
				return 1;
			}
			if (tool == "taskkill.exe" && a.size() == 3)
			{
				return runningImages.erase(a[2]) ? 0 : 128;
			}
			if (tool == "icacls.exe" && a.size() >= 3)
			{
				const std::string grant = a[2];
				acl[a[0]].insert(grant.substr(0, grant.find(':')));
				return 0;
			}
			return 1;
		}
	};

	//------------------------------------------------------------
	//	Хранилище ключ-значение в памяти
	//------------------------------------------------------------
	class MemoryKeyValueStore final : public IKeyValueStore {
	public:
		bool get(const StoreKey& key, std::optional<std::string>& out, Error* error) override
		{
			if (failAll) return fail(error, ErrorKind::StoreFailure, "read failed");
			auto it = values.find(id(key));
			out = it == values.end() ? std::nullopt : std::optional<std::string>(it->second);
			return true;
		}
		bool set(const StoreKey& key, const std::string& value, Error* error) override
		{
			if (failAll) return fail(error, ErrorKind::StoreFailure, "write failed");
			values[id(key)] = value;
			return true;
		}
		bool remove(const StoreKey& key, Error* error) override
		{
			if (failAll) return fail(error, ErrorKind::StoreFailure, "delete failed");
			values.erase(id(key));
			return true;
		}

		void put(const StoreKey& key, const std::string& value) { values[id(key)] = value; }

		std::optional<std::string> value(const StoreKey& key) const
		{
			auto it = values.find(id(key));
			if (it == values.end()) return std::nullopt;
			return it->second;
		}

		static std::string id(const StoreKey& key)
		{
			return std::string(key.scope == Scope::Machine ? "HKLM\\" : "HKCU\\") + key.path + "\\" + key.name;
		}

		std::map<std::string, std::string> values;
		bool failAll = false;
	};

	//------------------------------------------------------------
	//	Диалоги с заранее заданными ответами
	//------------------------------------------------------------
	class ScriptedPrompt final : public IUserPrompt {
	public:
		bool askYesNo(const std::string& question) override
		{
			questions.push_back(question);
			if (answers.empty()) return false;
			const bool a = answers.front();
			answers.pop_front();
			return a;
		}
		void showError(const std::string& message) override { errors.push_back(message); }

		std::deque<bool> answers;
		std::vector<std::string> questions;
		std::vector<std::string> errors;
	};

	//------------------------------------------------------------
	//	Временный каталог, удаляемый в деструкторе
	//------------------------------------------------------------
	class TempDir final {
	public:
		explicit TempDir(const std::string& name)
			: path_(fs::temp_directory_path() / ("setup_core_test_" + name))
		{
			std::error_code ec;
			fs::remove_all(path_, ec);
			fs::create_directories(path_);
		}
		~TempDir()
		{
			std::error_code ec;
			fs::remove_all(path_, ec);
		}
		TempDir(const TempDir&) = delete;
		TempDir& operator=(const TempDir&) = delete;

		const fs::path& path() const { return path_; }

	private:
		fs::path path_;
	};

} // namespace setupcore::test
