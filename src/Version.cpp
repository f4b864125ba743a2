#include "setup_core/Version.hpp"

#include <string_view>
#include <vector>

namespace setupcore {

	namespace {
		//------------------------------------------------------------
		//	Ошибка разбора версии
		//------------------------------------------------------------
		static bool parseError(Error* error, const std::string& s, const char* reason)
		{
			return fail(error, ErrorKind::VersionParseError,
				"Invalid version '" + s + "': " + reason);
		}
		//------------------------------------------------------------
		//	Разбор одной компоненты: только цифры, не больше kMaxVersionComponent
		//------------------------------------------------------------
		static bool parseComponent(std::string_view part, std::uint32_t& out)
		{
			if (part.empty()) return false;

			std::uint32_t v = 0;
			for (char c : part)
			{
				if (c < '0' || c > '9') return false;
				v = v * 10 + std::uint32_t(c - '0');
				if (v > kMaxVersionComponent) return false;
			}
			out = v;
			return true;
		}
	} // namespace

	//------------------------------------------------------------
	//	Разбор и упаковка версии
	//------------------------------------------------------------
	bool parseVersion(const std::string& s, PackedVersion& out, Error* error)
	{
		if (s.empty()) return parseError(error, s, "empty string");

		//---Разбиваем по '.'
		std::vector<std::string_view> parts;
		std::string_view rest = s;
		while (true)
		{
			const std::size_t dot = rest.find('.');
			parts.push_back(rest.substr(0, dot));
			if (dot == std::string_view::npos) break;
			rest.remove_prefix(dot + 1);
		}

		if ((int)parts.size() > kMaxVersionComponents)
			return parseError(error, s, "too many components");

		//---Упаковка: первая компонента в старших 16 битах
		std::uint64_t packed = 0;
		for (int i = 0; i < kMaxVersionComponents; i++)
		{
			std::uint32_t c = 0;
			if (i < (int)parts.size())
			{
				if (parts[i].empty()) return parseError(error, s, "empty component");
				if (!parseComponent(parts[i], c))
					return parseError(error, s, "component is not an integer in range 0..65535");
			}
			packed = (packed << 16) | c;
		}

		out.value = packed;
		return true;
	}
	//------------------------------------------------------------
	//	Сравнение упакованных версий
	//------------------------------------------------------------
	int compareVersions(const PackedVersion& a, const PackedVersion& b)
	{
		if (a.value < b.value) return -1;
		if (a.value > b.value) return 1;
		return 0;
	}
	//------------------------------------------------------------
	//	"N.N.N.N"
	//------------------------------------------------------------
	std::string toString(const PackedVersion& v)
	{
		std::string s;
		for (int i = kMaxVersionComponents - 1; i >= 0; i--)
		{
			s += std::to_string((v.value >> (16 * i)) & 0xFFFF);
			if (i > 0) s += ".";
		}
		return s;
	}
}; //---namespace setupcore
