#pragma once
#include <cstdint>
#include <string>

#include "Error.hpp"

namespace setupcore {

	//---Упакованная версия: до 4 компонент по 16 бит в одном 64-битном числе.
	//   "1.2.10" -> 0x0001'0002'000A'0000. Числовое сравнение value совпадает
	//   с покомпонентным сравнением версий
	struct PackedVersion final {
		std::uint64_t value = 0;

		auto operator<=>(const PackedVersion&) const = default;
	};

	//---Максимальное число компонент и максимальное значение компоненты
	inline constexpr int kMaxVersionComponents = 4;
	inline constexpr std::uint32_t kMaxVersionComponent = 0xFFFF;

	//---Разбор строки "N.N.N". Ошибка (VersionParseError) для пустой строки,
	//   пустых компонент ("1..2"), нецифровых символов, переполнения компоненты
	//   и более чем 4 компонент. Усечения нет
	bool parseVersion(const std::string& s, PackedVersion& out, Error* error);

	//---Сравнение: -1 (a < b), 0, 1 (a > b)
	int compareVersions(const PackedVersion& a, const PackedVersion& b);

	//---Обратное преобразование в "N.N.N.N" (для логов)
	std::string toString(const PackedVersion& v);

};//---namespace setupcore
