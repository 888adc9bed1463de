/*
	This file is part of evmnest.

	evmnest is free software: you can redistribute it and/or modify
	it under the terms of the GNU General Public License as published by
	the Free Software Foundation, either version 3 of the License, or
	(at your option) any later version.

	evmnest is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with evmnest.  If not, see <http://www.gnu.org/licenses/>.
*/
// SPDX-License-Identifier: GPL-3.0

#include <libnestutil/CommonData.h>

#include <libnestutil/Assertions.h>

#include <fmt/format.h>

using namespace evmnest;
using namespace evmnest::util;

std::string evmnest::util::toHex(bytesConstRef _data, HexPrefix _prefix, HexCase _case)
{
	std::string ret(_data.size() * 2 + (_prefix == HexPrefix::Add ? 2 : 0), '0');

	size_t i = 0;
	if (_prefix == HexPrefix::Add)
	{
		ret[i++] = '0';
		ret[i++] = 'x';
	}

	char const* chars = _case == HexCase::Upper ? "0123456789ABCDEF" : "0123456789abcdef";
	for (uint8_t c: _data)
	{
		ret[i++] = chars[(c >> 4ul) & 0xfu];
		ret[i++] = chars[c & 0xfu];
	}
	nestAssert(i == ret.size());

	return ret;
}

std::string evmnest::util::toCompactHexWithPrefix(u256 const& _value)
{
	if (_value == 0)
		return "0x0";

	bytes encoded(bytesRequired(_value));
	toBigEndian(_value, encoded);
	std::string hex = toHex(encoded);
	if (hex.front() == '0')
		hex.erase(0, 1);
	return fmt::format("0x{}", hex);
}

unsigned evmnest::util::bytesRequired(u256 _value)
{
	unsigned i = 0;
	for (; _value != 0; ++i, _value >>= 8) {}
	return i;
}

std::optional<size_t> evmnest::util::checkedAdd(size_t _a, size_t _b)
{
	if (_a > std::numeric_limits<size_t>::max() - _b)
		return std::nullopt;
	return _a + _b;
}
