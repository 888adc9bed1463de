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

#include <libnestcodec/NestedArray.h>

#include <fmt/format.h>

using namespace evmnest;
using namespace evmnest::codec;

std::string evmnest::codec::toString(NestedArray const& _array)
{
	std::string result = "[";
	for (size_t i = 0; i < _array.size(); ++i)
	{
		if (i > 0)
			result += ",";
		result += "[";
		for (size_t j = 0; j < _array[i].size(); ++j)
			result += fmt::format("{}{}", j > 0 ? "," : "", _array[i][j].str());
		result += "]";
	}
	return result + "]";
}
