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

#include <libnestcodec/LayoutPrinter.h>

#include <libnestutil/CommonData.h>

#include <fmt/format.h>

#include <optional>
#include <sstream>
#include <vector>

using namespace evmnest;
using namespace evmnest::codec;
using namespace evmnest::util;

void LayoutPrinter::print(std::ostream& _out) const
{
	if (m_buffer.empty())
	{
		_out << "<empty buffer>\n";
		return;
	}

	size_t const size = m_buffer.size();
	std::vector<std::optional<std::string>> annotations(size);
	annotations[0] = "inner array count";

	bool const tableComplete = m_buffer[0] <= size - 1;
	size_t const arrayCount = tableComplete ? static_cast<size_t>(m_buffer[0]) : size - 1;
	size_t const dataStart = 1 + arrayCount;
	size_t const dataSize = size - dataStart;

	for (size_t index = 0; index < arrayCount; ++index)
	{
		u256 const& offset = m_buffer[1 + index];
		if (!tableComplete || offset >= dataSize)
		{
			annotations[1 + index] = fmt::format("offset of inner array {} -> outside of the data region", index);
			continue;
		}
		size_t const lengthIndex = dataStart + static_cast<size_t>(offset);
		annotations[1 + index] = fmt::format("offset of inner array {} -> word 0x{:04x}", index, lengthIndex);

		size_t const available = size - lengthIndex - 1;
		bool const overruns = m_buffer[lengthIndex] > available;
		if (!annotations[lengthIndex])
			annotations[lengthIndex] = fmt::format(
				"length of inner array {}{}",
				index,
				overruns ? " (runs past the end of the buffer)" : ""
			);
		size_t const length = overruns ? available : static_cast<size_t>(m_buffer[lengthIndex]);
		for (size_t i = 0; i < length; ++i)
			if (!annotations[lengthIndex + 1 + i])
				annotations[lengthIndex + 1 + i] = fmt::format("inner array {} [{}]", index, i);
	}

	for (size_t i = 0; i < size; ++i)
		_out << fmt::format(
			"0x{:04x}: {} // {}\n",
			i,
			toCompactHexWithPrefix(m_buffer[i]),
			annotations[i].value_or("unreferenced")
		);

	if (!tableComplete)
		_out << fmt::format("// header claims {} inner arrays, buffer ends after {} offsets\n", m_buffer[0].str(), arrayCount);
}

std::string LayoutPrinter::str() const
{
	std::ostringstream out;
	print(out);
	return out.str();
}
