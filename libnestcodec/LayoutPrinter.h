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

#pragma once

#include <libnestcodec/NestedArray.h>

#include <ostream>
#include <string>

namespace evmnest::codec
{

/**
 * Renders a word buffer as an annotated listing, one line per word:
 *
 *   0x0000: 0x2 // inner array count
 *   0x0001: 0x0 // offset of inner array 0 -> word 0x0003
 *   ...
 *
 * Malformed buffers are printed as far as they can be resolved. Entries pointing outside of the
 * buffer are marked, words no inner array refers to are listed as unreferenced.
 */
class LayoutPrinter
{
public:
	explicit LayoutPrinter(WordsConstRef _buffer): m_buffer(_buffer) {}

	void print(std::ostream& _out) const;
	std::string str() const;

private:
	WordsConstRef m_buffer;
};

inline std::ostream& operator<<(std::ostream& _out, LayoutPrinter const& _printer)
{
	_printer.print(_out);
	return _out;
}

}
