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
/**
 * Byte-addressable model of VM scratch memory, read and written in 32-byte words.
 */

#pragma once

#include <libnestutil/Common.h>

#include <ostream>

namespace evmnest::codec
{

/**
 * Memory is a byte array that grows in whole words. Reads never grow it: loading a word that is not
 * entirely inside the current size fails with OffsetOutOfRange.
 *
 * The first four words follow the usual compiler convention: two scratch words, the free memory
 * pointer at 0x40 and the zero slot at 0x60. Allocation bumps the free memory pointer.
 */
class MemoryImage
{
public:
	static size_t constexpr freeMemoryPointerSlot = 0x40;
	static size_t constexpr zeroSlot = 0x60;
	static size_t constexpr initialFreeMemory = 0x80;
	/// Memory beyond this size is never allocated or written.
	static size_t constexpr maxSize = size_t(1) << 32;

	/// Creates memory of 0x80 bytes with the free memory pointer initialised.
	MemoryImage();
	/// Creates memory with the given contents, padded with zeros to a multiple of the word size.
	explicit MemoryImage(bytes _contents);

	size_t size() const { return m_memory.size(); }
	bytes const& data() const { return m_memory; }

	/// @returns the word starting at byte @a _offset.
	u256 load(u256 const& _offset) const;
	/// Stores @a _value at byte @a _offset, growing memory if needed.
	void store(u256 const& _offset, u256 const& _value);

	u256 freeMemoryPointer() const { return load(freeMemoryPointerSlot); }
	/// Reserves @a _size bytes (rounded up to whole words) at the free memory pointer, advances it and
	/// @returns the start of the reserved area.
	u256 allocate(size_t _size);

	bool operator==(MemoryImage const& _other) const { return m_memory == _other.m_memory; }

private:
	/// Grows memory so that it covers at least @a _end bytes.
	void grow(size_t _end);

	bytes m_memory;
};

/// Hex dump with 32 bytes per line, each line prefixed by its byte offset.
std::ostream& operator<<(std::ostream& _out, MemoryImage const& _memory);

}
