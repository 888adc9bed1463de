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

#include <libnestcodec/MemoryImage.h>

#include <libnestcodec/CodecErrors.h>

#include <libnestutil/CommonData.h>

#include <fmt/format.h>

#include <utility>

using namespace evmnest;
using namespace evmnest::codec;
using namespace evmnest::util;

namespace
{

size_t roundUpToWords(size_t _size)
{
	return (_size + wordSize - 1) / wordSize * wordSize;
}

}

MemoryImage::MemoryImage()
{
	grow(initialFreeMemory);
	store(freeMemoryPointerSlot, initialFreeMemory);
}

MemoryImage::MemoryImage(bytes _contents):
	m_memory(std::move(_contents))
{
	if (m_memory.size() > maxSize)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format("Memory of {} bytes exceeds the limit of {} bytes.", m_memory.size(), maxSize))
		);
	m_memory.resize(roundUpToWords(m_memory.size()));
}

u256 MemoryImage::load(u256 const& _offset) const
{
	if (_offset > m_memory.size() || m_memory.size() - static_cast<size_t>(_offset) < wordSize)
		BOOST_THROW_EXCEPTION(
			OffsetOutOfRange() <<
			errinfo_comment(fmt::format(
				"Word at {} lies outside of memory of {} bytes.",
				toCompactHexWithPrefix(_offset),
				m_memory.size()
			))
		);
	size_t const offset = static_cast<size_t>(_offset);
	return fromBigEndian<u256>(bytesConstRef(m_memory).subspan(offset, wordSize));
}

void MemoryImage::store(u256 const& _offset, u256 const& _value)
{
	if (_offset > maxSize - wordSize)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format(
				"Storing a word at {} exceeds the memory limit of {} bytes.",
				toCompactHexWithPrefix(_offset),
				maxSize
			))
		);
	size_t const offset = static_cast<size_t>(_offset);
	grow(offset + wordSize);
	toBigEndian(_value, std::span<uint8_t>(m_memory).subspan(offset, wordSize));
}

u256 MemoryImage::allocate(size_t _size)
{
	u256 const pointer = freeMemoryPointer();
	u256 const newFreeMemoryPointer = pointer + roundUpToWords(_size);
	if (newFreeMemoryPointer > maxSize || newFreeMemoryPointer < pointer)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format(
				"Allocating {} bytes at {} exceeds the memory limit of {} bytes.",
				_size,
				toCompactHexWithPrefix(pointer),
				maxSize
			))
		);
	grow(static_cast<size_t>(newFreeMemoryPointer));
	store(freeMemoryPointerSlot, newFreeMemoryPointer);
	return pointer;
}

void MemoryImage::grow(size_t _end)
{
	if (_end > m_memory.size())
		m_memory.resize(roundUpToWords(_end));
}

std::ostream& evmnest::codec::operator<<(std::ostream& _out, MemoryImage const& _memory)
{
	bytesConstRef const data(_memory.data());
	for (size_t offset = 0; offset < data.size(); offset += wordSize)
		_out << fmt::format("0x{:04x}: {}\n", offset, toHex(data.subspan(offset, wordSize)));
	return _out;
}
