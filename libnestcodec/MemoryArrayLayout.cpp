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

#include <libnestcodec/MemoryArrayLayout.h>

#include <libnestcodec/CodecErrors.h>
#include <libnestcodec/NestedArrayCodec.h>

#include <libnestutil/CommonData.h>

#include <fmt/format.h>

#include <range/v3/view/enumerate.hpp>

#include <string>

using namespace evmnest;
using namespace evmnest::codec;
using namespace evmnest::util;

namespace
{

/// @returns the number of bytes taken by a length-prefixed array of @a _length words.
size_t allocationSize(size_t _length)
{
	if (_length >= MemoryImage::maxSize / wordSize)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format("An array of {} words does not fit into memory.", _length))
		);
	return (_length + 1) * wordSize;
}

/// @returns the length of the array at @a _pointer after checking that it lies entirely inside memory.
size_t checkedArrayLength(MemoryImage const& _memory, u256 const& _pointer, std::string const& _description)
{
	if (bigint(_pointer) + wordSize > _memory.size())
		BOOST_THROW_EXCEPTION(
			OffsetOutOfRange() <<
			errinfo_comment(fmt::format(
				"Pointer {} to the {} lies outside of memory of {} bytes.",
				toCompactHexWithPrefix(_pointer),
				_description,
				_memory.size()
			))
		);
	u256 const length = _memory.load(_pointer);
	if (bigint(_pointer) + wordSize + bigint(length) * wordSize > _memory.size())
		BOOST_THROW_EXCEPTION(
			MalformedLength() <<
			errinfo_comment(fmt::format(
				"Length {} of the {} at {} runs past the end of memory of {} bytes.",
				length.str(),
				_description,
				toCompactHexWithPrefix(_pointer),
				_memory.size()
			))
		);
	return static_cast<size_t>(length);
}

}

u256 evmnest::codec::storeNestedArray(MemoryImage& _memory, NestedArray const& _array)
{
	// The zero slot can only stand in for empty arrays if nobody has written to it.
	bool const zeroSlotUsable = _memory.size() >= MemoryImage::zeroSlot + wordSize && _memory.load(MemoryImage::zeroSlot) == 0;

	u256 const pointer = _memory.allocate(allocationSize(_array.size()));
	_memory.store(pointer, _array.size());
	for (auto const& [index, innerArray]: _array | ranges::views::enumerate)
	{
		u256 innerPointer = MemoryImage::zeroSlot;
		if (!innerArray.empty() || !zeroSlotUsable)
		{
			innerPointer = _memory.allocate(allocationSize(innerArray.size()));
			_memory.store(innerPointer, innerArray.size());
			for (size_t i = 0; i < innerArray.size(); ++i)
				_memory.store(innerPointer + wordSize * (i + 1), innerArray[i]);
		}
		_memory.store(pointer + wordSize * (index + 1), innerPointer);
	}
	return pointer;
}

NestedArray evmnest::codec::loadNestedArray(MemoryImage const& _memory, u256 const& _pointer, CodecSettings const& _settings)
{
	size_t const arrayCount = checkedArrayLength(_memory, _pointer, "outer array");

	// Bounded by the memory size, cannot overflow.
	size_t totalWords = 1 + 2 * arrayCount;
	if (totalWords > _settings.maxTotalWords)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format(
				"Encoding {} inner arrays exceeds the limit of {} words.",
				arrayCount,
				_settings.maxTotalWords
			))
		);
	NestedArray result;
	result.reserve(arrayCount);
	for (size_t index = 0; index < arrayCount; ++index)
	{
		u256 const innerPointer = _memory.load(_pointer + wordSize * (index + 1));
		size_t const length = checkedArrayLength(_memory, innerPointer, fmt::format("inner array {}", index));
		totalWords += length;
		if (totalWords > _settings.maxTotalWords)
			BOOST_THROW_EXCEPTION(
				CapacityExceeded() <<
				errinfo_comment(fmt::format(
					"Inner array {} at {} exceeds the limit of {} words.",
					index,
					toCompactHexWithPrefix(innerPointer),
					_settings.maxTotalWords
				)) <<
				errinfo_arrayIndex(index)
			);

		InnerArray& innerArray = result.emplace_back();
		innerArray.reserve(length);
		for (size_t i = 0; i < length; ++i)
			innerArray.emplace_back(_memory.load(innerPointer + wordSize * (i + 1)));
	}
	return result;
}

EncodedBuffer evmnest::codec::encodeFromMemory(MemoryImage const& _memory, u256 const& _pointer, CodecSettings const& _settings)
{
	return NestedArrayCodec{_settings}.encode(loadNestedArray(_memory, _pointer, _settings));
}

u256 evmnest::codec::decodeToMemory(MemoryImage& _memory, WordsConstRef _buffer, CodecSettings const& _settings)
{
	NestedArray const array = NestedArrayCodec{_settings}.decode(_buffer);
	return storeNestedArray(_memory, array);
}
