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
 * Nested arrays in VM memory.
 *
 * In memory, a nested array is a length word followed by one absolute pointer per inner array.
 * Each pointer refers to a length word followed by the elements of that inner array. Empty inner
 * arrays share the zero slot. Encoding from memory chases these pointers and replaces them by
 * offsets relative to the data region of a fresh buffer; decoding into memory does the reverse.
 */

#pragma once

#include <libnestcodec/CodecSettings.h>
#include <libnestcodec/MemoryImage.h>
#include <libnestcodec/NestedArray.h>

namespace evmnest::codec
{

/// Allocates @a _array in @a _memory and @returns the pointer to its length word.
u256 storeNestedArray(MemoryImage& _memory, NestedArray const& _array);

/// Reads the nested array whose length word is at @a _pointer.
/// @throws OffsetOutOfRange if a pointer leaves memory, MalformedLength if an array runs past its end
/// and CapacityExceeded if its encoding would exceed the configured maximum.
NestedArray loadNestedArray(MemoryImage const& _memory, u256 const& _pointer, CodecSettings const& _settings = {});

/// Encodes the nested array at @a _pointer without modifying @a _memory.
EncodedBuffer encodeFromMemory(MemoryImage const& _memory, u256 const& _pointer, CodecSettings const& _settings = {});

/// Decodes @a _buffer into newly allocated memory and @returns the pointer to the outer array.
/// Memory is left untouched if decoding fails.
u256 decodeToMemory(MemoryImage& _memory, WordsConstRef _buffer, CodecSettings const& _settings = {});

}
