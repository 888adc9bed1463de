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
 * Conversion between word buffers and flat byte strings. Every word is stored big-endian in a
 * fixed number of bytes, 32 by default.
 */

#pragma once

#include <libnestcodec/CodecSettings.h>
#include <libnestcodec/NestedArray.h>

#include <libnestutil/Common.h>

namespace evmnest::codec
{

/// @returns @a _words as a byte string of @a _wordWidth bytes per word.
/// @throws CapacityExceeded if a word does not fit into @a _wordWidth bytes.
bytes toBytes(WordsConstRef _words, size_t _wordWidth = wordSize);

/// @returns the words stored in @a _data.
/// @throws TruncatedBuffer if the length of @a _data is not a multiple of @a _wordWidth.
EncodedBuffer fromBytes(bytesConstRef _data, size_t _wordWidth = wordSize);

/// Encodes @a _array and serialises the result.
bytes encodeToBytes(NestedArray const& _array, CodecSettings const& _settings = {}, size_t _wordWidth = wordSize);

/// Parses @a _data into words and decodes them.
NestedArray decodeFromBytes(bytesConstRef _data, CodecSettings const& _settings = {}, size_t _wordWidth = wordSize);

}
