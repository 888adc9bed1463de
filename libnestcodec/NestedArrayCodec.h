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
 * Codec between nested dynamic arrays of words and their flat, self-contained word-buffer
 * encoding.
 */

#pragma once

#include <libnestcodec/CodecErrors.h>
#include <libnestcodec/CodecSettings.h>
#include <libnestcodec/NestedArray.h>

#include <cstddef>
#include <vector>

namespace evmnest::codec
{

/**
 * Encodes a NestedArray into an EncodedBuffer and decodes it back.
 *
 * Layout (word indices, 0-based):
 *   word[0]          number of inner arrays N
 *   word[1 .. N]     offset table, entry i is the position of the length word of inner array i
 *                    relative to the start of the data region
 *   word[1 + N ..]   data region, for every inner array its length word followed by its elements
 *
 * The codec holds nothing but its settings, so one instance may be used from several threads at once.
 * Encoding never modifies its input and always produces canonical form: offsets ascending in
 * outer-array order with no gaps between the inner arrays and nothing after the last one.
 * Decoding accepts non-canonical but well-formed buffers unless strict canonical checking is enabled,
 * therefore encode(decode(b)) == b only holds for canonical b.
 *
 * All failures are reported by throwing a CodecError subclass.
 */
class NestedArrayCodec
{
public:
	explicit NestedArrayCodec(CodecSettings _settings = CodecSettings::permissive());

	CodecSettings const& settings() const { return m_settings; }

	/// @returns the self-contained encoding of @a _array.
	/// @throws CapacityExceeded if the encoding would be larger than the configured maximum.
	EncodedBuffer encode(NestedArray const& _array) const;

	/// @returns the nested array encoded in @a _buffer. An empty buffer or a header of zero decodes to
	/// the empty nested array.
	/// @throws CapacityExceeded if the buffer or the canonical encoding of the result is larger than
	/// the configured maximum. Offset table entries that share an inner array count once per entry.
	NestedArray decode(WordsConstRef _buffer) const;

	/// Performs every check decode performs, including the size of the result, without materialising it.
	void validate(WordsConstRef _buffer) const;

	/// @returns the number of words the encoding of @a _array occupies, i.e.
	/// 1 + 2 * N + sum of the inner array lengths.
	/// @throws CapacityExceeded if the count overflows or is larger than the configured maximum.
	size_t wordCount(NestedArray const& _array) const;

	/// @returns true if @a _buffer is well-formed and in the exact form encode would produce for
	/// the array it represents.
	static bool isCanonical(WordsConstRef _buffer);

private:
	/// Position of a decoded inner array inside the buffer.
	struct InnerArrayLocation
	{
		/// Absolute word index of the first element.
		size_t start;
		size_t length;
	};

	/// Validates @a _buffer and resolves the offset table into absolute element ranges.
	std::vector<InnerArrayLocation> locateInnerArrays(WordsConstRef _buffer) const;

	CodecSettings m_settings;
};

}
