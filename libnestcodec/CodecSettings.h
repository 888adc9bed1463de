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

#include <cstddef>

namespace evmnest::codec
{

/// Options recognised by the encode and decode operations.
struct CodecSettings
{
	/// 2^24 words, i.e. 512 MiB worth of 256-bit words.
	static size_t constexpr defaultMaxTotalWords = size_t(1) << 24;

	/// Accept every well-formed buffer, including ones with gaps, overlaps or out-of-order data.
	static CodecSettings permissive()
	{
		return {};
	}
	/// Only accept buffers in the exact form produced by encoding.
	static CodecSettings strict()
	{
		CodecSettings s;
		s.strictCanonical = true;
		return s;
	}

	bool operator==(CodecSettings const& _other) const
	{
		return
			strictCanonical == _other.strictCanonical &&
			maxTotalWords == _other.maxTotalWords;
	}
	bool operator!=(CodecSettings const& _other) const { return !(*this == _other); }

	/// Reject buffers whose offset table is not ascending and gap-free or which carry trailing words.
	bool strictCanonical = false;
	/// Upper bound for the size of both the produced and the accepted buffers, in words.
	size_t maxTotalWords = defaultMaxTotalWords;
};

}
