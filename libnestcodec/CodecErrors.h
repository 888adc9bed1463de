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
 * Errors reported by the nested array codec. Every failure is deterministic given the same
 * input and is reported to the immediate caller; there is no partial result.
 */

#pragma once

#include <libnestutil/Exceptions.h>

#include <cstddef>
#include <ostream>
#include <string_view>

namespace evmnest::codec
{

enum class CodecErrorKind
{
	/// A word count, offset or length does not fit the configured or natural integer range.
	CapacityExceeded,
	/// The buffer is shorter than its header and offset table claim.
	TruncatedBuffer,
	/// An offset table entry references data outside of the data region.
	OffsetOutOfRange,
	/// A length word implies an inner array extending past the end of the buffer.
	MalformedLength,
	/// Strict canonical checking is enabled and the buffer is not packed in outer-array order.
	NonCanonicalBuffer,
};

std::string_view errorKindName(CodecErrorKind _kind);
std::ostream& operator<<(std::ostream& _out, CodecErrorKind _kind);

/// Base class of all codec failures.
struct CodecError: virtual util::Exception
{
	virtual CodecErrorKind kind() const noexcept = 0;
};

#define NEST_CODEC_ERROR(X) \
	struct X: CodecError \
	{ \
		CodecErrorKind kind() const noexcept override { return CodecErrorKind::X; } \
	}

NEST_CODEC_ERROR(CapacityExceeded);
NEST_CODEC_ERROR(TruncatedBuffer);
NEST_CODEC_ERROR(OffsetOutOfRange);
NEST_CODEC_ERROR(MalformedLength);
NEST_CODEC_ERROR(NonCanonicalBuffer);

#undef NEST_CODEC_ERROR

/// Index of the word (within the encoded buffer or byte string) the failure was detected at.
using errinfo_wordIndex = boost::error_info<struct tag_wordIndex, size_t>;
/// Index of the inner array the failure relates to.
using errinfo_arrayIndex = boost::error_info<struct tag_arrayIndex, size_t>;

}
