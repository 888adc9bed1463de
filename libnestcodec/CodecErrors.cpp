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

#include <libnestcodec/CodecErrors.h>

#include <libnestutil/Assertions.h>

using namespace evmnest;
using namespace evmnest::codec;

std::string_view evmnest::codec::errorKindName(CodecErrorKind _kind)
{
	switch (_kind)
	{
	case CodecErrorKind::CapacityExceeded: return "CapacityExceeded";
	case CodecErrorKind::TruncatedBuffer: return "TruncatedBuffer";
	case CodecErrorKind::OffsetOutOfRange: return "OffsetOutOfRange";
	case CodecErrorKind::MalformedLength: return "MalformedLength";
	case CodecErrorKind::NonCanonicalBuffer: return "NonCanonicalBuffer";
	}
	nestAssert(false, "Unknown codec error kind.");
	return {};
}

std::ostream& evmnest::codec::operator<<(std::ostream& _out, CodecErrorKind _kind)
{
	return _out << errorKindName(_kind);
}
