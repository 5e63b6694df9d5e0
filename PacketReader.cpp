/*
 *      Copyright (C) 2026 The vobsubocr developers
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 675 Mass Ave, Cambridge, MA 02139, USA.
 */

#include <stdio.h>
#include <string>

extern "C" {
#include <libavformat/avio.h>
}

#include "PacketReader.h"
#include "SubStream.h"
#include "VobSubError.h"

using namespace std;

static string format_offset(int64_t ofs)
{
  char buf[32];
  snprintf(buf, sizeof(buf), "%08llx", (long long)ofs);
  return string(buf);
}

PacketReader::PacketReader(SubStream &stream)
: m_stream(stream)
{
  m_base = avio_tell(m_stream.Context());
  if(m_base < 0 || m_base > m_stream.Size())
    throw IoError("Invalid stream position: " + format_offset(m_base));

  m_size = m_stream.Size() - m_base;
}

void PacketReader::Seek(int64_t pos)
{
  if(pos < 0 || pos > m_size)
    throw IoError("Seek beyond end of stream: " + format_offset(m_base + pos));

  if(avio_seek(m_stream.Context(), m_base + pos, SEEK_SET) < 0)
    throw IoError("avio_seek failed at " + format_offset(m_base + pos));

  m_pos = pos;
}

void PacketReader::Skip(int64_t count)
{
  Seek(m_pos + count);
}

void PacketReader::require(int64_t count)
{
  if(m_pos + count > m_size)
    throw IoError("Unexpected end of stream at " + format_offset(m_base + m_pos));
}

uint8_t PacketReader::ReadU8()
{
  require(1);
  uint8_t v = avio_r8(m_stream.Context());
  m_pos += 1;
  return v;
}

uint16_t PacketReader::ReadU16()
{
  require(2);
  uint16_t v = avio_rb16(m_stream.Context());
  m_pos += 2;
  return v;
}

uint32_t PacketReader::ReadU32()
{
  require(4);
  uint32_t v = avio_rb32(m_stream.Context());
  m_pos += 4;
  return v;
}

void PacketReader::Read(uint8_t *dst, int size)
{
  if(size <= 0)
    return;

  require(size);
  int n = avio_read(m_stream.Context(), dst, size);
  if(n != size)
    throw IoError("Short read at " + format_offset(m_base + m_pos));

  m_pos += size;
}

void PacketReader::Read(vector<uint8_t> &dst, int size)
{
  if(size <= 0)
    return;

  size_t start = dst.size();
  dst.resize(start + size);
  Read(&dst[start], size);
}
