#pragma once
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

#include <stdint.h>
#include <vector>

class SubStream;

// Big endian cursor over a SubStream. Every position is relative to the
// stream position at construction time. Reads past the end throw IoError.
class PacketReader
{
public:
  explicit PacketReader(SubStream &stream);

  int64_t Tell() const { return m_pos; }
  // bytes available after the base offset
  int64_t Size() const { return m_size; }
  int64_t BaseOffset() const { return m_base; }

  void Seek(int64_t pos);
  void Skip(int64_t count);

  uint8_t  ReadU8();
  uint16_t ReadU16();
  uint32_t ReadU32();
  void     Read(uint8_t *dst, int size);
  void     Read(std::vector<uint8_t> &dst, int size);

private:
  void require(int64_t count);

  SubStream &m_stream;
  int64_t    m_base;
  int64_t    m_size;
  int64_t    m_pos = 0;
};
