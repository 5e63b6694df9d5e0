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
#include <vector>

#include "FragmentAssembler.h"
#include "PacketReader.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

namespace FragmentAssembler {

static string hex_offset(int64_t ofs)
{
  char buf[32];
  snprintf(buf, sizeof(buf), "%08llx", (long long)ofs);
  return string(buf);
}

static void expect_start_code(PacketReader &reader, int64_t ofs, uint32_t code)
{
  reader.Seek(ofs);
  uint32_t found = reader.ReadU32();
  if(found != code)
    throw ParseError("Missing start code " + hex_offset(code) + " at ofs " + hex_offset(reader.BaseOffset() + ofs));
}

// Next sector boundary, in the reader's relative coordinates
static int64_t next_sector(const PacketReader &reader, int64_t ofs)
{
  int64_t abs = reader.BaseOffset() + ofs;
  return (abs / DVD_SECTOR_SIZE + 1) * DVD_SECTOR_SIZE - reader.BaseOffset();
}

SubpictureFragments Assemble(PacketReader &reader)
{
  SubpictureFragments f;

  int64_t ofs = reader.Tell();
  int64_t ctrl_ofs = -1;       // absolute position of the control header
  int ctrl_header_copied = 0;
  bool first_pack_found = false;

  while(ofs < reader.Size() && (ctrl_header_copied < f.ctrl_size || f.ctrl_size == -1))
  {
    int64_t start_ofs = ofs;

    // pack header
    expect_start_code(reader, ofs, PACK_START_CODE);
    ofs += PACK_HEADER_SIZE;
    reader.Seek(ofs);
    int stuffing = reader.ReadU8() & 7;
    ofs += 1 + stuffing;

    // PES header of private stream 1
    expect_start_code(reader, ofs, PRIVATE_STREAM_1_CODE);
    ofs += 4;
    int length = reader.ReadU16();
    int64_t next_ofs = ofs + 2 + length;
    ofs += 2;
    int pack_header_size = ofs - start_ofs;
    ofs += 1;
    reader.Seek(ofs);
    bool first_pack = (reader.ReadU8() & 0x80) == 0x80;
    ofs += 1;
    int pts_length = reader.ReadU8();
    ofs += 1 + pts_length; // PTS
    ofs += 1;              // sub stream id

    int header_size = ofs - start_ofs;
    f.packet_count++;

    if(first_pack && pts_length >= 5)
    {
      reader.Seek(ofs);
      int size = reader.ReadU16();
      ofs += 2;
      f.ctrl_ofs_rel = reader.ReadU16();
      f.rle_size = f.ctrl_ofs_rel - 2;
      f.ctrl_size = size - f.ctrl_ofs_rel - 2;
      if(f.ctrl_size < 0)
        throw ParseError("Invalid control buffer size at ofs " + hex_offset(reader.BaseOffset() + start_ofs));

      f.ctrl_header.clear();
      f.ctrl_header.reserve(f.ctrl_size);
      ctrl_header_copied = 0;
      ctrl_ofs = f.ctrl_ofs_rel + ofs;
      ofs += 2;
      header_size = ofs - start_ofs;
      first_pack_found = true;

      CLogLog(LOGDEBUG, "FragmentAssembler: unit size %d, rle %d, ctrl %d", size, f.rle_size, f.ctrl_size);
    }
    else if(first_pack_found)
    {
      // control header moves back by the header bytes of this packet
      ctrl_ofs += header_size;
    }
    else
    {
      CLogLog(LOGWARNING, "Invalid fragment skipped at ofs %s", hex_offset(reader.BaseOffset() + start_ofs).c_str());
      ofs = next_ofs;
      continue;
    }

    // part of the control header that lives in this packet
    int64_t packet_end = next_ofs < reader.Size() ? next_ofs : reader.Size();
    int64_t diff = packet_end - ctrl_ofs - ctrl_header_copied;
    if(diff < 0)
      diff = 0;

    int remaining = f.ctrl_size - ctrl_header_copied;
    int count = diff < remaining ? (int)diff : remaining;
    if(count > 0)
    {
      reader.Seek(ctrl_ofs + ctrl_header_copied);
      reader.Read(f.ctrl_header, count);
      ctrl_header_copied += count;
    }

    RleFragment fragment;
    fragment.offset = ofs;
    fragment.length = length - header_size - (int)diff + pack_header_size;
    if(fragment.length < 0)
    {
      CLogLog(LOGWARNING, "Negative RLE fragment length at ofs %s", hex_offset(reader.BaseOffset() + ofs).c_str());
      fragment.length = 0;
    }
    f.rle_fragments.push_back(fragment);
    f.rle_found += fragment.length;

    if(ctrl_header_copied != f.ctrl_size && (reader.BaseOffset() + next_ofs) % DVD_SECTOR_SIZE != 0)
    {
      ofs = next_sector(reader, next_ofs);
      CLogLog(LOGWARNING, "Offset to next fragment is invalid. Fixed to: %s", hex_offset(reader.BaseOffset() + ofs).c_str());
      f.rle_found += ofs - next_ofs;
    }
    else
    {
      ofs = next_ofs;
    }
  }

  if(!first_pack_found)
    throw ParseError("No subpicture header found at ofs " + hex_offset(reader.BaseOffset()));

  if(ctrl_header_copied != f.ctrl_size)
  {
    CLogLog(LOGWARNING, "Control buffer size inconsistent");
    // pad with end commands so a stray 0x00 isn't read as a forced caption
    f.ctrl_header.resize(f.ctrl_size, 0xFF);
  }

  if(f.rle_found != f.rle_size)
    CLogLog(LOGWARNING, "RLE buffer size inconsistent (found %d, expected %d)", f.rle_found, f.rle_size);

  return f;
}

vector<uint8_t> ReadRleBuffer(PacketReader &reader, const SubpictureFragments &fragments)
{
  vector<uint8_t> rle;
  rle.reserve(fragments.rle_found);

  for(size_t i = 0; i < fragments.rle_fragments.size(); i++)
  {
    const RleFragment &fragment = fragments.rle_fragments[i];

    int64_t available = reader.Size() - fragment.offset;
    int length = fragment.length;
    if(available < length)
    {
      CLogLog(LOGWARNING, "RLE fragment at ofs %s truncated by end of stream",
          hex_offset(reader.BaseOffset() + fragment.offset).c_str());
      length = available > 0 ? (int)available : 0;
    }

    if(length == 0)
      continue;

    reader.Seek(fragment.offset);
    reader.Read(rle, length);
  }

  return rle;
}

}
