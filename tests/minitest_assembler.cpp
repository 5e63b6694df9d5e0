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
#include <string>
#include <vector>

extern "C" {
#include <libavformat/avio.h>
}

#include "SubStream.h"
#include "PacketReader.h"
#include "FragmentAssembler.h"
#include "SubpictureDecoder.h"
#include "SubtitleIndex.h"
#include "VobSubError.h"
#include "minitest.h"
#include "vobsub_fixtures.h"

using namespace std;

static SubtitleIndex fixture_index()
{
  return IdxParser::Parse(fixture_idx_text(vector<string>()));
}

static bool all_pixels(const DecodedImage &image, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
  for(size_t i = 0; i + 3 < image.rgba.size(); i += 4)
  {
    if(image.rgba[i] != r || image.rgba[i + 1] != g || image.rgba[i + 2] != b || image.rgba[i + 3] != a)
      return false;
  }
  return true;
}

// ------------------ TEST A : packet reader ----------------------------------
static bool test_reader_big_endian()
{
  static const uint8_t data[] = { 0x00, 0x00, 0x01, 0xBA, 0x12, 0x34, 0x56 };
  SubStreamMemory stream(vector<uint8_t>(data, data + sizeof(data)));
  PacketReader reader(stream);

  T_ASSERT( reader.Size() == 7 );
  T_ASSERT( reader.ReadU32() == PACK_START_CODE );
  T_ASSERT( reader.ReadU16() == 0x1234 );
  T_ASSERT( reader.Tell() == 6 );
  T_ASSERT( reader.ReadU8() == 0x56 );
  T_THROWS( reader.ReadU8(), IoError );
  T_THROWS( reader.Seek(8), IoError );
  return true;
}

static bool test_reader_is_relative_to_start()
{
  static const uint8_t data[] = { 0xAA, 0xAA, 0xAA, 0xAA, 0x01, 0x02, 0x03 };
  SubStreamMemory stream(vector<uint8_t>(data, data + sizeof(data)));
  T_ASSERT( avio_seek(stream.Context(), 4, SEEK_SET) == 4 );

  PacketReader reader(stream);
  T_ASSERT( reader.BaseOffset() == 4 );
  T_ASSERT( reader.Size() == 3 );
  T_ASSERT( reader.Tell() == 0 );
  T_ASSERT( reader.ReadU8() == 0x01 );

  reader.Seek(2);
  vector<uint8_t> out(1, 0xEE);
  reader.Read(out, 1);
  T_ASSERT( out.size() == 2 && out[1] == 0x03 );
  return true;
}

// ------------------ TEST B : fragments --------------------------------------
static bool test_single_packet_unit()
{
  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(fixture_unit(2, 100), true));
  SubStreamMemory stream(sub);
  PacketReader reader(stream);

  SubpictureFragments f = FragmentAssembler::Assemble(reader);
  T_ASSERT( f.packet_count == 1 );
  T_ASSERT( f.ctrl_ofs_rel == 6 );
  T_ASSERT( f.ctrl_size == 28 && f.ctrl_header.size() == 28 );
  T_ASSERT( f.ctrl_header[0] == 0x00 && f.ctrl_header[1] == 0x1E && f.ctrl_header[27] == 0xFF );
  T_ASSERT( f.rle_size == 4 && f.rle_found == 4 );
  T_ASSERT( f.rle_fragments.size() == 1 );
  T_ASSERT( f.rle_fragments[0].offset == 33 && f.rle_fragments[0].length == 4 );

  vector<uint8_t> rle = FragmentAssembler::ReadRleBuffer(reader, f);
  T_ASSERT( rle.size() == 4 );
  T_ASSERT( rle[0] == 0x12 && rle[1] == 0x12 );
  return true;
}

// First packet ends off a sector boundary before the control header is complete
static bool test_misaligned_fragment_is_tolerated()
{
  vector<uint8_t> unit = fixture_unit(2, 100);
  vector<uint8_t> head(unit.begin(), unit.begin() + 10);
  vector<uint8_t> tail(unit.begin() + 10, unit.end());

  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(head, true));
  fixture_append_sector(sub, fixture_packet(tail, false));

  SubStreamMemory stream(sub);
  PacketReader reader(stream);
  SubpictureFragments f = FragmentAssembler::Assemble(reader);

  T_ASSERT( f.packet_count == 2 );
  T_ASSERT( f.ctrl_header.size() == 28 );
  T_ASSERT( f.ctrl_header[0] == 0x00 && f.ctrl_header[1] == 0x1E );
  T_ASSERT( f.rle_found != f.rle_size );
  return true;
}

static bool test_missing_start_code()
{
  SubStreamMemory stream(vector<uint8_t>(0x800, 0));
  PacketReader reader(stream);
  T_THROWS( FragmentAssembler::Assemble(reader), ParseError );
  return true;
}

static bool test_no_first_packet()
{
  vector<uint8_t> payload(26, 0xFF);
  SubStreamMemory stream(fixture_packet(payload, false));
  PacketReader reader(stream);
  T_THROWS( FragmentAssembler::Assemble(reader), ParseError );
  return true;
}

// ------------------ TEST C : whole subpicture -------------------------------
static bool test_decode_subpicture()
{
  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(fixture_unit(2, 100), true));
  SubStreamMemory stream(sub);

  DecodedImage image = SubpictureDecoder::Decode(fixture_index(), stream, false);
  T_ASSERT( image.width == 4 && image.height == 2 );
  T_ASSERT( image.area.x == 0 && image.area.y == 0 );
  T_ASSERT( image.rgba.size() == 4 * 2 * 4 );
  T_ASSERT( all_pixels(image, 255, 0, 0, 255) );
  T_ASSERT( image.duration == 1000 );
  T_ASSERT( !image.forced );
  return true;
}

static bool test_decode_at_second_sector()
{
  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(fixture_unit(2, 100), true));
  fixture_append_sector(sub, fixture_packet(fixture_unit(1, 250), true));
  SubStreamMemory stream(sub);

  DecodedImage image = SubpictureDecoder::DecodeAt(fixture_index(), stream, 0x800, false);
  T_ASSERT( all_pixels(image, 255, 255, 255, 255) );
  T_ASSERT( image.duration == 2500 );

  // inverted: slot 1 shows the colour of slot 3
  image = SubpictureDecoder::DecodeAt(fixture_index(), stream, 0x800, true);
  T_ASSERT( all_pixels(image, 0, 0, 255, 255) );

  T_THROWS( SubpictureDecoder::DecodeAt(fixture_index(), stream, 0x1000, false), IoError );
  return true;
}

/* 16x8 unit: even rows are 8 x colour 1 then 8 x colour 2, odd rows are
 * 8 x colour 2 then a line feed in colour 1. Stops after stop_delay ticks.
 */
static vector<uint8_t> unit_16x8(int stop_delay)
{
  uint8_t unit[] = {
    0x00, 0x36,                          // unit size 54
    0x00, 0x18,                          // control sequence at 24
    0x21, 0x22, 0x21, 0x22, 0x21, 0x22, 0x21, 0x22,
    0x22, 0x00, 0x01, 0x22, 0x00, 0x01, 0x22, 0x00, 0x01, 0x22, 0x00, 0x01,
    0x00, 0x00,                          // first sequence delay
    0x00, 0x30,                          // next sequence at 48
    0x01,
    0x03, 0x32, 0x10,
    0x04, 0xFF, 0xF0,
    0x05, 0x00, 0x00, 0x0F, 0x00, 0x00, 0x07,  // area 0-15 x 0-7
    0x06, 0x00, 0x04, 0x00, 0x0C,        // fields at 4 and 12
    0xFF,
    (uint8_t)(stop_delay >> 8), (uint8_t)(stop_delay & 0xFF),
    0x00, 0x30,
    0x02, 0xFF,
  };
  return vector<uint8_t>(unit, unit + sizeof(unit));
}

// 4x2 unit in colour 2 whose palette and duration come from a colour update
static vector<uint8_t> unit_with_color_update()
{
  static const uint8_t unit[] = {
    0x00, 0x2D,                          // unit size 45
    0x00, 0x06,
    0x12, 0x12,
    0x00, 0x00,
    0x00, 0x29,                          // end sequence at 41
    0x03, 0x01, 0x23,                  // colour 2 starts out white
    0x04, 0xFF, 0xF0,
    0x05, 0x00, 0x00, 0x03, 0x00, 0x00, 0x01,
    0x06, 0x00, 0x04, 0x00, 0x05,
    0x07, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
          0x32, 0x10, 0xFF, 0xFF,            // red, more opaque
    0x00, 0x02, 0x00, 0x2D,              // delay 2, nothing follows
  };
  return vector<uint8_t>(unit, unit + sizeof(unit));
}

static bool test_two_subpicture_episode_raster()
{
  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(unit_16x8(100), true));
  fixture_append_sector(sub, fixture_packet(unit_with_color_update(), true));
  SubStreamMemory stream(sub);
  SubtitleIndex idx = fixture_index();

  DecodedImage first = SubpictureDecoder::DecodeAt(idx, stream, 0, false);
  T_ASSERT( first.width == 16 && first.height == 8 );
  T_ASSERT( first.duration == 1000 );
  for(int y = 0; y < 8; y++)
  {
    for(int x = 0; x < 16; x++)
    {
      const uint8_t *p = &first.rgba[(y * 16 + x) * 4];
      bool white = (y & 1) ? x >= 8 : x < 8;
      T_ASSERT( p[3] == 255 );
      T_ASSERT( white ? (p[0] == 255 && p[1] == 255 && p[2] == 255)
                      : (p[0] == 255 && p[1] == 0 && p[2] == 0) );
    }
  }

  DecodedImage second = SubpictureDecoder::DecodeAt(idx, stream, 0x800, false);
  T_ASSERT( second.width == 4 && second.height == 2 );
  T_ASSERT( second.duration == 2 * 1024 );
  T_ASSERT( all_pixels(second, 255, 0, 0, 255) );
  return true;
}

// Stream cut inside the control header of its only packet
static bool test_truncated_rip_still_decodes()
{
  SubStreamMemory stream(fixture_packet(fixture_unit(2, 100), true, 59));

  DecodedImage image = SubpictureDecoder::Decode(fixture_index(), stream, false);
  T_ASSERT( image.width == 4 && image.height == 2 );
  T_ASSERT( all_pixels(image, 255, 0, 0, 255) );
  return true;
}

static bool test_missing_area()
{
  vector<uint8_t> unit = fixture_unit(2, 100);
  unit[17] = 0x09;  // display area command replaced by an unknown one

  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(unit, true));
  SubStreamMemory stream(sub);
  T_THROWS( SubpictureDecoder::Decode(fixture_index(), stream, false), ParseError );
  return true;
}

static bool test_invalid_index_palette()
{
  vector<uint8_t> sub;
  fixture_append_sector(sub, fixture_packet(fixture_unit(2, 100), true));
  SubStreamMemory stream(sub);

  SubtitleIndex idx = fixture_index();
  idx.palette.resize(4);
  T_THROWS( SubpictureDecoder::Decode(idx, stream, false), ParseError );
  return true;
}

int main()
{
  int failures = 0;
  T_RUN(test_reader_big_endian);
  T_RUN(test_reader_is_relative_to_start);
  T_RUN(test_single_packet_unit);
  T_RUN(test_misaligned_fragment_is_tolerated);
  T_RUN(test_missing_start_code);
  T_RUN(test_no_first_packet);
  T_RUN(test_decode_subpicture);
  T_RUN(test_decode_at_second_sector);
  T_RUN(test_two_subpicture_episode_raster);
  T_RUN(test_truncated_rip_still_decodes);
  T_RUN(test_missing_area);
  T_RUN(test_invalid_index_palette);
  return failures == 0 ? 0 : 1;
}
