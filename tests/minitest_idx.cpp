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

#include <string>
#include <vector>

#include "SubtitleIndex.h"
#include "VobSubError.h"
#include "utils/misc.h"
#include "minitest.h"
#include "vobsub_fixtures.h"

using namespace std;

// ------------------ TEST A : full index -------------------------------------
static bool test_parse_full_index()
{
  vector<string> ts;
  ts.push_back("00:00:01:000, filepos: 000000000");
  ts.push_back("00:00:05:500, filepos: 000000800");
  ts.push_back("01:02:03:456, filepos: 00001A000");

  SubtitleIndex idx = IdxParser::Parse(fixture_idx_text(ts));

  T_ASSERT( idx.width == 720 && idx.height == 480 );
  T_ASSERT( idx.origin_x == 0 && idx.origin_y == 0 );
  T_ASSERT( idx.scale_x == 1.0 && idx.scale_y == 1.0 );
  T_ASSERT( idx.alpha == 1.0 );
  T_ASSERT( idx.smooth == 0 );
  T_ASSERT( idx.fade_in == 50 && idx.fade_out == 50 );
  T_ASSERT( idx.time_offset == 0 );
  T_ASSERT( idx.forced_subs == 0 );
  T_ASSERT( idx.lang_idx == 0 );
  T_ASSERT( idx.language == "en" && idx.stream_index == 0 );

  T_ASSERT( idx.HasValidPalette() );
  T_ASSERT( idx.palette[0].red == 0 && idx.palette[0].green == 0 && idx.palette[0].blue == 0 );
  T_ASSERT( idx.palette[2].red == 255 && idx.palette[2].green == 0 && idx.palette[2].blue == 0 );
  T_ASSERT( idx.palette[3].ToString() == "0000FF" );
  T_ASSERT( idx.palette[15].red == 0x80 );

  T_ASSERT( idx.items.size() == 3 );
  T_ASSERT( idx.items[0].timestamp == 1000 && idx.items[0].file_pos == 0 );
  T_ASSERT( idx.items[1].timestamp == 5500 && idx.items[1].file_pos == 0x800 );
  T_ASSERT( idx.items[2].timestamp == 3723456LL && idx.items[2].file_pos == 0x1A000 );
  return true;
}

// Fields that never appear stay unset
static bool test_parse_defaults()
{
  SubtitleIndex idx = IdxParser::Parse("size: 640x480\n");
  T_ASSERT( idx.width == 640 );
  T_ASSERT( idx.origin_x == -1 && idx.time_offset == -1 );
  T_ASSERT( idx.palette.empty() && !idx.HasValidPalette() );
  T_ASSERT( idx.items.empty() );
  return true;
}

static bool test_short_palette_is_kept()
{
  SubtitleIndex idx = IdxParser::Parse("palette: 000000, ffffff\n");
  T_ASSERT( idx.palette.size() == 2 );
  T_ASSERT( !idx.HasValidPalette() );
  return true;
}

// ------------------ TEST B : malformed tokens -------------------------------
static bool test_bad_tokens()
{
  T_THROWS( IdxParser::Parse("smooth: MAYBE\n"), ParseError );
  T_THROWS( IdxParser::Parse("size: 720\n"), ParseError );
  T_THROWS( IdxParser::Parse("size: 72ax480\n"), ParseError );
  T_THROWS( IdxParser::Parse("alpha: 100\n"), ParseError );
  T_THROWS( IdxParser::Parse("palette: 000000, zz0000\n"), ParseError );
  T_THROWS( IdxParser::Parse("timestamp: 0:00:01:000, filepos: 0\n"), ParseError );
  return true;
}

static bool test_token_helpers()
{
  T_ASSERT( IdxParser::ParseBool(" ON ") == true );
  T_ASSERT( IdxParser::ParseBool("OFF") == false );
  T_THROWS( IdxParser::ParseBool("on"), ParseError );
  T_ASSERT( IdxParser::ParseInt("-12") == -12 );
  T_THROWS( IdxParser::ParseInt(""), ParseError );
  T_ASSERT( IdxParser::ParsePercent("50%") == 0.5 );
  Color c = IdxParser::ParseColor("1A2b3C");
  T_ASSERT( c.red == 0x1A && c.green == 0x2B && c.blue == 0x3C );
  return true;
}

static bool test_load_missing_file()
{
  T_THROWS( IdxParser::Load("/nonexistent/dir/file.idx"), IoError );
  return true;
}

static bool test_load_file()
{
  vector<string> ts;
  ts.push_back("00:00:02:000, filepos: 000000000");
  string path = fixture_temp_file(".idx", fixture_idx_text(ts));
  T_ASSERT( !path.empty() );

  SubtitleIndex idx = IdxParser::Load(path);
  remove(path.c_str());

  T_ASSERT( idx.items.size() == 1 && idx.items[0].timestamp == 2000 );
  return true;
}

// ------------------ TEST C : path helpers -----------------------------------
static bool test_path_helpers()
{
  T_ASSERT( GetExtension("dir/movie.idx") == ".idx" );
  T_ASSERT( GetExtension("dir.d/movie") == "" );
  T_ASSERT( ReplaceExtension("dir/movie.idx", ".sub") == "dir/movie.sub" );
  T_ASSERT( GetStem("/a/b/movie.sub") == "movie" );
  T_ASSERT( Trim("  x y \r\n") == "x y" );
  T_ASSERT( EscapeLineBreaks("a\nb\n") == "a\\Nb\\N" );
  return true;
}

int main()
{
  int failures = 0;
  T_RUN(test_parse_full_index);
  T_RUN(test_parse_defaults);
  T_RUN(test_short_palette_is_kept);
  T_RUN(test_bad_tokens);
  T_RUN(test_token_helpers);
  T_RUN(test_load_missing_file);
  T_RUN(test_load_file);
  T_RUN(test_path_helpers);
  return failures == 0 ? 0 : 1;
}
