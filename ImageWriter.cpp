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
#include <stdint.h>
#include <string>
#include <vector>

#include <png.h>

#include "ImageWriter.h"
#include "SubpictureDecoder.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

namespace ImageWriter {

// Returns false when libpng bailed out. Rows are written as straight,
// non-premultiplied RGBA so fully transparent pixels keep their colour.
static bool encode_png(FILE *fp, const DecodedImage &image, const vector<png_bytep> &rows)
{
  png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
  if(!png)
    return false;

  png_infop info = png_create_info_struct(png);
  if(!info)
  {
    png_destroy_write_struct(&png, nullptr);
    return false;
  }

  if(setjmp(png_jmpbuf(png)))
  {
    png_destroy_write_struct(&png, &info);
    return false;
  }

  png_init_io(png, fp);
  png_set_IHDR(png, info, image.width, image.height, 8, PNG_COLOR_TYPE_RGBA,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
  png_write_info(png, info);
  png_write_image(png, const_cast<png_bytepp>(rows.data()));
  png_write_end(png, nullptr);

  png_destroy_write_struct(&png, &info);
  return true;
}

void WritePng(const DecodedImage &image, const string &path)
{
  if(image.width <= 0 || image.height <= 0 || image.rgba.size() != (size_t)image.width * image.height * 4)
    throw VobSubError("Can't write empty or inconsistent image: " + path);

  vector<png_bytep> rows(image.height);
  for(int y = 0; y < image.height; y++)
    rows[y] = const_cast<png_bytep>(&image.rgba[(size_t)y * image.width * 4]);

  FILE *fp = fopen(path.c_str(), "wb");
  if(!fp)
    throw IoError("Failed to open " + path + " for writing");

  bool ok = encode_png(fp, image, rows);
  if(fclose(fp) != 0)
    ok = false;

  if(!ok)
  {
    remove(path.c_str());
    throw IoError("Failed to write " + path);
  }

  CLogLog(LOGDEBUG, "ImageWriter: wrote %dx%d image to %s", image.width, image.height, path.c_str());
}

string ImagePath(const string &dir, const string &stem, int index)
{
  char name[16];
  snprintf(name, sizeof(name), "-%04d.png", index + 1);

  string path = dir;
  if(!path.empty() && path[path.length() - 1] != '/')
    path += '/';

  return path + stem + name;
}

}
