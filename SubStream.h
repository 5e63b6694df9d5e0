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

extern "C" {
#include <libavformat/avio.h>
}

#include <stdint.h>
#include <string>
#include <vector>

#include "utils/NoMoveCopy.h"

// Random access, read-only view of a .sub stream. One instance per thread:
// the underlying AVIOContext keeps a single file position.
class SubStream : public NoMoveCopy
{
public:
  virtual ~SubStream() {}

  AVIOContext *Context() { return m_ioContext; }
  int64_t Size() const { return m_size; }

protected:
  AVIOContext *m_ioContext = nullptr;
  int64_t      m_size      = 0;
};

class SubStreamFile : public SubStream
{
public:
  explicit SubStreamFile(const std::string &filename);
  ~SubStreamFile() override;
};

// Serves a byte buffer through avio callbacks
class SubStreamMemory : public SubStream
{
public:
  explicit SubStreamMemory(const std::vector<uint8_t> &data);
  ~SubStreamMemory() override;

private:
  static int mem_read(void *opaque, uint8_t *buf, int buf_size);
  static int64_t mem_seek(void *opaque, int64_t offset, int whence);

  std::vector<uint8_t> m_data;
  int64_t              m_pos = 0;
};
