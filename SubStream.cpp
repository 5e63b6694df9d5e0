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

#include <string.h>
#include <stdio.h>

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/mem.h>
#include <libavformat/avio.h>
}

#include "SubStream.h"
#include "VobSubError.h"
#include "utils/log.h"

#define MEMORY_IO_BUFFER_SIZE 4096

using namespace std;

SubStreamFile::SubStreamFile(const string &filename)
{
  CLogLog(LOGDEBUG, "SubStreamFile: avio_open %s", filename.c_str());

  if(avio_open(&m_ioContext, filename.c_str(), AVIO_FLAG_READ) < 0)
    throw IoError("Failed to open subpicture stream: " + filename);

  m_size = avio_size(m_ioContext);
  if(m_size < 0)
  {
    avio_closep(&m_ioContext);
    throw IoError("Subpicture stream is not seekable: " + filename);
  }
}

SubStreamFile::~SubStreamFile()
{
  avio_closep(&m_ioContext);
}

SubStreamMemory::SubStreamMemory(const vector<uint8_t> &data)
: m_data(data)
{
  unsigned char *buffer = (unsigned char*)av_malloc(MEMORY_IO_BUFFER_SIZE);
  if(!buffer)
    throw VobSubError("av_malloc failed");

  m_ioContext = avio_alloc_context(buffer, MEMORY_IO_BUFFER_SIZE, 0, this, mem_read, nullptr, mem_seek);
  if(!m_ioContext)
  {
    av_free(buffer);
    throw VobSubError("avio_alloc_context failed");
  }

  m_size = m_data.size();
}

SubStreamMemory::~SubStreamMemory()
{
  av_freep(&m_ioContext->buffer);
  avio_context_free(&m_ioContext);
}

int SubStreamMemory::mem_read(void *opaque, uint8_t *buf, int buf_size)
{
  SubStreamMemory *s = static_cast<SubStreamMemory *>(opaque);

  int64_t left = (int64_t)s->m_data.size() - s->m_pos;
  if(left <= 0)
    return AVERROR_EOF;

  int n = left < buf_size ? (int)left : buf_size;
  memcpy(buf, &s->m_data[s->m_pos], n);
  s->m_pos += n;

  return n;
}

int64_t SubStreamMemory::mem_seek(void *opaque, int64_t offset, int whence)
{
  SubStreamMemory *s = static_cast<SubStreamMemory *>(opaque);
  int64_t size = s->m_data.size();

  switch(whence & ~AVSEEK_FORCE)
  {
  case AVSEEK_SIZE:
    return size;
  case SEEK_SET:
    break;
  case SEEK_CUR:
    offset += s->m_pos;
    break;
  case SEEK_END:
    offset += size;
    break;
  default:
    return -1;
  }

  if(offset < 0 || offset > size)
    return -1;

  s->m_pos = offset;
  return offset;
}
