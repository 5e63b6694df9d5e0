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
#include <stdlib.h>
#include <unistd.h>
#include <sys/wait.h>
#include <string>

#include "TextRecognizer.h"
#include "ImageWriter.h"
#include "SubpictureDecoder.h"
#include "VobSubError.h"
#include "utils/log.h"

using namespace std;

CommandTextRecognizer::CommandTextRecognizer(const string &command, const string &language)
: m_command(command),
  m_language(language)
{}

string CommandTextRecognizer::ShellQuote(const string &arg)
{
  string out = "'";
  for(size_t i = 0; i < arg.length(); i++)
  {
    if(arg[i] == '\'')
      out += "'\\''";
    else
      out += arg[i];
  }
  return out + "'";
}

string CommandTextRecognizer::Recognize(const DecodedImage &image)
{
  const char *tmpdir = getenv("TMPDIR");
  string path = string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/vobsubocr-XXXXXX.png";

  int fd = mkstemps(&path[0], 4);
  if(fd < 0)
    throw IoError("Failed to create temporary image file");
  close(fd);

  string cmd = m_command + " " + ShellQuote(path) + " stdout";
  if(!m_language.empty())
    cmd += " -l " + ShellQuote(m_language);
  cmd += " 2>/dev/null";

  string text;
  int status = -1;
  try
  {
    ImageWriter::WritePng(image, path);

    CLogLog(LOGDEBUG, "CommandTextRecognizer: %s", cmd.c_str());
    FILE *pipe = popen(cmd.c_str(), "r");
    if(!pipe)
      throw VobSubError("Failed to run OCR command: " + m_command);

    char buf[512];
    size_t n;
    while((n = fread(buf, 1, sizeof(buf), pipe)) > 0)
      text.append(buf, n);

    status = pclose(pipe);
  }
  catch(const VobSubError &)
  {
    unlink(path.c_str());
    throw;
  }

  unlink(path.c_str());

  if(status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
    throw VobSubError("OCR command failed: " + m_command);

  return text;
}
