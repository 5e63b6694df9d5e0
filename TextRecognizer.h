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

#include <string>

struct DecodedImage;

// Turns a decoded subpicture into text. Implementations are called from
// several decode workers at once.
class TextRecognizer
{
public:
  virtual ~TextRecognizer() {}
  virtual std::string Recognize(const DecodedImage &image) = 0;
};

// Runs "<command> <image.png> stdout [-l <language>]" and returns its output
class CommandTextRecognizer : public TextRecognizer
{
public:
  CommandTextRecognizer(const std::string &command, const std::string &language);

  std::string Recognize(const DecodedImage &image) override;

  // single quotes for /bin/sh
  static std::string ShellQuote(const std::string &arg);

private:
  std::string m_command;
  std::string m_language;
};
