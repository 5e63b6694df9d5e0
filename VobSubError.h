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

#include <stdexcept>
#include <string>

// Fatal for the item being decoded. Corruption with a known fallback is
// logged instead of thrown.
class VobSubError : public std::runtime_error
{
public:
  explicit VobSubError(const std::string &what) : std::runtime_error(what) {}
};

// Malformed .idx token, missing MPEG-PS marker, impossible buffer layout
class ParseError : public VobSubError
{
public:
  explicit ParseError(const std::string &what) : VobSubError(what) {}
};

// Short read, seek past the end, file that can't be opened
class IoError : public VobSubError
{
public:
  explicit IoError(const std::string &what) : VobSubError(what) {}
};
