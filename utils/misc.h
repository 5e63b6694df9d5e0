#pragma once
/*
 *
 *      Copyright (C) 2020 Michael J. Walsh
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

bool Exists(const std::string& path);
bool IsDirectory(const std::string& path);
bool MakeDirectories(const std::string& path);

// "dir/name.idx" -> ".idx", "" when there is no extension
std::string GetExtension(const std::string &path);
std::string ReplaceExtension(const std::string &path, const char *ext);
// "dir/name.idx" -> "name"
std::string GetStem(const std::string &path);

std::string Trim(const std::string &in);
std::string TrimRight(const std::string &in);

// Encodes line breaks as the two character sequence \N
std::string EscapeLineBreaks(const std::string &in);
