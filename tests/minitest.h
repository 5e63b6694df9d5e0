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

#include <iostream>

// ------------------ minimal assert ------------------------------------------
#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

// Passes if the statement throws the given exception type
#define T_THROWS(stmt, type) do{ bool thrown_ = false; \
    try { stmt; } catch(const type &) { thrown_ = true; } \
    if(!thrown_){ std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #stmt " did not throw " #type "\n"; return false; } }while(0)

#define T_RUN(fn) do{ bool ok_ = fn(); std::cout << (ok_ ? "[OK]   " : "[FAIL] ") << #fn "\n"; if(!ok_) failures++; }while(0)
