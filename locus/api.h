/* Copyright (c) 2026, The Locus Authors
 *
 * This file is part of Locus
 *
 * This library is free software; you can redistribute it and/or modify it under
 * the terms of the GNU Lesser General Public License version 2.1 as published
 * by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library; if not, write to the Free Software Foundation, Inc.,
 * 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.
 */

#ifndef LOCUS_API_H
#define LOCUS_API_H

#if defined(_MSC_VER) || defined(__declspec)
#  define LOCUS_DLLEXPORT __declspec(dllexport)
#  define LOCUS_DLLIMPORT __declspec(dllimport)
#else
#  define LOCUS_DLLEXPORT __attribute__ ((visibility("default")))
#  define LOCUS_DLLIMPORT
#endif

#if defined(LOCUS_STATIC)
#  define LOCUS_API
#elif defined(LOCUS_SHARED)
#  define LOCUS_API LOCUS_DLLEXPORT
#else
#  define LOCUS_API LOCUS_DLLIMPORT
#endif

#endif // LOCUS_API_H
