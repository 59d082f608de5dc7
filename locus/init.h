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

#ifndef LOCUS_INIT_H
#define LOCUS_INIT_H

#include <locus/api.h>

namespace locus
{
/**
 * Initialize the Locus library.
 *
 * Parses the '--locus-globals &lt;string&gt;' command line option, which
 * initializes the Global attributes using Global::fromString(). exit() should
 * be called independent of the return value of this function.
 *
 * @param argc the command line argument count.
 * @param argv the command line argument values.
 * @return true if the library was successfully initialised, false otherwise
 * @version 1.0
 */
LOCUS_API bool init( const int argc, char** argv );

/**
 * De-initialize the Locus library.
 *
 * @return true if the library was successfully de-initialised,
 *         false otherwise.
 * @version 1.0
 */
LOCUS_API bool exit();
}

#endif // LOCUS_INIT_H
