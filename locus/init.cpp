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

#include "init.h"

#include "global.h"

#include <lunchbox/atomic.h>
#include <lunchbox/init.h>
#include <lunchbox/debug.h>

#include <signal.h>
#include <string.h>

namespace locus
{
namespace
{
static lunchbox::a_int32_t _initialized;
}

bool init( const int argc, char** argv )
{
    if( ++_initialized > 1 ) // not first
        return true;

    if( !lunchbox::init( argc, argv ))
        return false;

    for( int i = 1; i < argc; ++i )
    {
        if( strcmp( argv[i], "--locus-globals" ) != 0 )
            continue;

        if( i + 1 >= argc || !Global::fromString( argv[i+1] ))
        {
            LBERROR << "Invalid --locus-globals parameter" << std::endl;
            return false;
        }
        ++i;
    }

    // peers closing their end must not terminate the process
    signal( SIGPIPE, SIG_IGN );
    return true;
}

bool exit()
{
    if( --_initialized > 0 ) // not last
        return true;
    LBASSERT( int32_t( _initialized ) == 0 );

    return lunchbox::exit();
}

}
