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

#include "oCommand.h"

#include "connection.h"
#include "log.h"

#include <lunchbox/debug.h>

namespace locus
{
OCommand::OCommand( const uint32_t cmd )
    : DataOStream()
    , _command( cmd )
{
    _init();
}

OCommand::~OCommand()
{}

void OCommand::_init()
{
    *this << uint64_t( 0 )/* size */ << _command;
}

void OCommand::reset()
{
    DataOStream::reset();
    _init();
}

size_t OCommand::getSize()
{
    return sizeof( uint64_t ) + sizeof( uint32_t );
}

bool OCommand::send( ConnectionPtr connection )
{
    if( !connection || !connection->isConnected( ))
    {
        LBLOG( LOG_RPC ) << "Can't send command " << _command
                         << ", connection is closed" << std::endl;
        return false;
    }

    const uint64_t size = getBuffer().getSize();
    LBASSERT( size >= getSize( ));
    _overwrite( 0, &size, sizeof( size ));
    return connection->send( getBuffer().getData(), size );
}

}
