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

#include "iCommand.h"

#include "buffer.h"
#include "connection.h"
#include "log.h"
#include "oCommand.h"

#include <lunchbox/debug.h>

namespace locus
{
namespace detail
{
class ICommand
{
public:
    ICommand( ConnectionPtr connection_, ConstBufferPtr buffer_ )
        : connection( connection_ )
        , buffer( buffer_ )
        , size( 0 )
        , cmd( CMD_INVALID )
    {}

    ConnectionPtr connection; //!< The connection the command arrived on
    ConstBufferPtr buffer;
    uint64_t size;
    uint32_t cmd;
};
} // detail namespace

ICommand::ICommand( ConnectionPtr connection, ConstBufferPtr buffer )
    : DataIStream()
    , _impl( new detail::ICommand( connection, buffer ))
{
    if( !buffer || buffer->getSize() < OCommand::getSize( ))
        return;

    _setInput( buffer->getData(), buffer->getSize( ));
    *this >> _impl->size >> _impl->cmd;
}

ICommand::~ICommand()
{
    delete _impl;
}

uint32_t ICommand::getCommand() const
{
    return _impl->cmd;
}

uint64_t ICommand::getSize() const
{
    return _impl->size;
}

ConnectionPtr ICommand::getConnection() const
{
    return _impl->connection;
}

bool ICommand::isValid() const
{
    return _impl->buffer && _impl->cmd != CMD_INVALID &&
           _impl->size == _impl->buffer->getSize();
}

BufferPtr ICommand::readBuffer( ConnectionPtr connection )
{
    uint64_t size = 0;
    if( !connection || !connection->recvSync( &size, sizeof( size )))
        return 0;

    if( size < OCommand::getSize() || size > COMMAND_MAXSIZE )
    {
        LBWARN << "Invalid command size " << size << " received on "
               << *connection << std::endl;
        return 0;
    }

    BufferPtr buffer = new Buffer;
    buffer->resize( size );
    *reinterpret_cast< uint64_t* >( buffer->getData( )) = size;
    if( !connection->recvSync( buffer->getData() + sizeof( size ),
                               size - sizeof( size )))
    {
        return 0;
    }
    return buffer;
}

std::ostream& operator << ( std::ostream& os, const ICommand& command )
{
    if( command.isValid( ))
        os << lunchbox::disableFlush << "command< " << command.getCommand()
           << " size " << command.getSize() << " >"
           << lunchbox::enableFlush;
    else
        os << "command< empty >";
    return os;
}
}
