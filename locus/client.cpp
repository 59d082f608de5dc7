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

#include "client.h"

#include "buffer.h"
#include "connection.h"
#include "exception.h"
#include "iCommand.h"
#include "log.h"
#include "nodeAddress.h"
#include "oCommand.h"

#include <lunchbox/lock.h>
#include <lunchbox/scopedMutex.h>

namespace locus
{
namespace detail
{
class Client
{
public:
    explicit Client( const NodeAddress& address_ ) : address( address_ ) {}

    void closeConnection()
    {
        if( !connection )
            return;
        connection->close();
        connection = 0;
    }

    const NodeAddress address;
    ConnectionPtr connection;
    lunchbox::Lock lock; //!< serializes requests on the connection
};
}

Client::Client( const NodeAddress& address )
    : _impl( new detail::Client( address ))
{}

Client::~Client()
{
    disconnect();
    delete _impl;
}

const NodeAddress& Client::getAddress() const
{
    return _impl->address;
}

void Client::disconnect()
{
    lunchbox::ScopedWrite mutex( _impl->lock );
    _impl->closeConnection();
}

BufferPtr Client::call( OCommand& request )
{
    lunchbox::ScopedWrite mutex( _impl->lock );
    if( _impl->connection && !_impl->connection->isConnected( ))
        _impl->closeConnection();

    if( !_impl->connection )
    {
        ConnectionPtr connection = Connection::create( _impl->address );
        if( !connection->connect( ))
            throw Exception( Exception::UNREACHABLE,
                             _impl->address.toString( ));
        _impl->connection = connection;
    }

    if( !request.send( _impl->connection ))
    {
        _impl->closeConnection();
        throw Exception( Exception::CONNECTION_LOST,
                         "Sending request to " + _impl->address.toString() +
                         " failed" );
    }

    BufferPtr reply = ICommand::readBuffer( _impl->connection );
    if( !reply )
    {
        _impl->closeConnection();
        throw Exception( Exception::CONNECTION_LOST,
                         "No reply from " + _impl->address.toString( ));
    }
    return reply;
}

void Client::checkReply( ICommand& reply )
{
    if( !reply.isValid() || reply.getCommand() != CMD_REPLY )
        throw Exception( Exception::PROTOCOL, "Unexpected reply" );

    uint32_t status = REPLY_OK;
    uint32_t type = Exception::PROTOCOL;
    std::string message;
    try
    {
        status = reply.read< uint32_t >();
        if( status == REPLY_ERROR )
        {
            type = reply.read< uint32_t >();
            message = reply.read< std::string >();
        }
    }
    catch( const Exception& e )
    {
        // a local decoding error must not look like a remote rejection
        throw Exception( Exception::PROTOCOL,
                         "Truncated reply: " + e.getMessage( ));
    }

    switch( status )
    {
      case REPLY_OK:
          return;

      case REPLY_ERROR:
          LBLOG( LOG_RPC ) << "Remote error " << type << ": " << message
                           << std::endl;
          throw Exception( type, message );

      default:
          throw Exception( Exception::PROTOCOL, "Unknown reply status" );
    }
}

}
